#pragma once

#include <string>
#include <core/types.hpp>
#include <core/log.hpp>
#include <managers/lock_manager.hpp>
#include <managers/process_launcher.hpp>

// Starts at most one server per project.
//
// Two locks live under <project>/.pyre:
//   client.lock         serializes start attempts (held for the whole attempt)
//   server/server.lock  held by a running server for its lifetime
// Under the start lock the server lock is probed non-blocking. A busy probe
// means a server is up; a successful probe is released at once and a new
// server is launched. No other attempt can probe in between, so the probe
// cannot race with another launch.
class StartCoordinator {
public:
    StartCoordinator(LockManager& locks, ProcessLauncher& launcher, LogSink log);

    // One coordination attempt. Err for an unusable lock file or a failed
    // launch; contention and an existing server are ordinary outcomes.
    Result<CoordinationOutcome> run(const StartArguments& args, const ServerConfig& config);

private:
    enum class StartLockState {
        Probing,   // non-blocking attempt, nobody told yet
        Waiting,   // contention seen, blocking until the holder finishes
    };

    LockManager& locks_;
    ProcessLauncher& launcher_;
    LogSink log_;
};
