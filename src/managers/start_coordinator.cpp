#include "start_coordinator.hpp"
#include <managers/start_request.hpp>
#include <core/directory_structure.hpp>
#include <fmt/format.h>

StartCoordinator::StartCoordinator(LockManager& locks, ProcessLauncher& launcher, LogSink log)
    : locks_(locks), launcher_(launcher), log_(std::move(log)) {}

Result<CoordinationOutcome> StartCoordinator::run(const StartArguments& args,
                                                  const ServerConfig& config) {
    fs::path project(args.project_dir);
    const std::string start_lock_path = get_start_lock_path(project).string();
    const std::string server_lock_path = get_server_lock_path(project).string();

    // ── Start lock ─────────────────────────────────────────────
    StartLockState state = StartLockState::Probing;
    FileLock start_lock;
    for (;;) {
        LockMode mode = state == StartLockState::Probing ? LockMode::NonBlocking
                                                         : LockMode::Blocking;
        start_lock = locks_.acquire(start_lock_path, mode);
        if (start_lock.held()) break;

        switch (start_lock.error()) {
            case LockError::Busy:
                if (state == StartLockState::Probing) {
                    log_.info("Waiting on the pyre client lock.");
                    state = StartLockState::Waiting;
                }
                break;
            case LockError::Timeout:
                log_.warn(fmt::format("Timed out waiting on the pyre client lock for `{}`.",
                                      args.project_dir));
                return Result<CoordinationOutcome>::Ok(CoordinationOutcome::LockContention);
            case LockError::Unavailable:
            case LockError::None:
                return Result<CoordinationOutcome>::Err(
                    "Unable to acquire the client lock: " + start_lock.reason());
        }
    }

    // ── Liveness probe ─────────────────────────────────────────
    // Only a running server keeps this lock; ours is dropped at scope exit.
    {
        FileLock server_lock = locks_.acquire(server_lock_path, LockMode::NonBlocking);
        if (!server_lock.held()) {
            if (server_lock.error() == LockError::Busy) {
                log_.warn(fmt::format("Server at `{}` exists, skipping.", args.project_dir));
                return Result<CoordinationOutcome>::Ok(CoordinationOutcome::AlreadyRunning);
            }
            return Result<CoordinationOutcome>::Err(
                "Unable to probe the server lock: " + server_lock.reason());
        }
    }

    // ── Launch, still under the start lock ─────────────────────
    StartRequest request = build_start_request(args, config);
    auto launched = launcher_.launch(request.command, request.flags);
    if (launched.is_err()) {
        return Result<CoordinationOutcome>::Err(launched.error);
    }
    return Result<CoordinationOutcome>::Ok(CoordinationOutcome::Started);
}
