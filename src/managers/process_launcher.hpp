#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Runs one command of the server binary and reports whether it succeeded.
class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    virtual Result<void> launch(const std::string& command,
                                const std::vector<std::string>& flags) = 0;
};

// Spawns `<binary> <command> <flags...>` and waits for it. The server
// binary daemonizes itself, so this returns once the server is up or has
// refused to start.
class BinaryLauncher : public ProcessLauncher {
public:
    // stderr_log: file the child's stderr is appended to ("" = inherit)
    BinaryLauncher(const std::string& binary, const std::string& stderr_log);

    Result<void> launch(const std::string& command,
                        const std::vector<std::string>& flags) override;

private:
    std::string binary_;
    std::string stderr_log_;
};
