#include "process_launcher.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

BinaryLauncher::BinaryLauncher(const std::string& binary, const std::string& stderr_log)
    : binary_(binary), stderr_log_(stderr_log) {}

Result<void> BinaryLauncher::launch(const std::string& command,
                                    const std::vector<std::string>& flags) {
    std::vector<std::string> args;
    args.reserve(flags.size() + 1);
    args.push_back(command);
    args.insert(args.end(), flags.begin(), flags.end());

    launcher_log(fmt::format("exec: {} {}", binary_, join(args, " ")));

    auto child = platform::spawn(binary_, args, stderr_log_);
    if (!child.valid()) {
        return Result<void>::Err(fmt::format("Failed to spawn {}", binary_));
    }

    int code = child.wait();
    launcher_log(fmt::format("{} {} exited with {}", binary_, command, code));

    if (code == platform::EXEC_FAILED_CODE) {
        return Result<void>::Err(fmt::format("Could not execute {} (not found or not executable)", binary_));
    }
    if (code != 0) {
        return Result<void>::Err(fmt::format("{} {} failed with exit code {}", binary_, command, code));
    }
    return Result<void>::Ok();
}
