#include "start_command.hpp"
#include "theme.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/directory_structure.hpp>
#include <core/utils.hpp>
#include <managers/lock_manager.hpp>
#include <managers/process_launcher.hpp>
#include <managers/start_coordinator.hpp>
#include <iostream>
#include <fmt/format.h>

namespace fs = std::filesystem;

Result<StartArguments> parse_start_arguments(const std::vector<std::string>& args,
                                             const fs::path& cwd) {
    StartArguments parsed;
    std::string project_root;

    for (size_t i = 0; i < args.size(); i++) {
        std::string opt = args[i];
        std::string value;
        bool has_inline_value = false;

        // --opt=value
        auto eq = opt.find('=');
        if (opt.rfind("--", 0) == 0 && eq != std::string::npos) {
            value = opt.substr(eq + 1);
            opt = opt.substr(0, eq);
            has_inline_value = true;
        }

        auto take_value = [&](std::string& out) -> bool {
            if (has_inline_value) {
                out = value;
                return true;
            }
            if (i + 1 >= args.size()) return false;
            out = args[++i];
            return true;
        };

        if (opt == "--terminal") {
            parsed.terminal = true;
        } else if (opt == "--no-watchman") {
            parsed.no_watchman = true;
        } else if (opt == "--verbose") {
            parsed.verbose = true;
        } else if (opt == "--project-root" || opt == "--source-directory" ||
                   opt == "--logging-sections" || opt == "--log-identifier" ||
                   opt == "--wait-timeout") {
            std::string v;
            if (!take_value(v) || v.empty()) {
                return Result<StartArguments>::Err("Missing value for " + opt);
            }
            if (opt == "--project-root") {
                project_root = v;
            } else if (opt == "--source-directory") {
                parsed.source_directories.push_back(v);
            } else if (opt == "--logging-sections") {
                parsed.logging_sections = v;
            } else if (opt == "--log-identifier") {
                parsed.log_identifier = v;
            } else {
                parsed.wait_timeout = safe_stoi(v, -1);
                if (parsed.wait_timeout < 0 || parsed.wait_timeout > MAX_WAIT_TIMEOUT_SECS) {
                    return Result<StartArguments>::Err("Invalid --wait-timeout: " + v);
                }
            }
        } else {
            return Result<StartArguments>::Err("Unknown option: " + args[i]);
        }
    }

    fs::path root = project_root.empty() ? cwd : fs::path(project_root);
    parsed.project_dir = normalize_path(root, cwd).string();
    return Result<StartArguments>::Ok(parsed);
}

LogSink console_log_sink() {
    LogSink sink;
    sink.on_info = [](const std::string& msg) {
        launcher_log("INFO " + msg);
        std::cout << theme::info(msg) << std::flush;
    };
    sink.on_warn = [](const std::string& msg) {
        launcher_log("WARN " + msg);
        std::cout << theme::warn(msg) << std::flush;
    };
    return sink;
}

int exit_code_for(const Result<CoordinationOutcome>& result) {
    if (result.is_err()) return EXIT_FAILURE_CODE;
    switch (result.value) {
        case CoordinationOutcome::Started:
        case CoordinationOutcome::AlreadyRunning:
            return EXIT_OK;
        case CoordinationOutcome::LockContention:
            return EXIT_LOCK_CONTENTION;
    }
    return EXIT_FAILURE_CODE;
}

int run_start(const StartArguments& args) {
    auto config_result = Config::load(args.project_dir);
    if (config_result.is_err()) {
        std::cout << theme::fail(config_result.error);
        return EXIT_FAILURE_CODE;
    }
    const ServerConfig& server = config_result.value.server();

    int timeout = args.wait_timeout >= 0 ? args.wait_timeout : server.start_lock_timeout;
    FileLockManager locks(timeout);
    BinaryLauncher launcher(server.binary, launcher_log_path());
    StartCoordinator coordinator(locks, launcher, console_log_sink());

    launcher_log(fmt::format("start: project={} binary={} workers={}",
                             args.project_dir, server.binary, server.workers));

    auto result = coordinator.run(args, server);
    if (result.is_err()) {
        launcher_log("start failed: " + result.error);
        std::cout << theme::fail(result.error);
    } else {
        launcher_log(fmt::format("start: {}", outcome_name(result.value)));
        if (result.value == CoordinationOutcome::Started) {
            std::cout << theme::ok(fmt::format("Server started for {}", args.project_dir));
        }
    }
    return exit_code_for(result);
}

void print_start_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::usage("pyrelaunch start [options]", "Start the server for a project");
    std::cout << theme::usage("pyrelaunch --version", "Show version");
    std::cout << theme::usage("pyrelaunch --help", "Show this help");
    std::cout << theme::section("Start options");
    std::cout << theme::usage("--project-root DIR", "Project directory (default: cwd)");
    std::cout << theme::usage("--source-directory DIR", "Directory to analyze (repeatable)");
    std::cout << theme::usage("--terminal", "Run the server attached to the terminal");
    std::cout << theme::usage("--no-watchman", "Do not use watchman for file changes");
    std::cout << theme::usage("--verbose", "Verbose server logging");
    std::cout << theme::usage("--logging-sections S", "Server logging sections");
    std::cout << theme::usage("--log-identifier ID", "Tag for server log lines");
    std::cout << theme::usage("--wait-timeout SECS", "Give up waiting on the client lock");
    std::cout << "\n";
}
