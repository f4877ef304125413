#include "start_request.hpp"
#include <core/constants.hpp>
#include <core/directory_structure.hpp>
#include <core/utils.hpp>
#include <algorithm>

std::vector<std::string> directories_to_analyze(const StartArguments& args,
                                                const ServerConfig& config) {
    const auto& source = args.source_directories.empty()
        ? config.analysis_directories
        : args.source_directories;

    fs::path root(args.project_dir);
    std::vector<std::string> out;
    for (const auto& dir : source) {
        if (dir.empty()) continue;
        std::string normalized = normalize_path(dir, root).string();
        if (std::find(out.begin(), out.end(), normalized) == out.end()) {
            out.push_back(normalized);
        }
    }
    return out;
}

bool should_filter_directories(const std::vector<std::string>& directories,
                               const std::string& project_dir) {
    if (directories.size() <= 1) return false;
    return std::find(directories.begin(), directories.end(), project_dir) != directories.end();
}

std::vector<std::string> common_flags(const StartArguments& args) {
    std::vector<std::string> flags = {"-project-root", args.project_dir};
    if (args.verbose) {
        flags.push_back("-verbose");
    }
    if (!args.logging_sections.empty()) {
        flags.insert(flags.end(), {"-logging-sections", args.logging_sections});
    }
    if (!args.log_identifier.empty()) {
        flags.insert(flags.end(), {"-log-identifier", args.log_identifier});
    }
    return flags;
}

StartRequest build_start_request(const StartArguments& args, const ServerConfig& config) {
    StartRequest request;
    request.command = START_COMMAND;
    request.project_dir = args.project_dir;
    request.analysis_directories = directories_to_analyze(args, config);

    auto& flags = request.flags;
    flags = common_flags(args);

    if (should_filter_directories(request.analysis_directories, request.project_dir)) {
        flags.insert(flags.end(), {"-filter-directories", join(request.analysis_directories, ",")});
    }
    if (!args.no_watchman) {
        flags.push_back("-use-watchman");
    }
    if (args.terminal) {
        flags.push_back("-terminal");
    }

    flags.insert(flags.end(), {
        "-workers", std::to_string(config.workers),
        "-typeshed", config.typeshed,
        "-expected-binary-version", config.version_hash,
    });

    if (!config.search_path.empty()) {
        flags.insert(flags.end(), {"-search-path", join(config.search_path, ",")});
    }
    return request;
}
