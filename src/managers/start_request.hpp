#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Everything the launcher needs to start one server. Built once per
// successful coordination and handed to ProcessLauncher::launch.
struct StartRequest {
    std::string command;                             // always "start"
    std::string project_dir;
    std::vector<std::string> analysis_directories;
    std::vector<std::string> flags;                  // in the order passed to the binary
};

// Directories the server should analyze: the command-line source
// directories if any, else the configured ones. Absolute, normalized,
// duplicates removed, first-seen order kept.
std::vector<std::string> directories_to_analyze(const StartArguments& args,
                                                const ServerConfig& config);

// True only for a strict superset of the project root: more than one
// directory and the root among them.
bool should_filter_directories(const std::vector<std::string>& directories,
                               const std::string& project_dir);

// Flags every server command takes (-project-root, -verbose, ...).
std::vector<std::string> common_flags(const StartArguments& args);

StartRequest build_start_request(const StartArguments& args, const ServerConfig& config);
