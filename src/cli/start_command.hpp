#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include <core/log.hpp>

// Parse the options after `start`. The project root is made absolute
// against `cwd` (and defaults to it).
Result<StartArguments> parse_start_arguments(const std::vector<std::string>& args,
                                             const std::filesystem::path& cwd);

// Notices go to the terminal and to the debug log.
LogSink console_log_sink();

// Map a coordination result to the process exit code.
int exit_code_for(const Result<CoordinationOutcome>& result);

// Load config, coordinate, and report. Returns the exit code.
int run_start(const StartArguments& args);

void print_start_usage();
