#pragma once

#include <string>
#include <core/types.hpp>

// Where coordinator notices go. Both callbacks may be empty.
struct LogSink {
    StatusCallback on_info;   // progress, e.g. waiting on a lock
    StatusCallback on_warn;   // benign but noteworthy, e.g. server already up

    void info(const std::string& msg) const { if (on_info) on_info(msg); }
    void warn(const std::string& msg) const { if (on_warn) on_warn(msg); }
};

// <temp_dir>/pyrelaunch_debug.log
std::string launcher_log_path();

// Append a timestamped line to the debug log. Failures are ignored.
void launcher_log(const std::string& msg);
