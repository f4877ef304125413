#pragma once

#include <string>
#include <vector>
#include <functional>
#include <utility>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Settings the analysis server is started with. Paths are absolute once
// loaded through Config.
struct ServerConfig {
    int workers = 1;
    std::string typeshed;
    std::string version_hash;
    std::vector<std::string> search_path;
    std::string binary;                          // server executable (PATH lookup if bare)
    std::vector<std::string> analysis_directories;
    int start_lock_timeout = 0;                  // seconds, 0 = wait indefinitely
};

// Per-invocation switches from the command line.
struct StartArguments {
    std::string project_dir;
    std::vector<std::string> source_directories;  // overrides analysis_directories
    bool terminal = false;
    bool no_watchman = false;
    bool verbose = false;
    std::string logging_sections;
    std::string log_identifier;
    int wait_timeout = -1;                        // -1 = use config
};

// Externally visible result of one coordination attempt.
enum class CoordinationOutcome {
    Started,
    AlreadyRunning,
    LockContention,   // bounded wait on the start lock expired
};

inline const char* outcome_name(CoordinationOutcome o) {
    switch (o) {
        case CoordinationOutcome::Started:        return "started";
        case CoordinationOutcome::AlreadyRunning: return "already running";
        case CoordinationOutcome::LockContention: return "lock contention";
    }
    return "unknown";
}

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
