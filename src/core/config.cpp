#include "config.hpp"
#include "constants.hpp"
#include "directory_structure.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <utility>

namespace fs = std::filesystem;

// A key may hold one path or a list of them.
static std::vector<std::string> read_path_list(const YAML::Node& node, const fs::path& base) {
    std::vector<std::string> out;
    if (node.IsScalar()) {
        out.push_back(normalize_path(node.as<std::string>(), base).string());
    } else if (node.IsSequence()) {
        for (const auto& item : node) {
            out.push_back(normalize_path(item.as<std::string>(), base).string());
        }
    }
    return out;
}

// Overlay the keys present in `root` onto `server`. Relative paths resolve
// against `base`, the directory holding the file.
static void overlay_server_config(const YAML::Node& root, ServerConfig& server,
                                  const fs::path& base) {
    if (!root.IsMap()) return;

    if (root["workers"]) {
        server.workers = root["workers"].as<int>();
    }
    if (root["typeshed"]) {
        server.typeshed = normalize_path(root["typeshed"].as<std::string>(), base).string();
    }
    if (root["version"]) {
        server.version_hash = root["version"].as<std::string>();
    }
    if (root["search_path"]) {
        server.search_path = read_path_list(root["search_path"], base);
    }
    if (root["binary"]) {
        // A bare name is looked up on PATH, anything else is a path
        std::string binary = root["binary"].as<std::string>();
        if (binary.find('/') != std::string::npos) {
            binary = normalize_path(binary, base).string();
        }
        server.binary = binary;
    }
    if (root["analysis_directories"]) {
        server.analysis_directories = read_path_list(root["analysis_directories"], base);
    }
    if (root["start_lock_timeout"]) {
        server.start_lock_timeout = root["start_lock_timeout"].as<int>();
    }
}

static Result<void> validate(const ServerConfig& server) {
    if (server.workers < 1) {
        return Result<void>::Err("workers must be at least 1, got " + std::to_string(server.workers));
    }
    if (server.start_lock_timeout < 0) {
        return Result<void>::Err("start_lock_timeout must not be negative");
    }
    if (server.start_lock_timeout > MAX_WAIT_TIMEOUT_SECS) {
        return Result<void>::Err(fmt::format("start_lock_timeout must be at most {} seconds, got {}",
                                             MAX_WAIT_TIMEOUT_SECS, server.start_lock_timeout));
    }
    if (server.binary.empty()) {
        return Result<void>::Err("binary must not be empty");
    }
    return Result<void>::Ok();
}

fs::path get_global_config_path() {
    return get_pyrelaunch_root() / GLOBAL_CONFIG_NAME;
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / PROJECT_CONFIG_NAME;
}

Config::Config() {
    server_.workers = platform::cpu_count();
    server_.binary = DEFAULT_SERVER_BINARY;
}

Result<Config> Config::load(const fs::path& project_dir, const fs::path& global_path) {
    Config config;
    config.project_dir_ = project_dir;

    // Load global first, then let the project override it key by key
    const std::pair<fs::path, fs::path> layers[] = {
        {global_path, global_path.parent_path()},
        {get_project_config_path(project_dir), project_dir},
    };

    for (const auto& [path, base] : layers) {
        if (!fs::exists(path)) continue;
        try {
            YAML::Node root = YAML::LoadFile(path.string());
            overlay_server_config(root, config.server_, base);
        } catch (const std::exception& e) {
            return Result<Config>::Err("Failed to parse " + path.string() + ": " + e.what());
        }
    }

    auto valid = validate(config.server_);
    if (valid.is_err()) {
        return Result<Config>::Err(valid.error);
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::load(const fs::path& project_dir) {
    return load(project_dir, get_global_config_path());
}
