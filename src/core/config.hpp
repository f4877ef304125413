#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Defaults, then the global file (~/.pyrelaunch/config.yaml), then the
    // project file (<dir>/.pyrelaunch.yaml). Missing files
    // are skipped; a file that fails to parse is an error.
    static Result<Config> load(const fs::path& project_dir,
                               const fs::path& global_path);
    static Result<Config> load(const fs::path& project_dir);

    // Accessors
    const ServerConfig& server() const { return server_; }
    const fs::path& project_dir() const { return project_dir_; }

public:
    Config();

private:
    ServerConfig server_;
    fs::path project_dir_;
};

// Get paths
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir);
