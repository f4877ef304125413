#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// Per-project state directory: <project>/.pyre
fs::path get_state_dir(const fs::path& project_dir);

// Lock serializing start attempts: <project>/.pyre/client.lock
fs::path get_start_lock_path(const fs::path& project_dir);

// Lock a running server holds for its lifetime: <project>/.pyre/server/server.lock
fs::path get_server_lock_path(const fs::path& project_dir);

// Get the base ~/.pyrelaunch path
fs::path get_pyrelaunch_root();

// Absolute, lexically normalized form of `p`, resolving relative paths
// against `base`. Trailing separators are dropped so "a/b/" == "a/b".
fs::path normalize_path(const fs::path& p, const fs::path& base);
