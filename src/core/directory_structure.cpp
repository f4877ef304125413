#include "directory_structure.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>

fs::path get_state_dir(const fs::path& project_dir) {
    return project_dir / STATE_DIR_NAME;
}

fs::path get_start_lock_path(const fs::path& project_dir) {
    return get_state_dir(project_dir) / START_LOCK_NAME;
}

fs::path get_server_lock_path(const fs::path& project_dir) {
    return get_state_dir(project_dir) / SERVER_DIR_NAME / SERVER_LOCK_NAME;
}

fs::path get_pyrelaunch_root() {
    return platform::home_dir() / GLOBAL_DIR_NAME;
}

fs::path normalize_path(const fs::path& p, const fs::path& base) {
    fs::path abs = p.is_absolute() ? p : base / p;
    abs = abs.lexically_normal();
    // lexically_normal keeps a trailing separator as an empty filename
    if (!abs.has_filename() && abs.has_parent_path() && abs != abs.root_path()) {
        abs = abs.parent_path();
    }
    return abs;
}
