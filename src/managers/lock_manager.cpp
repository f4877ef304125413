#include "lock_manager.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <limits>

// Seconds to milliseconds, saturating at INT_MAX.
static int to_wait_ms(int secs) {
    if (secs <= 0) return -1;
    long long ms = static_cast<long long>(secs) * 1000;
    return static_cast<int>(std::min<long long>(ms, std::numeric_limits<int>::max()));
}

FileLockManager::FileLockManager(int wait_timeout_secs)
    : wait_timeout_ms_(to_wait_ms(wait_timeout_secs)) {}

FileLock FileLockManager::acquire(const std::string& resource_path, LockMode mode) {
    bool blocking = mode == LockMode::Blocking;
    FileLock lock(resource_path, mode, blocking ? wait_timeout_ms_ : -1);

    if (lock.held()) {
        launcher_log(fmt::format("lock acquired: {} ({})", resource_path,
                                 blocking ? "blocking" : "non-blocking"));
    } else {
        launcher_log(fmt::format("lock {}: {}", lock_error_name(lock.error()), lock.reason()));
    }
    return lock;
}
