#pragma once

#include <string>
#include <platform/file_lock.hpp>

// Hands out leases on named resources. The returned FileLock is either
// held (released when it goes out of scope) or carries the failure kind.
class LockManager {
public:
    virtual ~LockManager() = default;

    virtual FileLock acquire(const std::string& resource_path, LockMode mode) = 0;
};

// flock-backed leases on marker files.
class FileLockManager : public LockManager {
public:
    // wait_timeout_secs <= 0 keeps Blocking acquisitions waiting indefinitely.
    explicit FileLockManager(int wait_timeout_secs = 0);

    FileLock acquire(const std::string& resource_path, LockMode mode) override;

    // -1 when Blocking acquisitions wait indefinitely.
    int wait_timeout_ms() const { return wait_timeout_ms_; }

private:
    int wait_timeout_ms_;
};
