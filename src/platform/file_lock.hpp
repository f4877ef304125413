#pragma once
#include <string>

enum class LockMode {
    NonBlocking,   // try once
    Blocking,      // wait until the holder lets go
};

enum class LockError {
    None,
    Busy,          // held by someone else
    Unavailable,   // OS refused: permissions, bad path, ...
    Timeout,       // bounded blocking wait expired
};

const char* lock_error_name(LockError e);

// RAII advisory lock on a marker file.
// Uses flock() on Unix, LockFileEx() on Windows.
// The lock is released when the object is destroyed or the process exits
// (even on crash). The file's contents are never touched.
class FileLock {
public:
    FileLock() = default;

    // Attempts to acquire the lock, creating the file and its parent
    // directories if needed. Check held() after construction.
    // timeout_ms only applies to Blocking mode; negative waits indefinitely.
    FileLock(const std::string& lock_path, LockMode mode, int timeout_ms = -1);
    ~FileLock();

    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    // An unheld lock carrying the given failure.
    static FileLock failed(const std::string& lock_path, LockError error,
                           const std::string& reason);

    // Returns true if this instance holds the lock.
    bool held() const { return fd_ >= 0; }

    LockError error() const { return error_; }
    const std::string& reason() const { return reason_; }
    const std::string& path() const { return path_; }
    LockMode mode() const { return mode_; }

    // Drop the lock early. Safe to call more than once.
    void release();

private:
    void fail(LockError error, const std::string& reason);

    std::string path_;
    LockMode mode_ = LockMode::NonBlocking;
    LockError error_ = LockError::None;
    std::string reason_;
    int fd_ = -1;
};
