#include "file_lock.hpp"
#include "platform.hpp"
#include <core/constants.hpp>
#include <chrono>
#include <filesystem>
#include <system_error>
#include <cerrno>

#ifdef _WIN32
#  include <windows.h>
#  include <io.h>
#  include <fcntl.h>
#else
#  include <sys/file.h>
#  include <unistd.h>
#  include <fcntl.h>
#endif

const char* lock_error_name(LockError e) {
    switch (e) {
        case LockError::None:        return "none";
        case LockError::Busy:        return "busy";
        case LockError::Unavailable: return "unavailable";
        case LockError::Timeout:     return "timeout";
    }
    return "unknown";
}

static std::string errno_message(int err) {
    return std::error_code(err, std::generic_category()).message();
}

namespace {

enum class TryResult { Locked, Busy, Error };

#ifdef _WIN32

TryResult lock_fd(int fd, bool wait, int& err) {
    HANDLE h = (HANDLE)_get_osfhandle(fd);
    OVERLAPPED ov = {};
    DWORD flags = LOCKFILE_EXCLUSIVE_LOCK;
    if (!wait) flags |= LOCKFILE_FAIL_IMMEDIATELY;
    if (LockFileEx(h, flags, 0, 1, 0, &ov)) return TryResult::Locked;
    DWORD code = GetLastError();
    if (code == ERROR_LOCK_VIOLATION) return TryResult::Busy;
    err = static_cast<int>(code);
    return TryResult::Error;
}

#else

TryResult lock_fd(int fd, bool wait, int& err) {
    int op = wait ? LOCK_EX : (LOCK_EX | LOCK_NB);
    for (;;) {
        if (flock(fd, op) == 0) return TryResult::Locked;
        if (errno == EINTR) continue;
        if (errno == EWOULDBLOCK) return TryResult::Busy;
        err = errno;
        return TryResult::Error;
    }
}

#endif

void close_fd(int fd) {
#ifdef _WIN32
    _close(fd);
#else
    close(fd);
#endif
    // the lock is released automatically when fd is closed
}

} // namespace

FileLock::FileLock(const std::string& lock_path, LockMode mode, int timeout_ms)
    : path_(lock_path), mode_(mode) {
    // Ensure parent directory exists
    std::filesystem::path parent = std::filesystem::path(lock_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            fail(LockError::Unavailable,
                 "cannot create " + parent.string() + ": " + ec.message());
            return;
        }
    }

#ifdef _WIN32
    int fd = _open(lock_path.c_str(), _O_CREAT | _O_RDWR | _O_NOINHERIT, 0644);
#else
    int fd = open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
#endif
    if (fd < 0) {
        fail(LockError::Unavailable, "cannot open " + lock_path + ": " + errno_message(errno));
        return;
    }

    bool wait_forever = mode == LockMode::Blocking && timeout_ms < 0;
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(timeout_ms < 0 ? 0 : timeout_ms);
    int err = 0;

    for (;;) {
        TryResult r = lock_fd(fd, wait_forever, err);
        if (r == TryResult::Locked) {
            fd_ = fd;
            return;
        }
        if (r == TryResult::Error) {
            close_fd(fd);
            fail(LockError::Unavailable, "cannot lock " + lock_path + ": " + errno_message(err));
            return;
        }
        // Busy
        if (mode == LockMode::NonBlocking) {
            close_fd(fd);
            fail(LockError::Busy, lock_path + " is held by another process");
            return;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            close_fd(fd);
            fail(LockError::Timeout,
                 "gave up waiting for " + lock_path + " after " + std::to_string(timeout_ms) + "ms");
            return;
        }
        platform::sleep_ms(LOCK_POLL_INTERVAL_MS);
    }
}

FileLock::~FileLock() {
    release();
}

FileLock::FileLock(FileLock&& other) noexcept
    : path_(std::move(other.path_)),
      mode_(other.mode_),
      error_(other.error_),
      reason_(std::move(other.reason_)),
      fd_(other.fd_) {
    other.fd_ = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        mode_ = other.mode_;
        error_ = other.error_;
        reason_ = std::move(other.reason_);
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

FileLock FileLock::failed(const std::string& lock_path, LockError error,
                          const std::string& reason) {
    FileLock lock;
    lock.path_ = lock_path;
    lock.fail(error, reason);
    return lock;
}

void FileLock::release() {
    if (fd_ < 0) return;
    close_fd(fd_);
    fd_ = -1;
}

void FileLock::fail(LockError error, const std::string& reason) {
    error_ = error;
    reason_ = reason;
}
