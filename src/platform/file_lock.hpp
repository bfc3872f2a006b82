#pragma once
#include <filesystem>

// Exclusive advisory lock on a file, shared between processes.
// Uses flock() on Unix, LockFileEx() on Windows.
// The OS drops the lock when the descriptor closes, so a crashed holder
// never leaves the file locked.
class FileLock {
public:
    // Does not lock. Call acquire().
    explicit FileLock(std::filesystem::path lock_path);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    // Blocks until the lock is held. No timeout.
    // Throws std::logic_error if already held, filesystem_error on OS failure.
    void acquire();

    // Removes the lock file (if remove_file), then drops the lock and closes
    // the descriptor. No-op when not held. The descriptor is always closed,
    // even when removing the file fails.
    void release(bool remove_file = true);

    // Returns true if this instance holds the lock.
    bool held() const { return fd_ >= 0; }

    const std::filesystem::path& path() const { return path_; }

private:
    void close_fd() noexcept;

    std::filesystem::path path_;
    int fd_ = -1;
};
