#include "file_lock.hpp"
#include <cerrno>
#include <stdexcept>
#include <system_error>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#  include <io.h>
#  include <fcntl.h>
#  include <sys/stat.h>
#else
#  include <sys/file.h>
#  include <sys/stat.h>
#  include <unistd.h>
#  include <fcntl.h>
#endif

namespace fs = std::filesystem;

namespace {

[[noreturn]] void throw_os_error(const char* what, const fs::path& p, int err) {
    throw fs::filesystem_error(what, p, std::error_code(err, std::generic_category()));
}

} // namespace

FileLock::FileLock(fs::path lock_path)
    : path_(std::move(lock_path)) {}

FileLock::~FileLock() {
    if (fd_ < 0) return;
#ifdef _WIN32
    close_fd();
    std::error_code ec;
    fs::remove(path_, ec);
#else
    ::unlink(path_.c_str());
    close_fd();
#endif
}

void FileLock::acquire() {
    if (fd_ >= 0) {
        throw std::logic_error("FileLock::acquire: lock already held: " + path_.string());
    }

#ifdef _WIN32
    int fd = _wopen(path_.c_str(), _O_CREAT | _O_RDWR, _S_IREAD | _S_IWRITE);
    if (fd < 0) throw_os_error("cannot open lock file", path_, errno);
    HANDLE h = (HANDLE)_get_osfhandle(fd);
    OVERLAPPED ov = {};
    // No LOCKFILE_FAIL_IMMEDIATELY: wait for the holder
    if (!LockFileEx(h, LOCKFILE_EXCLUSIVE_LOCK, 0, 1, 0, &ov)) {
        _close(fd);
        throw_os_error("cannot lock file", path_, EIO);
    }
    fd_ = fd;
#else
    for (;;) {
        int fd = ::open(path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
        if (fd < 0) throw_os_error("cannot open lock file", path_, errno);

        int rc;
        do {
            rc = ::flock(fd, LOCK_EX);
        } while (rc != 0 && errno == EINTR);
        if (rc != 0) {
            int err = errno;
            ::close(fd);
            throw_os_error("cannot lock file", path_, err);
        }

        // The previous holder unlinks the file before unlocking. If that
        // happened while we waited, our lock sits on an orphaned inode and
        // excludes nobody: start over on whatever is at the path now.
        struct stat held_st;
        struct stat path_st;
        if (::fstat(fd, &held_st) != 0) {
            int err = errno;
            ::close(fd);
            throw_os_error("cannot stat lock file", path_, err);
        }
        if (::stat(path_.c_str(), &path_st) != 0) {
            int err = errno;
            ::close(fd);
            if (err == ENOENT) continue;
            throw_os_error("cannot stat lock file", path_, err);
        }
        if (held_st.st_dev != path_st.st_dev || held_st.st_ino != path_st.st_ino) {
            ::close(fd);
            continue;
        }

        fd_ = fd;
        return;
    }
#endif
}

void FileLock::release(bool remove_file) {
    if (fd_ < 0) return;

    int err = 0;
#ifdef _WIN32
    HANDLE h = (HANDLE)_get_osfhandle(fd_);
    OVERLAPPED ov = {};
    UnlockFileEx(h, 0, 1, 0, &ov);
    close_fd();
    // Windows refuses to delete an open file, so remove after closing.
    // Another waiter may already have it open; then it stays.
    if (remove_file) {
        std::error_code ec;
        fs::remove(path_, ec);
    }
#else
    // Unlink while still holding the lock so no waiter can validate
    // the old inode after we let go.
    if (remove_file && ::unlink(path_.c_str()) != 0 && errno != ENOENT) {
        err = errno;
    }
    ::flock(fd_, LOCK_UN);
    close_fd();
#endif

    if (err != 0) throw_os_error("cannot remove lock file", path_, err);
}

void FileLock::close_fd() noexcept {
    if (fd_ < 0) return;
#ifdef _WIN32
    _close(fd_);
#else
    ::close(fd_);
#endif
    // flock is released automatically when fd is closed
    fd_ = -1;
}
