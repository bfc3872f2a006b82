#include "atomic_file.hpp"
#include "platform.hpp"
#include <core/constants.hpp>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <system_error>
#include <vector>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#  include <io.h>
#  include <fcntl.h>
#  include <sys/stat.h>
#  include <random>
#else
#  include <fcntl.h>
#  include <sys/stat.h>
#  include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace {

[[noreturn]] void throw_os_error(const char* what, const fs::path& p, int err) {
    throw fs::filesystem_error(what, p, std::error_code(err, std::generic_category()));
}

#ifndef _WIN32
// Makes the rename itself durable. Failure here does not undo the rename.
void fsync_parent(const fs::path& target) {
    fs::path parent = target.parent_path().empty() ? fs::path(".") : target.parent_path();
    int dfd = ::open(parent.c_str(), O_DIRECTORY | O_RDONLY | O_CLOEXEC);
    if (dfd < 0) return;
    ::fsync(dfd);
    ::close(dfd);
}
#endif

} // namespace

AtomicFile::AtomicFile(fs::path target)
    : target_(std::move(target)) {
    fs::path parent = target_.parent_path().empty() ? fs::path(".") : target_.parent_path();

#ifdef _WIN32
    static std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<int> dist(100000, 999999);
    for (int attempt = 0; fd_ < 0; ++attempt) {
        temp_path_ = parent / (target_.filename().string() + ".tmp." + std::to_string(dist(rng)));
        fd_ = _wopen(temp_path_.c_str(), _O_CREAT | _O_EXCL | _O_WRONLY | _O_BINARY,
                     _S_IREAD | _S_IWRITE);
        if (fd_ < 0 && (errno != EEXIST || attempt > 16)) {
            int err = errno;
            throw_os_error("cannot create temporary file", temp_path_, err);
        }
    }
#else
    std::string tmpl = (parent / (target_.filename().string() + ".tmp.XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    fd_ = ::mkstemp(buf.data());
    if (fd_ < 0) {
        int err = errno;
        throw_os_error("cannot create temporary file", tmpl, err);
    }
    temp_path_ = buf.data();

    // mkstemp creates 0600; entries are ordinary files
    if (::fchmod(fd_, 0644) != 0) {
        int err = errno;
        discard();
        throw_os_error("cannot set mode of temporary file", temp_path_, err);
    }
#endif
}

AtomicFile::~AtomicFile() {
    if (!committed_) discard();
}

void AtomicFile::write(const std::string& data) {
    if (fd_ < 0) {
        throw fs::filesystem_error("temporary file is closed", temp_path_,
                                   std::make_error_code(std::errc::bad_file_descriptor));
    }

    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
#ifdef _WIN32
        int n = _write(fd_, p, static_cast<unsigned>(left));
#else
        ssize_t n = ::write(fd_, p, left);
#endif
        if (n < 0) {
            if (errno == EINTR) continue;
            throw_os_error("cannot write temporary file", temp_path_, errno);
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
}

void AtomicFile::commit() {
    if (committed_) return;
    if (fd_ < 0) {
        throw fs::filesystem_error("temporary file is closed", temp_path_,
                                   std::make_error_code(std::errc::bad_file_descriptor));
    }

#ifdef _WIN32
    if (_commit(fd_) != 0) throw_os_error("cannot flush temporary file", temp_path_, errno);
    int rc = _close(fd_);
    fd_ = -1;
    if (rc != 0) throw_os_error("cannot close temporary file", temp_path_, errno);
    if (!MoveFileExW(temp_path_.c_str(), target_.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        throw_os_error("cannot rename temporary file", target_, EIO);
    }
#else
    if (::fsync(fd_) != 0) throw_os_error("cannot flush temporary file", temp_path_, errno);
    int rc = ::close(fd_);
    fd_ = -1;
    if (rc != 0) throw_os_error("cannot close temporary file", temp_path_, errno);

    int err = 0;
    for (int i = 0; i < RENAME_MAX_RETRIES; ++i) {
        if (std::rename(temp_path_.c_str(), target_.c_str()) == 0) {
            err = 0;
            break;
        }
        err = errno;
        if (err != EBUSY && err != EINTR) break;
        platform::sleep_ms(RENAME_RETRY_DELAY_MS);
    }
    if (err != 0) throw_os_error("cannot rename temporary file", target_, err);

    fsync_parent(target_);
#endif
    committed_ = true;
}

void AtomicFile::discard() noexcept {
    if (fd_ >= 0) {
#ifdef _WIN32
        _close(fd_);
#else
        ::close(fd_);
#endif
        fd_ = -1;
    }
    if (!temp_path_.empty()) {
        std::error_code ec;
        fs::remove(temp_path_, ec);
    }
}

void write_text_atomic(const fs::path& target, const std::string& content) {
    AtomicFile f(target);
    f.write(content);
    if (!content.empty()) f.write("\n");
    f.commit();
}
