#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include <filesystem>

enum class WCErrorKind {
    Inconsistent,           // store exists but its entries make no sense together
    NotAWorkingCopy,        // no store under the root
    NotFound,               // store exists, entry does not
    AlreadyAWorkingCopy,
    InvalidExternalStore,
    InvalidPath,            // root exists but is no directory
    PermissionDenied,
    DoubleLock,
    UnacquiredLockRelease,
};

const char* wc_error_kind_name(WCErrorKind kind);

// Every working-copy level failure. Plain OS failures are not wrapped and
// surface as std::filesystem::filesystem_error instead.
class WCError : public std::runtime_error {
public:
    WCError(WCErrorKind kind, const std::string& msg,
            std::filesystem::path path = {},
            std::vector<std::string> entries = {})
        : std::runtime_error(msg),
          kind_(kind),
          path_(std::move(path)),
          entries_(std::move(entries)) {}

    WCErrorKind kind() const { return kind_; }
    const std::filesystem::path& path() const { return path_; }

    // Missing entry names (Inconsistent only)
    const std::vector<std::string>& entries() const { return entries_; }

private:
    WCErrorKind kind_;
    std::filesystem::path path_;
    std::vector<std::string> entries_;
};
