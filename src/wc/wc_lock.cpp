#include "wc_lock.hpp"
#include <core/log.hpp>
#include <core/wc_error.hpp>
#include <fmt/format.h>

WCLock::WCLock(const MetadataStore& store, const std::filesystem::path& root)
    : store_(store),
      root_(root),
      file_lock_(store.lock_path(root)) {}

WCLock::~WCLock() {
    if (!has_lock()) return;
    try {
        unlock();
    } catch (const std::exception& e) {
        wcstore_log(fmt::format("WCLock: release in destructor failed for {}: {}",
                                root_.string(), e.what()));
    }
}

void WCLock::lock() {
    if (has_lock()) {
        // Harmless in itself, but always a logic error in the caller
        throw WCError(WCErrorKind::DoubleLock,
                      fmt::format("double lock on '{}'", root_.string()), root_);
    }
    if (!store_.has_store(root_)) {
        throw WCError(WCErrorKind::NotAWorkingCopy,
                      fmt::format("cannot lock '{}': not a working copy", root_.string()),
                      root_);
    }

    wcstore_log(fmt::format("WCLock: waiting for {}", file_lock_.path().string()));
    file_lock_.acquire();
    wcstore_log(fmt::format("WCLock: acquired {}", file_lock_.path().string()));
}

void WCLock::unlock() {
    if (!has_lock()) {
        throw WCError(WCErrorKind::UnacquiredLockRelease,
                      fmt::format("attempting to release an unacquired lock on '{}'",
                                  root_.string()),
                      root_);
    }
    file_lock_.release(true);
    wcstore_log(fmt::format("WCLock: released {}", file_lock_.path().string()));
}

WCLockGuard::WCLockGuard(WCLock& lock)
    : lock_(lock) {
    lock_.lock();
}

WCLockGuard::~WCLockGuard() {
    if (!lock_.has_lock()) return;
    try {
        lock_.unlock();
    } catch (const std::exception& e) {
        wcstore_log(fmt::format("WCLockGuard: release failed for {}: {}",
                                lock_.root().string(), e.what()));
    }
}
