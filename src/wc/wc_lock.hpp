#pragma once

#include <filesystem>
#include <platform/file_lock.hpp>
#include "metadata_store.hpp"

// Lock on one working copy, shared by every process that uses wcstore on it.
//
// Handles are created unlocked. lock() blocks until no other handle, in this
// or any other process, holds the working copy. Locking twice or unlocking
// an unheld handle is a caller bug and throws WCError immediately.
// Wrap multi-entry updates in a single lock; each entry write is atomic on
// its own but nothing spans several entries.
class WCLock {
public:
    WCLock(const MetadataStore& store, const std::filesystem::path& root);
    ~WCLock();

    WCLock(const WCLock&) = delete;
    WCLock& operator=(const WCLock&) = delete;

    // Throws WCError DoubleLock if held, NotAWorkingCopy if root has no store.
    void lock();

    // Throws WCError UnacquiredLockRelease if not held.
    void unlock();

    bool has_lock() const { return file_lock_.held(); }

    const std::filesystem::path& root() const { return root_; }

private:
    MetadataStore store_;
    std::filesystem::path root_;
    FileLock file_lock_;
};

// Scoped acquisition: locks on construction, unlocks on every exit path.
class WCLockGuard {
public:
    explicit WCLockGuard(WCLock& lock);
    ~WCLockGuard();

    WCLockGuard(const WCLockGuard&) = delete;
    WCLockGuard& operator=(const WCLockGuard&) = delete;

private:
    WCLock& lock_;
};
