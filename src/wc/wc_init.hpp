#pragma once

#include <filesystem>
#include <optional>

class MetadataStore;

// Turns root into an (empty) working copy: creates root if needed, then the
// store directory and its data directory. With ext_store the store becomes a
// symlink to that directory instead, so several roots can share one store
// (and its data directory and lock file). No entries are written.
//
// Throws WCError:
//   InvalidExternalStore  ext_store is not an existing writable directory
//   AlreadyAWorkingCopy   root already has a store, or a concurrent init won
//   InvalidPath           root exists but is no directory
//   PermissionDenied      root cannot be created or is not writable
// Other OS failures propagate as filesystem_error; a store created before
// such a failure is removed again.
void wc_init(const MetadataStore& store, const std::filesystem::path& root,
             const std::optional<std::filesystem::path>& ext_store = std::nullopt);
