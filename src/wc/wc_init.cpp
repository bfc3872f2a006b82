#include "wc_init.hpp"
#include "metadata_store.hpp"
#include <core/log.hpp>
#include <core/wc_error.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <system_error>

namespace fs = std::filesystem;

void wc_init(const MetadataStore& store, const fs::path& root,
             const std::optional<fs::path>& ext_store) {
    std::error_code ec;

    if (ext_store && (!fs::is_directory(*ext_store, ec) || !platform::is_writable(*ext_store))) {
        throw WCError(WCErrorKind::InvalidExternalStore,
                      fmt::format("external store '{}' is no directory or not writable",
                                  ext_store->string()),
                      *ext_store);
    }

    // symlink_status so a dangling store link still counts as taken
    fs::path store_dir = store.store_dir(root);
    if (fs::exists(fs::symlink_status(store_dir, ec))) {
        throw WCError(WCErrorKind::AlreadyAWorkingCopy,
                      fmt::format("'{}' is already a working copy", root.string()), root);
    }

    if (fs::exists(root, ec)) {
        if (!fs::is_directory(root, ec)) {
            throw WCError(WCErrorKind::InvalidPath,
                          fmt::format("'{}' already exists but is no directory", root.string()),
                          root);
        }
    } else {
        fs::create_directories(root, ec);
        if (ec) {
            if (platform::is_permission_error(ec)) {
                throw WCError(WCErrorKind::PermissionDenied,
                              fmt::format("no permission to create '{}'", root.string()), root);
            }
            throw fs::filesystem_error("cannot create working copy root", root, ec);
        }
    }

    if (!platform::is_writable(root)) {
        throw WCError(WCErrorKind::PermissionDenied,
                      fmt::format("no permission to create a store in '{}'", root.string()),
                      root);
    }

    // Creating the store is the claim on root: whoever loses a concurrent
    // init sees it already there.
    if (ext_store) {
        fs::create_directory_symlink(fs::absolute(*ext_store), store_dir, ec);
    } else if (!fs::create_directory(store_dir, ec) && !ec) {
        ec = std::make_error_code(std::errc::file_exists);
    }
    if (ec == std::errc::file_exists) {
        throw WCError(WCErrorKind::AlreadyAWorkingCopy,
                      fmt::format("'{}' is already a working copy", root.string()), root);
    }
    if (ec) throw fs::filesystem_error("cannot create store", store_dir, ec);

    // A shared store may already carry its data directory
    fs::path data_dir = store.data_dir(root);
    fs::create_directories(data_dir, ec);
    if (ec) {
        // Store without data directory would block every later init
        std::error_code cleanup_ec;
        fs::remove(store_dir, cleanup_ec);
        if (cleanup_ec) {
            wcstore_log(fmt::format("init {}: cannot remove {}: {}", root.string(),
                                    store_dir.string(), cleanup_ec.message()));
        }
        throw fs::filesystem_error("cannot create store data directory", data_dir, ec);
    }

    if (ext_store) {
        wcstore_log(fmt::format("init {} -> external store {}", root.string(),
                                ext_store->string()));
    } else {
        wcstore_log(fmt::format("init {}", root.string()));
    }
}
