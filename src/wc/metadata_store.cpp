#include "metadata_store.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <core/wc_error.hpp>
#include <platform/atomic_file.hpp>
#include <fmt/format.h>
#include <system_error>

MetadataStore::MetadataStore(StoreLayout layout)
    : layout_(std::move(layout)) {}

const std::string& MetadataStore::entry_name(MetadataEntry entry) const {
    switch (entry) {
        case MetadataEntry::Apiurl:   return layout_.apiurl;
        case MetadataEntry::Project:  return layout_.project;
        case MetadataEntry::Package:  return layout_.package;
        case MetadataEntry::Packages: return layout_.packages;
        case MetadataEntry::Files:    return layout_.files;
    }
    return layout_.apiurl;
}

fs::path MetadataStore::store_dir(const fs::path& root) const {
    return root / layout_.store_dir;
}

fs::path MetadataStore::store_file(const fs::path& root, const std::string& name) const {
    return store_dir(root) / name;
}

fs::path MetadataStore::data_dir(const fs::path& root) const {
    return store_dir(root) / layout_.data_dir;
}

fs::path MetadataStore::lock_path(const fs::path& root) const {
    return store_dir(root) / layout_.lock_file;
}

bool MetadataStore::has_store(const fs::path& root) const {
    std::error_code ec;
    return fs::is_directory(root, ec) && fs::is_directory(store_dir(root), ec);
}

std::vector<std::string> MetadataStore::missing(const fs::path& root,
                                                const std::vector<std::string>& names,
                                                MissingOptions opts) const {
    if (!has_store(root)) return names;

    fs::path base = opts.data ? data_dir(root) : store_dir(root);
    std::vector<std::string> absent;
    for (const auto& name : names) {
        std::error_code ec;
        fs::path p = base / name;
        bool present = opts.dirs ? fs::is_directory(p, ec) : fs::is_regular_file(p, ec);
        if (!present) absent.push_back(name);
    }
    return absent;
}

std::string MetadataStore::read(const fs::path& root, const std::string& name) const {
    if (!has_store(root)) {
        throw WCError(WCErrorKind::NotAWorkingCopy,
                      fmt::format("'{}' is not a working copy", root.string()), root);
    }
    if (!missing(root, {name}).empty()) {
        throw WCError(WCErrorKind::NotFound,
                      fmt::format("no entry '{}' in the store of '{}'", name, root.string()),
                      store_file(root, name));
    }
    try {
        return trimmed(read_file(store_file(root, name)));
    } catch (const fs::filesystem_error& e) {
        // Removed between the check above and the open
        if (e.code() != std::errc::no_such_file_or_directory) throw;
        throw WCError(WCErrorKind::NotFound,
                      fmt::format("no entry '{}' in the store of '{}'", name, root.string()),
                      store_file(root, name));
    }
}

std::string MetadataStore::read(const fs::path& root, MetadataEntry entry) const {
    return read(root, entry_name(entry));
}

void MetadataStore::write(const fs::path& root, const std::string& name,
                          const std::string& content) const {
    if (!has_store(root)) {
        throw WCError(WCErrorKind::NotAWorkingCopy,
                      fmt::format("'{}' has no store; initialize it first", root.string()),
                      root);
    }
    write_text_atomic(store_file(root, name), content);
    wcstore_log(fmt::format("wrote {} ({} bytes) in {}", name, content.size(), root.string()));
}

void MetadataStore::write(const fs::path& root, MetadataEntry entry,
                          const std::string& content) const {
    write(root, entry_name(entry), content);
}

bool parse_metadata_entry(const std::string& text, MetadataEntry& out) {
    std::string name = (!text.empty() && text[0] == '_') ? text.substr(1) : text;
    if (name == "apiurl")   { out = MetadataEntry::Apiurl;   return true; }
    if (name == "project")  { out = MetadataEntry::Project;  return true; }
    if (name == "package")  { out = MetadataEntry::Package;  return true; }
    if (name == "packages") { out = MetadataEntry::Packages; return true; }
    if (name == "files")    { out = MetadataEntry::Files;    return true; }
    return false;
}
