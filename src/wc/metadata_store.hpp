#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

struct MissingOptions {
    bool dirs = false;   // test for directories instead of regular files
    bool data = false;   // look inside the store's data directory
};

// Named access to the metadata files of a working copy.
//
// The store itself holds no state besides its layout: every call takes the
// working-copy root, so one instance serves any number of working copies.
// Reads strip surrounding whitespace. Writes go through write_text_atomic.
class MetadataStore {
public:
    explicit MetadataStore(StoreLayout layout = StoreLayout{});

    const StoreLayout& layout() const { return layout_; }

    // File name of an entry in this layout
    const std::string& entry_name(MetadataEntry entry) const;

    fs::path store_dir(const fs::path& root) const;
    fs::path store_file(const fs::path& root, const std::string& name) const;
    fs::path data_dir(const fs::path& root) const;
    fs::path lock_path(const fs::path& root) const;

    // Root is a directory with a store directory (or a link to one) inside.
    bool has_store(const fs::path& root) const;

    // Names from the list that are absent, in input order. Returns the whole
    // list when the root has no store.
    std::vector<std::string> missing(const fs::path& root,
                                     const std::vector<std::string>& names,
                                     MissingOptions opts = {}) const;

    // Throws WCError NotAWorkingCopy (no store) or NotFound (no such regular file).
    std::string read(const fs::path& root, const std::string& name) const;
    std::string read(const fs::path& root, MetadataEntry entry) const;

    // Throws WCError NotAWorkingCopy if the root has no store.
    void write(const fs::path& root, const std::string& name, const std::string& content) const;
    void write(const fs::path& root, MetadataEntry entry, const std::string& content) const;

    std::string read_apiurl(const fs::path& root) const { return read(root, MetadataEntry::Apiurl); }
    std::string read_project(const fs::path& root) const { return read(root, MetadataEntry::Project); }
    std::string read_package(const fs::path& root) const { return read(root, MetadataEntry::Package); }
    std::string read_packages(const fs::path& root) const { return read(root, MetadataEntry::Packages); }
    std::string read_files(const fs::path& root) const { return read(root, MetadataEntry::Files); }

    void write_apiurl(const fs::path& root, const std::string& apiurl) const {
        write(root, MetadataEntry::Apiurl, apiurl);
    }
    void write_project(const fs::path& root, const std::string& project) const {
        write(root, MetadataEntry::Project, project);
    }
    void write_package(const fs::path& root, const std::string& package) const {
        write(root, MetadataEntry::Package, package);
    }
    void write_packages(const fs::path& root, const std::string& xml_data) const {
        write(root, MetadataEntry::Packages, xml_data);
    }
    void write_files(const fs::path& root, const std::string& xml_data) const {
        write(root, MetadataEntry::Files, xml_data);
    }

private:
    StoreLayout layout_;
};

// Parses "apiurl", "project", ... (also accepts the on-disk "_apiurl" form).
// Returns false for anything else.
bool parse_metadata_entry(const std::string& text, MetadataEntry& out);
