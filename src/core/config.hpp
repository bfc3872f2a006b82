#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.wcstore/config.yaml. A missing file yields the defaults.
    static Result<Config> load_global();

    // Load a specific YAML file. The file must exist.
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text (same schema as the file)
    static Result<Config> parse(const std::string& yaml_text);

    // Wrap an explicit layout (tests, embedding callers)
    static Config from_layout(const StoreLayout& layout);

    const StoreLayout& layout() const { return layout_; }
    const fs::path& source() const { return source_; }

public:
    Config() = default;

private:
    StoreLayout layout_;
    fs::path source_;    // empty when built from defaults or text
};

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
bool global_config_exists();

// Returns an error message if the name cannot be used as a single
// file name inside the store, empty string otherwise.
std::string validate_store_name(const std::string& key, const std::string& name);

// Returns an error message if two names inside the store collide (the lock
// file would otherwise be removed on top of an entry), empty string otherwise.
std::string validate_store_layout(const StoreLayout& layout);
