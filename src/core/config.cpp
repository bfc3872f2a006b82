#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <utility>

namespace fs = std::filesystem;

fs::path get_global_config_dir() {
    return platform::home_dir() / CONFIG_DIR_NAME;
}

fs::path get_global_config_path() {
    return get_global_config_dir() / CONFIG_FILE_NAME;
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

std::string validate_store_name(const std::string& key, const std::string& name) {
    if (name.empty()) {
        return fmt::format("store.{} must not be empty", key);
    }
    if (name == "." || name == "..") {
        return fmt::format("store.{} must not be '{}'", key, name);
    }
    if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
        return fmt::format("store.{} must be a plain file name, got '{}'", key, name);
    }
    return "";
}

std::string validate_store_layout(const StoreLayout& layout) {
    // Everything that lives directly inside the store directory
    const std::pair<const char*, const std::string*> names[] = {
        {"data_dir", &layout.data_dir},
        {"lock_file", &layout.lock_file},
        {"entries.apiurl", &layout.apiurl},
        {"entries.project", &layout.project},
        {"entries.package", &layout.package},
        {"entries.packages", &layout.packages},
        {"entries.files", &layout.files},
    };
    const size_t count = sizeof(names) / sizeof(names[0]);
    for (size_t i = 0; i < count; ++i) {
        for (size_t j = i + 1; j < count; ++j) {
            if (*names[i].second == *names[j].second) {
                return fmt::format("store.{} and store.{} must differ, both are '{}'",
                                   names[i].first, names[j].first, *names[i].second);
            }
        }
    }
    return "";
}

// Overlay one scalar key onto a name, recording the first validation error.
static void overlay_name(const YAML::Node& node, const char* yaml_key,
                         const std::string& label, std::string& out,
                         std::string& error) {
    if (!node[yaml_key]) return;
    if (!node[yaml_key].IsScalar()) {
        if (error.empty()) error = fmt::format("store.{} must be a string", label);
        return;
    }
    std::string value = node[yaml_key].as<std::string>();
    std::string problem = validate_store_name(label, value);
    if (!problem.empty()) {
        if (error.empty()) error = problem;
        return;
    }
    out = value;
}

static Result<StoreLayout> parse_store_layout(const YAML::Node& store) {
    StoreLayout layout;
    if (!store || store.IsNull()) return Result<StoreLayout>::Ok(layout);
    if (!store.IsMap()) return Result<StoreLayout>::Err("store: must be a mapping");

    std::string error;
    overlay_name(store, "dir", "dir", layout.store_dir, error);
    overlay_name(store, "data_dir", "data_dir", layout.data_dir, error);
    overlay_name(store, "lock_file", "lock_file", layout.lock_file, error);

    const YAML::Node entries = store["entries"];
    if (entries) {
        if (!entries.IsMap()) return Result<StoreLayout>::Err("store.entries: must be a mapping");
        overlay_name(entries, "apiurl", "entries.apiurl", layout.apiurl, error);
        overlay_name(entries, "project", "entries.project", layout.project, error);
        overlay_name(entries, "package", "entries.package", layout.package, error);
        overlay_name(entries, "packages", "entries.packages", layout.packages, error);
        overlay_name(entries, "files", "entries.files", layout.files, error);
    }

    if (!error.empty()) return Result<StoreLayout>::Err(error);
    error = validate_store_layout(layout);
    if (!error.empty()) return Result<StoreLayout>::Err(error);
    return Result<StoreLayout>::Ok(layout);
}

static Result<Config> from_node(const YAML::Node& root) {
    Config config;
    if (!root || root.IsNull()) return Result<Config>::Ok(config);
    if (!root.IsMap()) return Result<Config>::Err("top level must be a mapping");

    auto layout = parse_store_layout(root["store"]);
    if (layout.is_err()) return Result<Config>::Err(layout.error);

    return Result<Config>::Ok(Config::from_layout(layout.value));
}

Config Config::from_layout(const StoreLayout& layout) {
    Config config;
    config.layout_ = layout;
    return config;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        return from_node(YAML::Load(yaml_text));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    try {
        auto result = from_node(YAML::LoadFile(path.string()));
        if (result.is_err()) {
            return Result<Config>::Err(fmt::format("{}: {}", path.string(), result.error));
        }
        result.value.source_ = path;
        return result;
    } catch (const std::exception& e) {
        return Result<Config>::Err(fmt::format("Failed to parse config {}: {}",
                                               path.string(), e.what()));
    }
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Ok(Config{});
    }
    return load_file(get_global_config_path());
}
