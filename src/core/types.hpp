#pragma once

#include <string>
#include <filesystem>
#include "constants.hpp"

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// The fixed metadata files kept inside a store
enum class MetadataEntry {
    Apiurl,
    Project,
    Package,
    Packages,
    Files,
};

// What a directory is, judged only by which entries are present
enum class WCKind {
    NotAWorkingCopy,   // no store at all
    Project,           // apiurl + project, no package
    Package,           // apiurl + project + package
    Unknown,           // store exists but matches neither pattern
};

// Names used on disk. Injected into MetadataStore so tests can use their own.
struct StoreLayout {
    std::string store_dir = DEFAULT_STORE_DIR;
    std::string data_dir = DEFAULT_DATA_DIR;
    std::string lock_file = DEFAULT_LOCK_FILE;

    std::string apiurl = "_apiurl";
    std::string project = "_project";
    std::string package = "_package";
    std::string packages = "_packages";
    std::string files = "_files";
};

// What a command needs to know about the working copy it runs in
struct WCContext {
    std::filesystem::path root;
    WCKind kind = WCKind::NotAWorkingCopy;
    std::string apiurl;
    std::string project;
    std::string package;    // empty for project working copies
};
