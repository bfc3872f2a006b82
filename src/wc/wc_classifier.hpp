#pragma once

#include <filesystem>
#include <core/types.hpp>

class MetadataStore;

// These never throw. A root without a store, or with a store whose entries
// fit neither pattern, is simply neither a project nor a package.
// Use MetadataStore::read to find out what exactly is wrong.

// apiurl and project present, package absent
bool wc_is_project(const MetadataStore& store, const std::filesystem::path& root);

// apiurl, project and package all present
bool wc_is_package(const MetadataStore& store, const std::filesystem::path& root);

WCKind classify_wc(const MetadataStore& store, const std::filesystem::path& root);

const char* wc_kind_name(WCKind kind);
