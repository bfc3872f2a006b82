#include "wc_classifier.hpp"
#include "metadata_store.hpp"

static std::vector<std::string> missing_identity(const MetadataStore& store,
                                                 const std::filesystem::path& root) {
    return store.missing(root, {store.entry_name(MetadataEntry::Apiurl),
                                store.entry_name(MetadataEntry::Project),
                                store.entry_name(MetadataEntry::Package)});
}

bool wc_is_project(const MetadataStore& store, const std::filesystem::path& root) {
    auto absent = missing_identity(store, root);
    return absent.size() == 1 && absent[0] == store.entry_name(MetadataEntry::Package);
}

bool wc_is_package(const MetadataStore& store, const std::filesystem::path& root) {
    return missing_identity(store, root).empty();
}

WCKind classify_wc(const MetadataStore& store, const std::filesystem::path& root) {
    if (!store.has_store(root)) return WCKind::NotAWorkingCopy;
    if (wc_is_package(store, root)) return WCKind::Package;
    if (wc_is_project(store, root)) return WCKind::Project;
    return WCKind::Unknown;
}

const char* wc_kind_name(WCKind kind) {
    switch (kind) {
        case WCKind::NotAWorkingCopy: return "not a working copy";
        case WCKind::Project:         return "project";
        case WCKind::Package:         return "package";
        case WCKind::Unknown:         return "unknown";
    }
    return "unknown";
}
