#include "wc_context.hpp"
#include "metadata_store.hpp"
#include "wc_classifier.hpp"
#include <core/wc_error.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

WCContext load_wc_context(const MetadataStore& store, const std::filesystem::path& root) {
    WCContext ctx;
    ctx.root = root;
    ctx.kind = classify_wc(store, root);

    switch (ctx.kind) {
        case WCKind::NotAWorkingCopy:
            throw WCError(WCErrorKind::NotAWorkingCopy,
                          fmt::format("'{}' is not a working copy", root.string()), root);

        case WCKind::Unknown: {
            auto absent = store.missing(root, {store.entry_name(MetadataEntry::Apiurl),
                                               store.entry_name(MetadataEntry::Project),
                                               store.entry_name(MetadataEntry::Package)});
            throw WCError(WCErrorKind::Inconsistent,
                          fmt::format("working copy '{}' is inconsistent (missing: {})",
                                      root.string(), fmt::join(absent, ", ")),
                          root, absent);
        }

        case WCKind::Package:
            ctx.package = store.read_package(root);
            [[fallthrough]];
        case WCKind::Project:
            ctx.apiurl = store.read_apiurl(root);
            ctx.project = store.read_project(root);
            break;
    }
    return ctx;
}
