#pragma once

#include <filesystem>
#include <core/types.hpp>

class MetadataStore;

// Everything a command needs to address the remote side for this root.
// Unlike the classifier this is strict:
//   no store                  -> WCError NotAWorkingCopy
//   neither project/package   -> WCError Inconsistent (entries() = missing names)
WCContext load_wc_context(const MetadataStore& store, const std::filesystem::path& root);
