#pragma once

#include <metatree/logging.h>
#include <metatree/metadata_store.h>

#include <cstddef>
#include <filesystem>
#include <memory>

namespace metatree {

inline constexpr const char *kExportLayoutVersion = "1.0";

struct TransferSummary {
  std::size_t indices = 0;
  std::size_t objects = 0;
};

// Writes every dataset version of store below destination, which must not
// exist:
//   version.json
//   <uuid 2/2/2/rest>/<version 2/2/rest>/
//     dataset-level-metadata.id   ref of the dataset-level record
//     file-tree.json              path -> ref of file records
//     dataset-tree.json           path -> ref of aggregated dataset records
//     index.json                  the complete version index
//     objects/<2>/<2>/<rest>.json wire records, provenance included
TransferSummary ExportStore(const MetadataStore &store,
                            const std::filesystem::path &destination,
                            std::shared_ptr<Logger> logger = nullptr);

// Reads an export into store. Importing the same export twice changes
// nothing. Throws ConsistencyError for unknown layouts, missing objects and
// objects that do not match their ref.
TransferSummary ImportStore(MetadataStore &store,
                            const std::filesystem::path &source,
                            std::shared_ptr<Logger> logger = nullptr);

} // namespace metatree
