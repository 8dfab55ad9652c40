#pragma once

#include <metatree/dataset_repository.h>
#include <metatree/logging.h>
#include <metatree/metadata_store.h>
#include <metatree/models.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace metatree {

struct AggregateOptions {
  // Sub-dataset levels below the root to visit; unlimited if absent.
  std::optional<std::size_t> depth;
  // Restricts aggregation to these sub-dataset paths and the sub-datasets
  // below them. Empty means all.
  std::vector<std::string> paths;
};

struct SubdatasetAggregation {
  std::string path;
  std::string dataset_id;
  std::string dataset_version;
  bool ok = true;
  std::string error;
  std::size_t copied_entries = 0;
  // Copied entries whose containment in the root version is unknown.
  std::size_t ambiguous_entries = 0;
  std::vector<std::string> entry_errors;
};

nlohmann::json ToJson(const SubdatasetAggregation &result);

struct AggregationReport {
  std::string root_dataset_id;
  std::string root_dataset_version;
  std::vector<SubdatasetAggregation> subdatasets;

  std::size_t FailedCount() const;
};

// Opens the metadata store of a sub-dataset. Throws NotFoundError if it has
// none.
using StoreOpener =
    std::function<std::shared_ptr<MetadataStore>(const DatasetRepository &)>;

StoreOpener DefaultStoreOpener(std::shared_ptr<Logger> logger = nullptr);

// Copies the version indices and objects of sub-dataset stores into the
// store of the root dataset. An entry is asserted as contained in the root
// version only if it was produced by the sub-dataset version that is
// currently at its path (or was proven contained in that version by an
// earlier aggregation). Every other copied entry keeps root_dataset_version
// empty.
class Aggregator {
public:
  explicit Aggregator(std::shared_ptr<MetadataStore> root_store,
                      std::shared_ptr<Logger> logger = nullptr,
                      StoreOpener opener = nullptr);

  // Failures of one sub-dataset are reported in its result and do not stop
  // the others.
  AggregationReport Aggregate(std::shared_ptr<const DatasetRepository> root,
                              const AggregateOptions &options = {});

  // Copies everything in sub_store. Dangling references fail single entries;
  // index errors of the root store propagate.
  SubdatasetAggregation AggregateSubdataset(const AggregationEdge &edge,
                                            const MetadataStore &sub_store);

private:
  std::shared_ptr<MetadataStore> root_store_;
  std::shared_ptr<Logger> logger_;
  StoreOpener opener_;
};

} // namespace metatree
