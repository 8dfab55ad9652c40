#pragma once

#include <metatree/dataset_repository.h>
#include <metatree/logging.h>
#include <metatree/metadata_store.h>
#include <metatree/pipeline.h>
#include <metatree/record_codec.h>

#include <cstddef>
#include <deque>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace metatree {

struct TraversalOptions {
  bool report_datasets = true;
  bool report_files = true;
  // Descend into sub-directories of a dataset.
  bool recursive = true;
  bool traverse_subdatasets = false;
  // Sub-dataset levels to enter; unlimited if absent.
  std::optional<std::size_t> subdataset_depth;
};

// Stage arguments: item_type (dataset|file|both), recursive,
// traverse_subdatasets, subdataset_depth.
TraversalOptions TraversalOptionsFromArguments(const StageArguments &arguments,
                                               TraversalOptions defaults = {});

// Walks a dataset and, optionally, its sub-datasets one dataset at a time.
// Datasets are entered in breadth-first order. Within a dataset only the
// directories on the path to the next item are listed, depth-first in name
// order.
class DatasetTraverser : public Provider {
public:
  DatasetTraverser(std::shared_ptr<const DatasetRepository> root,
                   TraversalOptions options,
                   std::shared_ptr<Logger> logger = nullptr);

  std::string Name() const override { return "dataset-traversal"; }
  std::optional<WorkItem> Next() override;

private:
  struct Frame {
    std::shared_ptr<const DatasetRepository> dataset;
    std::string dataset_path;
    std::size_t depth = 0;
  };

  struct Listing {
    std::vector<TreeEntry> entries;
    std::size_t position = 0;
  };

  bool EnterNextDataset();
  bool ShouldEnter(const Frame &parent) const;

  TraversalOptions options_;
  std::shared_ptr<Logger> logger_;
  std::deque<Frame> pending_;
  Frame current_;
  // Open directories of the current dataset, innermost last.
  std::vector<Listing> listings_;
};

// One record item per non-empty line of a JSON Lines stream. Malformed
// lines fail the run.
class JsonLinesProvider : public Provider {
public:
  JsonLinesProvider(std::istream &stream,
                    std::shared_ptr<const DatasetRepository> dataset);
  // Throws NotFoundError if path cannot be opened.
  JsonLinesProvider(const std::filesystem::path &path,
                    std::shared_ptr<const DatasetRepository> dataset);

  std::string Name() const override { return "json-lines"; }
  std::optional<WorkItem> Next() override;

private:
  std::unique_ptr<std::istream> owned_stream_;
  JsonLinesReader reader_;
  std::shared_ptr<const DatasetRepository> dataset_;
};

// One record item per entry a query resolves to in a store. Entries are
// resolved on the first call to Next(); each record is loaded when its item
// is handed out. Dangling references fail the run.
class MetadataTraverser : public Provider {
public:
  // Throws ConfigurationError without a store.
  MetadataTraverser(std::shared_ptr<const MetadataStore> store,
                    IndexQuery query,
                    std::shared_ptr<const DatasetRepository> dataset,
                    std::shared_ptr<Logger> logger = nullptr);

  std::string Name() const override { return "metadata-traversal"; }
  std::optional<WorkItem> Next() override;

private:
  std::shared_ptr<const MetadataStore> store_;
  IndexQuery query_;
  std::shared_ptr<const DatasetRepository> dataset_;
  std::shared_ptr<Logger> logger_;
  std::optional<std::deque<ResolvedEntry>> locations_;
};

// Stage arguments: pattern (a metadata address, the root dataset if absent)
// and recursive.
IndexQuery MetadataQueryFromArguments(const StageArguments &arguments,
                                      const DatasetRepository *dataset);

} // namespace metatree
