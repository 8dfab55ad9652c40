#include <metatree/providers.h>

#include <metatree/errors.h>
#include <metatree/metadata_path.h>

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace metatree {
namespace {

std::unique_ptr<std::istream> OpenInput(const std::filesystem::path &path) {
  auto stream = std::make_unique<std::ifstream>(path);
  if (!*stream) {
    throw NotFoundError("Cannot open " + path.string());
  }
  return stream;
}

} // namespace

TraversalOptions TraversalOptionsFromArguments(const StageArguments &arguments,
                                               TraversalOptions defaults) {
  auto options = defaults;
  if (const auto item_type = StringArgument(arguments, "item_type")) {
    if (*item_type == "dataset") {
      options.report_datasets = true;
      options.report_files = false;
    } else if (*item_type == "file") {
      options.report_datasets = false;
      options.report_files = true;
    } else if (*item_type == "both") {
      options.report_datasets = true;
      options.report_files = true;
    } else {
      throw ConfigurationError("item_type must be dataset, file or both, got '" +
                               *item_type + "'");
    }
  }
  options.recursive = BoolArgument(arguments, "recursive", options.recursive);
  options.traverse_subdatasets = BoolArgument(
      arguments, "traverse_subdatasets", options.traverse_subdatasets);
  if (const auto depth = SizeArgument(arguments, "subdataset_depth")) {
    options.subdataset_depth = *depth;
  }
  return options;
}

DatasetTraverser::DatasetTraverser(
    std::shared_ptr<const DatasetRepository> root, TraversalOptions options,
    std::shared_ptr<Logger> logger)
    : options_(options), logger_(EnsureLogger(std::move(logger))) {
  if (!root) {
    throw ConfigurationError("dataset-traversal needs a dataset");
  }
  pending_.push_back(Frame{std::move(root), "", 0});
}

bool DatasetTraverser::ShouldEnter(const Frame &parent) const {
  return options_.traverse_subdatasets &&
         (!options_.subdataset_depth ||
          parent.depth < *options_.subdataset_depth);
}

bool DatasetTraverser::EnterNextDataset() {
  if (pending_.empty()) {
    return false;
  }
  current_ = std::move(pending_.front());
  pending_.pop_front();
  const auto &dataset = *current_.dataset;
  listings_.clear();
  listings_.push_back(Listing{dataset.List(""), 0});
  // The dataset's own item comes before its contents.
  listings_.push_back(Listing{{TreeEntry{dataset.Root(), "",
                                         TreeEntryType::kDataset, dataset.Id(),
                                         dataset.Version(), "", ""}},
                              0});
  logger_->Log(LogLevel::kDebug, "traverse.dataset",
               {{"dataset_path", current_.dataset_path},
                {"dataset_id", dataset.Id()}});
  return true;
}

std::optional<WorkItem> DatasetTraverser::Next() {
  while (true) {
    if (listings_.empty()) {
      if (!EnterNextDataset()) {
        return std::nullopt;
      }
      continue;
    }
    auto &listing = listings_.back();
    if (listing.position >= listing.entries.size()) {
      listings_.pop_back();
      continue;
    }
    auto entry = std::move(listing.entries[listing.position++]);

    if (entry.type == TreeEntryType::kDirectory) {
      // Sub-datasets may sit below plain directories.
      if (options_.recursive || ShouldEnter(current_)) {
        listings_.push_back(Listing{current_.dataset->List(entry.path), 0});
      }
      continue;
    }

    if (entry.type == TreeEntryType::kDataset && !entry.path.empty()) {
      if (ShouldEnter(current_)) {
        pending_.push_back(Frame{current_.dataset->OpenSubdataset(entry.path),
                                 JoinMetadataPath(current_.dataset_path,
                                                  entry.path),
                                 current_.depth + 1});
      }
      continue;
    }

    entry.path = JoinMetadataPath(current_.dataset_path, entry.path);
    entry.dataset_path =
        JoinMetadataPath(current_.dataset_path, entry.dataset_path);

    if (entry.type == TreeEntryType::kDataset) {
      if (!options_.report_datasets) {
        continue;
      }
      WorkItem item;
      item.kind = WorkItemKind::kDataset;
      item.path = entry.path.empty() ? "." : entry.path;
      item.entry = std::move(entry);
      item.dataset = current_.dataset;
      return item;
    }

    if (!options_.report_files ||
        (!options_.recursive &&
         entry.intra_dataset_path.find('/') != std::string::npos)) {
      continue;
    }
    WorkItem item;
    item.kind = WorkItemKind::kFile;
    item.path = entry.path;
    item.entry = std::move(entry);
    item.dataset = current_.dataset;
    return item;
  }
}

MetadataTraverser::MetadataTraverser(
    std::shared_ptr<const MetadataStore> store, IndexQuery query,
    std::shared_ptr<const DatasetRepository> dataset,
    std::shared_ptr<Logger> logger)
    : store_(std::move(store)), query_(std::move(query)),
      dataset_(std::move(dataset)), logger_(EnsureLogger(std::move(logger))) {
  if (!store_) {
    throw ConfigurationError("metadata-traversal needs a metadata store");
  }
}

std::optional<WorkItem> MetadataTraverser::Next() {
  if (!locations_) {
    auto resolved = store_->Indices().Resolve(query_);
    locations_.emplace(std::make_move_iterator(resolved.begin()),
                       std::make_move_iterator(resolved.end()));
    logger_->Log(LogLevel::kDebug, "traverse.metadata",
                 {{"dataset_id", query_.dataset_id},
                  {"pattern", query_.path_pattern},
                  {"entries", std::to_string(locations_->size())}});
  }
  if (locations_->empty()) {
    return std::nullopt;
  }
  auto location = std::move(locations_->front());
  locations_->pop_front();

  MetadataRecord record;
  try {
    record = store_->LoadRecord(location.entry.ref);
  } catch (const NotFoundError &) {
    throw ConsistencyError("Dangling reference " + location.entry.ref.Hex() +
                           " for '" + location.path + "' in " +
                           location.dataset_id + "@" +
                           location.dataset_version);
  }
  WorkItem item;
  item.kind = WorkItemKind::kRecord;
  item.path = location.dataset_id + "@" + location.dataset_version + ":" +
              (location.path.empty() ? "." : location.path);
  item.dataset = dataset_;
  item.record = ToDumpJson(DumpEntry{std::move(location), std::move(record)});
  return item;
}

IndexQuery MetadataQueryFromArguments(const StageArguments &arguments,
                                      const DatasetRepository *dataset) {
  MetadataUrl url;
  try {
    url = ParseMetadataUrl(StringArgument(arguments, "pattern").value_or(""));
  } catch (const std::invalid_argument &error) {
    throw ConfigurationError(std::string("metadata-traversal pattern: ") +
                             error.what());
  }
  return QueryForUrl(url, dataset != nullptr ? dataset->Id() : std::string(),
                     BoolArgument(arguments, "recursive", false));
}

JsonLinesProvider::JsonLinesProvider(
    std::istream &stream, std::shared_ptr<const DatasetRepository> dataset)
    : reader_(stream), dataset_(std::move(dataset)) {}

JsonLinesProvider::JsonLinesProvider(
    const std::filesystem::path &path,
    std::shared_ptr<const DatasetRepository> dataset)
    : owned_stream_(OpenInput(path)), reader_(*owned_stream_),
      dataset_(std::move(dataset)) {}

std::optional<WorkItem> JsonLinesProvider::Next() {
  auto record = reader_.Next();
  if (!record) {
    return std::nullopt;
  }
  WorkItem item;
  item.kind = WorkItemKind::kRecord;
  item.path = "line " + std::to_string(reader_.LineNumber());
  item.dataset = dataset_;
  item.record = std::move(record);
  return item;
}

} // namespace metatree
