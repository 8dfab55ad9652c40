#include <metatree/aggregator.h>

#include <metatree/errors.h>
#include <metatree/metadata_path.h>

#include <algorithm>
#include <deque>
#include <stdexcept>
#include <utility>

namespace metatree {
namespace {

struct CopyPlan {
  Provenance provenance;
  // Path of the entry relative to the root, set when containment is proven.
  std::optional<std::string> root_path;
};

// Decides how an entry of index (dataset_id, dataset_version) in the
// sub-dataset's store is annotated in the root store.
CopyPlan PlanCopy(const AggregationEdge &edge, const std::string &dataset_id,
                  const std::string &dataset_version, const std::string &path,
                  const IndexEntry &entry) {
  CopyPlan plan;
  plan.provenance.root_dataset_id = edge.root_dataset_id;
  plan.provenance.dataset_path = edge.sub_path;

  const bool own_index = dataset_id == edge.sub_dataset_id &&
                         dataset_version == edge.sub_dataset_version;
  if (entry.provenance) {
    const auto &inner = *entry.provenance;
    plan.provenance.dataset_path =
        JoinMetadataPath(edge.sub_path, inner.dataset_path);
    const bool proven = inner.root_dataset_id == edge.sub_dataset_id &&
                        inner.root_dataset_version == edge.sub_dataset_version;
    if (proven) {
      // Inside the sub-dataset's own index paths are already relative to it.
      plan.root_path = own_index
                           ? JoinMetadataPath(edge.sub_path, path)
                           : JoinMetadataPath(plan.provenance.dataset_path, path);
    }
  } else if (own_index && entry.version == edge.sub_dataset_version) {
    plan.root_path = JoinMetadataPath(edge.sub_path, path);
  }

  if (plan.root_path) {
    plan.provenance.root_dataset_version = edge.root_dataset_version;
  }
  return plan;
}

// A copy made by an earlier aggregation may have been proven against an
// earlier root version. Keeps that proof when the entry is unchanged.
void KeepEarlierProof(const VersionIndex *previous, EntryKind kind,
                      const std::string &path, const IndexEntry &entry,
                      CopyPlan &plan) {
  if (plan.root_path || !previous) {
    return;
  }
  const auto *earlier = kind == EntryKind::kDataset
                            ? previous->FindDataset(path)
                            : previous->FindFile(path);
  if (earlier && earlier->ref == entry.ref && earlier->provenance &&
      earlier->provenance->root_dataset_version &&
      earlier->provenance->root_dataset_id ==
          plan.provenance.root_dataset_id) {
    plan.provenance = *earlier->provenance;
  }
}

bool IsSelected(const std::string &path, const AggregateOptions &options) {
  if (options.paths.empty()) {
    return true;
  }
  return std::any_of(options.paths.begin(), options.paths.end(),
                     [&](const std::string &selected) {
                       return IsPathBelow(path, NormalizeRelativePath(selected));
                     });
}

// True if a selected path lies below path, so its sub-datasets must be
// visited.
bool LeadsToSelection(const std::string &path,
                      const AggregateOptions &options) {
  return std::any_of(options.paths.begin(), options.paths.end(),
                     [&](const std::string &selected) {
                       return IsPathBelow(NormalizeRelativePath(selected), path);
                     });
}

} // namespace

nlohmann::json ToJson(const SubdatasetAggregation &result) {
  nlohmann::json object = {{"path", result.path},
                           {"dataset_id", result.dataset_id},
                           {"dataset_version", result.dataset_version},
                           {"status", result.ok ? "ok" : "error"},
                           {"copied_entries", result.copied_entries},
                           {"ambiguous_entries", result.ambiguous_entries}};
  if (!result.error.empty()) {
    object["message"] = result.error;
  }
  if (!result.entry_errors.empty()) {
    object["entry_errors"] = result.entry_errors;
  }
  return object;
}

std::size_t AggregationReport::FailedCount() const {
  return static_cast<std::size_t>(
      std::count_if(subdatasets.begin(), subdatasets.end(),
                    [](const SubdatasetAggregation &sub) { return !sub.ok; }));
}

StoreOpener DefaultStoreOpener(std::shared_ptr<Logger> logger) {
  return [logger = EnsureLogger(std::move(logger))](
             const DatasetRepository &dataset) {
    return MetadataStore::OpenExisting(dataset.MetadataStorePath(), logger);
  };
}

Aggregator::Aggregator(std::shared_ptr<MetadataStore> root_store,
                       std::shared_ptr<Logger> logger, StoreOpener opener)
    : root_store_(std::move(root_store)),
      logger_(EnsureLogger(std::move(logger))), opener_(std::move(opener)) {
  if (!root_store_) {
    throw std::invalid_argument("Aggregator needs a root store");
  }
  if (!opener_) {
    opener_ = DefaultStoreOpener(logger_);
  }
}

SubdatasetAggregation
Aggregator::AggregateSubdataset(const AggregationEdge &edge,
                                const MetadataStore &sub_store) {
  SubdatasetAggregation result;
  result.path = edge.sub_path;
  result.dataset_id = edge.sub_dataset_id;
  result.dataset_version = edge.sub_dataset_version;

  std::vector<IndexUpdate> root_updates;
  for (const auto &index : sub_store.Indices().Heads()) {
    const auto previous =
        root_store_->Indices().Head(index->dataset_id, index->dataset_version);
    std::vector<IndexUpdate> copies;
    const auto copy_entries = [&](const VersionIndex::EntryMap &entries,
                                  EntryKind kind) {
      for (const auto &[path, entry] : entries) {
        const auto content = sub_store.Objects().TryGet(entry.ref);
        if (!content) {
          result.entry_errors.push_back(
              "Dangling reference " + entry.ref.Hex() + " for '" + path +
              "' in " + index->dataset_id + "@" + index->dataset_version);
          continue;
        }
        if (root_store_->Objects().Put(*content) != entry.ref) {
          result.entry_errors.push_back("Object " + entry.ref.Hex() +
                                        " does not match its digest");
          continue;
        }
        auto plan = PlanCopy(edge, index->dataset_id, index->dataset_version,
                             path, entry);
        KeepEarlierProof(previous.get(), kind, path, entry, plan);
        if (plan.root_path) {
          root_updates.push_back(IndexUpdate{
              kind, *plan.root_path,
              IndexEntry{entry.ref, entry.version, plan.provenance}});
        } else if (plan.provenance.IsAmbiguous()) {
          ++result.ambiguous_entries;
        }
        copies.push_back(IndexUpdate{
            kind, path, IndexEntry{entry.ref, entry.version, plan.provenance}});
        ++result.copied_entries;
      }
    };
    copy_entries(index->datasets, EntryKind::kDataset);
    copy_entries(index->files, EntryKind::kFile);
    if (!copies.empty()) {
      root_store_->Indices().Seal(index->dataset_id, index->dataset_version,
                                  copies, SealMode::kFresh);
    }
  }
  if (!root_updates.empty()) {
    root_store_->Indices().Seal(edge.root_dataset_id, edge.root_dataset_version,
                                root_updates);
  }
  result.ok = result.entry_errors.empty();
  if (!result.ok) {
    result.error = std::to_string(result.entry_errors.size()) +
                   " entries could not be copied";
  }
  return result;
}

AggregationReport
Aggregator::Aggregate(std::shared_ptr<const DatasetRepository> root,
                      const AggregateOptions &options) {
  if (!root) {
    throw std::invalid_argument("Aggregation needs a root dataset");
  }
  AggregationReport report;
  report.root_dataset_id = root->Id();
  report.root_dataset_version = root->Version();
  logger_->Log(LogLevel::kInfo, "aggregate.start",
               {{"dataset_id", root->Id()},
                {"dataset_version", root->Version()}});

  struct Pending {
    std::shared_ptr<const DatasetRepository> parent;
    std::string parent_path;
    SubdatasetLink link;
    std::size_t depth;
  };
  std::deque<Pending> pending;
  const auto enqueue_links = [&](std::shared_ptr<const DatasetRepository> parent,
                                 const std::string &parent_path,
                                 std::vector<SubdatasetLink> links,
                                 std::size_t depth) {
    for (auto &link : links) {
      pending.push_back(Pending{parent, parent_path, std::move(link), depth});
    }
  };
  const auto within_depth = [&](std::size_t depth) {
    return !options.depth || depth <= *options.depth;
  };

  if (within_depth(1)) {
    enqueue_links(root, "", root->Subdatasets(), 1);
  }

  while (!pending.empty()) {
    auto next = std::move(pending.front());
    pending.pop_front();
    const auto sub_path = JoinMetadataPath(next.parent_path, next.link.path);
    const bool selected = IsSelected(sub_path, options);
    if (!selected && !LeadsToSelection(sub_path, options)) {
      continue;
    }

    SubdatasetAggregation result;
    result.path = sub_path;
    result.dataset_id = next.link.dataset_id;
    result.dataset_version = next.link.dataset_version;
    std::shared_ptr<const DatasetRepository> sub;
    std::vector<SubdatasetLink> children;
    if (!next.link.error.empty()) {
      result.ok = false;
      result.error = next.link.error;
    } else {
      // Anything that goes wrong below fails this sub-dataset only.
      try {
        sub = next.parent->OpenSubdataset(next.link.path);
        if (selected) {
          const auto sub_store = opener_(*sub);
          const AggregationEdge edge{root->Id(), root->Version(), sub_path,
                                     sub->Id(), sub->Version()};
          result = AggregateSubdataset(edge, *sub_store);
        }
        if (within_depth(next.depth + 1)) {
          children = sub->Subdatasets();
        }
      } catch (const std::exception &error) {
        result.ok = false;
        result.error = error.what();
      }
    }

    if (!result.ok) {
      logger_->Log(LogLevel::kWarn, "aggregate.subdataset.error",
                   {{"path", sub_path}, {"error", result.error}});
    } else if (selected) {
      logger_->Log(LogLevel::kInfo, "aggregate.subdataset",
                   {{"path", sub_path},
                    {"copied", std::to_string(result.copied_entries)},
                    {"ambiguous", std::to_string(result.ambiguous_entries)}});
    }
    if (selected || !result.ok) {
      report.subdatasets.push_back(std::move(result));
    }
    if (sub) {
      enqueue_links(sub, sub_path, std::move(children), next.depth + 1);
    }
  }

  logger_->Log(LogLevel::kInfo, "aggregate.complete",
               {{"subdatasets", std::to_string(report.subdatasets.size())},
                {"failed", std::to_string(report.FailedCount())}});
  return report;
}

} // namespace metatree
