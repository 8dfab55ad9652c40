#include <metatree/exporter.h>

#include <metatree/errors.h>
#include <metatree/object_store.h>
#include <metatree/record_codec.h>
#include <metatree/sharding.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <set>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace metatree {
namespace {

constexpr const char kExportId[] = "MetadataExport";
constexpr const char kVersionFile[] = "version.json";
constexpr const char kIndexFile[] = "index.json";
constexpr const char kDatasetLevelFile[] = "dataset-level-metadata.id";
constexpr const char kFileTreeFile[] = "file-tree.json";
constexpr const char kDatasetTreeFile[] = "dataset-tree.json";
constexpr const char kObjectDirectory[] = "objects";

const ShardParts kDatasetShards = {2, 2, 2};
const ShardParts kVersionShards = {2, 2};
const ShardParts kObjectShards = {2, 2};

std::filesystem::path IndexDirectory(const std::filesystem::path &root,
                                     const VersionIndex &index) {
  return root / ShardedPath(ShardKey(index.dataset_id, kDatasetShards),
                            kDatasetShards) /
         ShardedPath(ShardKey(index.dataset_version, kVersionShards),
                     kVersionShards);
}

std::filesystem::path ObjectPath(const std::filesystem::path &directory,
                                 const ObjectRef &ref) {
  auto path = directory / kObjectDirectory / ShardedPath(ref.Hex(), kObjectShards);
  path += ".json";
  return path;
}

std::string Pretty(const nlohmann::json &value) { return value.dump(2) + "\n"; }

void ExportIndex(const MetadataStore &store, const VersionIndex &index,
                 const std::filesystem::path &directory,
                 std::set<std::string> &written) {
  std::filesystem::create_directories(directory);

  auto file_tree = nlohmann::json::object();
  auto dataset_tree = nlohmann::json::object();
  const auto write_object = [&](const IndexEntry &entry) {
    const auto record = store.LoadRecord(entry.ref);
    const auto target = ObjectPath(directory, entry.ref);
    std::filesystem::create_directories(target.parent_path());
    WriteFileAtomically(target, Pretty(ToWireJson(record, entry.provenance)));
    written.insert(entry.ref.Hex());
  };

  for (const auto &[path, entry] : index.files) {
    write_object(entry);
    file_tree[path] = entry.ref.Hex();
  }
  for (const auto &[path, entry] : index.datasets) {
    write_object(entry);
    if (path.empty()) {
      WriteFileAtomically(directory / kDatasetLevelFile, entry.ref.Hex() + "\n");
    } else {
      dataset_tree[path] = entry.ref.Hex();
    }
  }
  WriteFileAtomically(directory / kFileTreeFile, Pretty(file_tree));
  if (!dataset_tree.empty()) {
    WriteFileAtomically(directory / kDatasetTreeFile, Pretty(dataset_tree));
  }
  WriteFileAtomically(directory / kIndexFile, Pretty(ToJson(index)));
}

void CheckExportLayout(const std::filesystem::path &source) {
  nlohmann::json descriptor;
  try {
    descriptor = nlohmann::json::parse(ReadFile(source / kVersionFile));
  } catch (const nlohmann::json::parse_error &error) {
    throw ConsistencyError("Malformed " + (source / kVersionFile).string() +
                           ": " + error.what());
  }
  if (!descriptor.is_object() || descriptor.value("@id", "") != kExportId) {
    throw ConsistencyError(source.string() + " is not a metadata export");
  }
  const auto version = descriptor.value("export_layout_version", "");
  if (version.substr(0, version.find('.')) !=
      std::string(kExportLayoutVersion).substr(0, 1)) {
    throw ConsistencyError("Unsupported export layout version '" + version +
                           "'");
  }
}

} // namespace

TransferSummary ExportStore(const MetadataStore &store,
                            const std::filesystem::path &destination,
                            std::shared_ptr<Logger> logger) {
  logger = EnsureLogger(std::move(logger));
  if (std::filesystem::exists(destination)) {
    throw ConfigurationError("Export destination " + destination.string() +
                             " already exists");
  }
  std::filesystem::create_directories(destination);
  WriteFileAtomically(destination / kVersionFile,
                      Pretty({{"@id", kExportId},
                              {"export_layout_version", kExportLayoutVersion}}));

  TransferSummary summary;
  std::set<std::string> written;
  for (const auto &index : store.Indices().Heads()) {
    ExportIndex(store, *index, IndexDirectory(destination, *index), written);
    ++summary.indices;
  }
  summary.objects = written.size();
  logger->Log(LogLevel::kInfo, "export.complete",
              {{"destination", destination.string()},
               {"indices", std::to_string(summary.indices)},
               {"objects", std::to_string(summary.objects)}});
  return summary;
}

TransferSummary ImportStore(MetadataStore &store,
                            const std::filesystem::path &source,
                            std::shared_ptr<Logger> logger) {
  logger = EnsureLogger(std::move(logger));
  CheckExportLayout(source);

  struct ExportedIndex {
    VersionIndex index;
    std::filesystem::path directory;
  };
  std::vector<ExportedIndex> exported;
  for (const auto &entry :
       std::filesystem::recursive_directory_iterator(source)) {
    if (!entry.is_regular_file() || entry.path().filename() != kIndexFile) {
      continue;
    }
    try {
      exported.push_back(ExportedIndex{
          VersionIndexFromJson(nlohmann::json::parse(ReadFile(entry.path()))),
          entry.path().parent_path()});
    } catch (const nlohmann::json::exception &error) {
      throw ConsistencyError("Malformed " + entry.path().string() + ": " +
                             error.what());
    }
  }
  // Sealing in the source store's order keeps the latest version latest.
  std::sort(exported.begin(), exported.end(),
            [](const ExportedIndex &left, const ExportedIndex &right) {
              return std::tie(left.index.first_sequence, left.index.sequence,
                              left.directory) <
                     std::tie(right.index.first_sequence, right.index.sequence,
                              right.directory);
            });

  TransferSummary summary;
  std::set<std::string> imported;
  for (const auto &item : exported) {
    const auto &index = item.index;
    const auto &directory = item.directory;
    std::vector<IndexUpdate> updates;
    const auto import_entries = [&](const VersionIndex::EntryMap &entries,
                                    EntryKind kind) {
      for (const auto &[path, entry] : entries) {
        const auto object = ObjectPath(directory, entry.ref);
        if (!std::filesystem::exists(object)) {
          throw ConsistencyError("Missing object " + entry.ref.Hex() + " in " +
                                 directory.string());
        }
        WireRecord wire;
        try {
          wire = ParseWireRecord(nlohmann::json::parse(ReadFile(object)));
        } catch (const nlohmann::json::parse_error &error) {
          throw ConsistencyError("Malformed object " + object.string() + ": " +
                                 error.what());
        } catch (const MetadataKeyError &error) {
          throw ConsistencyError("Malformed object " + object.string() + ": " +
                                 error.what());
        }
        if (store.PutRecord(wire.record) != entry.ref) {
          throw ConsistencyError("Object " + object.string() +
                                 " does not match its name");
        }
        imported.insert(entry.ref.Hex());
        updates.push_back(IndexUpdate{kind, path, entry});
      }
    };
    import_entries(index.datasets, EntryKind::kDataset);
    import_entries(index.files, EntryKind::kFile);
    if (!updates.empty()) {
      store.Indices().Seal(index.dataset_id, index.dataset_version, updates,
                           SealMode::kFresh);
    }
    ++summary.indices;
  }
  summary.objects = imported.size();
  logger->Log(LogLevel::kInfo, "import.complete",
              {{"source", source.string()},
               {"indices", std::to_string(summary.indices)},
               {"objects", std::to_string(summary.objects)}});
  return summary;
}

} // namespace metatree
