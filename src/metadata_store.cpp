#include <metatree/metadata_store.h>

#include <metatree/errors.h>
#include <metatree/metadata_path.h>
#include <metatree/record_codec.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace metatree {
namespace {

constexpr const char kLayoutFile[] = "version.json";
constexpr const char kLayoutId[] = "MetadataStore";
constexpr const char kObjectsDirectory[] = "objects";
constexpr const char kDatasetsDirectory[] = "datasets";

int MajorVersion(const std::string &version) {
  try {
    return std::stoi(version.substr(0, version.find('.')));
  } catch (const std::logic_error &) {
    throw ConsistencyError("Malformed store layout version '" + version + "'");
  }
}

std::string EntryPath(const MetadataRecord &record) {
  return record.type == RecordType::kFile ? record.path.value_or("") : "";
}

EntryKind KindOf(const MetadataRecord &record) {
  return record.type == RecordType::kFile ? EntryKind::kFile
                                          : EntryKind::kDataset;
}

} // namespace

nlohmann::json ToJson(const StoreLayout &layout) {
  return {{"@id", kLayoutId},
          {"layout_version", layout.layout_version},
          {"digest", layout.digest},
          {"object_shards", layout.object_shards},
          {"dataset_shards", layout.dataset_shards},
          {"version_shards", layout.version_shards}};
}

StoreLayout StoreLayoutFromJson(const nlohmann::json &object) {
  StoreLayout layout;
  try {
    if (object.at("@id").get<std::string>() != kLayoutId) {
      throw ConsistencyError("Not a metadata store descriptor");
    }
    layout.layout_version = object.at("layout_version").get<std::string>();
    layout.digest = object.at("digest").get<std::string>();
    layout.object_shards = object.at("object_shards").get<ShardParts>();
    layout.dataset_shards = object.at("dataset_shards").get<ShardParts>();
    layout.version_shards = object.at("version_shards").get<ShardParts>();
  } catch (const nlohmann::json::exception &error) {
    throw ConsistencyError(std::string("Malformed store descriptor: ") +
                           error.what());
  }
  if (MajorVersion(layout.layout_version) >
      MajorVersion(StoreLayout::kCurrentVersion)) {
    throw ConsistencyError("Store layout version " + layout.layout_version +
                           " is newer than supported version " +
                           StoreLayout::kCurrentVersion);
  }
  if (layout.digest != "sha1") {
    throw ConsistencyError("Unsupported store digest '" + layout.digest + "'");
  }
  return layout;
}

nlohmann::json ToDumpJson(const DumpEntry &entry) {
  return ToWireJson(entry.record, entry.location.entry.provenance);
}

IndexQuery QueryForUrl(const MetadataUrl &url,
                       const std::string &root_dataset_id, bool recursive) {
  IndexQuery query;
  query.versions = VersionSelector::Parse(url.version.value_or(""));
  query.recursive = recursive;
  if (url.scheme == MetadataUrlScheme::kUuid) {
    query.dataset_id = url.dataset_id;
    query.path_pattern = url.local_path;
    return query;
  }
  if (root_dataset_id.empty()) {
    throw ConfigurationError("Tree addresses need a dataset");
  }
  query.dataset_id = root_dataset_id;
  query.path_pattern = JoinMetadataPath(url.dataset_path, url.local_path);
  return query;
}

MetadataStore::MetadataStore(PrivateTag, std::filesystem::path root,
                             StoreLayout layout,
                             std::shared_ptr<Logger> logger)
    : root_(std::move(root)), layout_(std::move(layout)),
      logger_(EnsureLogger(std::move(logger))),
      objects_(root_ / kObjectsDirectory, layout_.object_shards, logger_),
      indices_(root_ / kDatasetsDirectory, layout_.dataset_shards,
               layout_.version_shards, logger_) {}

bool MetadataStore::Exists(const std::filesystem::path &path) {
  return std::filesystem::exists(path / kLayoutFile);
}

std::shared_ptr<MetadataStore>
MetadataStore::OpenExisting(const std::filesystem::path &path,
                            std::shared_ptr<Logger> logger) {
  if (!Exists(path)) {
    throw NotFoundError("No metadata store at " + path.string());
  }
  return Open(path, std::move(logger));
}

std::shared_ptr<MetadataStore>
MetadataStore::Open(const std::filesystem::path &path,
                    std::shared_ptr<Logger> logger) {
  logger = EnsureLogger(std::move(logger));
  const auto descriptor = path / kLayoutFile;
  StoreLayout layout;
  if (std::filesystem::exists(descriptor)) {
    nlohmann::json object;
    try {
      object = nlohmann::json::parse(ReadFile(descriptor));
    } catch (const nlohmann::json::parse_error &error) {
      throw ConsistencyError("Unreadable store descriptor " +
                             descriptor.string() + ": " + error.what());
    }
    layout = StoreLayoutFromJson(object);
  } else {
    if (std::filesystem::exists(path) && !std::filesystem::is_empty(path)) {
      throw ConsistencyError(path.string() +
                             " is not empty and holds no metadata store");
    }
    std::filesystem::create_directories(path);
    WriteFileAtomically(descriptor, ToJson(layout).dump(2));
    logger->Log(LogLevel::kInfo, "store.create", {{"path", path.string()}});
  }
  return std::make_shared<MetadataStore>(PrivateTag{}, path, std::move(layout),
                                         std::move(logger));
}

ObjectRef MetadataStore::PutRecord(const MetadataRecord &record) {
  return objects_.Put(SerializeRecord(record));
}

std::shared_ptr<const VersionIndex>
MetadataStore::AddRecord(const MetadataRecord &record,
                         const std::optional<Provenance> &provenance) {
  const auto ref = PutRecord(record);
  const IndexEntry entry{ref, record.dataset_version, provenance};
  const auto kind = KindOf(record);
  const auto path = EntryPath(record);

  // Records of other datasets do not inherit the entries of this store's
  // latest version of that dataset.
  const auto mode = provenance ? SealMode::kFresh : SealMode::kInherit;
  auto sealed = indices_.Seal(record.dataset_id, record.dataset_version,
                              {IndexUpdate{kind, path, entry}}, mode);

  if (provenance && provenance->root_dataset_version) {
    indices_.Seal(provenance->root_dataset_id,
                  *provenance->root_dataset_version,
                  {IndexUpdate{kind,
                               JoinMetadataPath(provenance->dataset_path, path),
                               entry}});
  }
  return sealed;
}

MetadataRecord MetadataStore::LoadRecord(const ObjectRef &ref) const {
  return ParseRecord(objects_.Get(ref));
}

std::vector<DumpEntry> MetadataStore::Dump(const IndexQuery &query) const {
  std::vector<DumpEntry> entries;
  for (auto &location : indices_.Resolve(query)) {
    MetadataRecord record;
    try {
      record = LoadRecord(location.entry.ref);
    } catch (const NotFoundError &) {
      throw ConsistencyError("Dangling reference " + location.entry.ref.Hex() +
                             " for '" + location.path + "' in " +
                             location.dataset_id + "@" +
                             location.dataset_version);
    }
    entries.push_back(DumpEntry{std::move(location), std::move(record)});
  }
  return entries;
}

} // namespace metatree
