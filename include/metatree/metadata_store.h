#pragma once

#include <metatree/logging.h>
#include <metatree/metadata_path.h>
#include <metatree/models.h>
#include <metatree/object_store.h>
#include <metatree/sharding.h>
#include <metatree/version_index.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace metatree {

// Contents of <store>/version.json.
struct StoreLayout {
  static constexpr const char *kCurrentVersion = "1.0";

  std::string layout_version = kCurrentVersion;
  std::string digest = "sha1";
  ShardParts object_shards = {2, 2};
  ShardParts dataset_shards = {2, 2, 2};
  ShardParts version_shards = {2, 2};
};

nlohmann::json ToJson(const StoreLayout &layout);
// Throws ConsistencyError for malformed descriptors, newer major layout
// versions and unsupported digests.
StoreLayout StoreLayoutFromJson(const nlohmann::json &object);

struct DumpEntry {
  ResolvedEntry location;
  MetadataRecord record;
};

// Wire form of a dumped entry, provenance keys included.
nlohmann::json ToDumpJson(const DumpEntry &entry);

// Query answering a metadata address. Tree addresses are resolved in the
// index of root_dataset_id; an empty id is a ConfigurationError for them.
IndexQuery QueryForUrl(const MetadataUrl &url,
                       const std::string &root_dataset_id, bool recursive);

// Object store plus version indices of one dataset tree.
class MetadataStore {
  struct PrivateTag {};

public:
  // Creates the store if path does not exist or is an empty directory.
  static std::shared_ptr<MetadataStore>
  Open(const std::filesystem::path &path,
       std::shared_ptr<Logger> logger = nullptr);
  // Throws NotFoundError if there is no store at path.
  static std::shared_ptr<MetadataStore>
  OpenExisting(const std::filesystem::path &path,
               std::shared_ptr<Logger> logger = nullptr);
  static bool Exists(const std::filesystem::path &path);

  // Use Open or OpenExisting.
  MetadataStore(PrivateTag, std::filesystem::path root, StoreLayout layout,
                std::shared_ptr<Logger> logger);

  ObjectStore &Objects() { return objects_; }
  const ObjectStore &Objects() const { return objects_; }
  VersionIndexManager &Indices() { return indices_; }
  const VersionIndexManager &Indices() const { return indices_; }
  const StoreLayout &Layout() const { return layout_; }
  const std::filesystem::path &Root() const { return root_; }

  ObjectRef PutRecord(const MetadataRecord &record);

  // Stores record and indexes it under (dataset_id, dataset_version). A
  // record with a known root version is also indexed under (root_dataset_id,
  // root_dataset_version) below dataset_path. Returns the index of the
  // record's own version.
  std::shared_ptr<const VersionIndex>
  AddRecord(const MetadataRecord &record,
            const std::optional<Provenance> &provenance = std::nullopt);

  // Throws NotFoundError if the blob is absent, ConsistencyError if it does
  // not hold a record.
  MetadataRecord LoadRecord(const ObjectRef &ref) const;

  // Throws ConsistencyError on dangling references.
  std::vector<DumpEntry> Dump(const IndexQuery &query) const;

private:
  std::filesystem::path root_;
  StoreLayout layout_;
  std::shared_ptr<Logger> logger_;
  ObjectStore objects_;
  VersionIndexManager indices_;
};

} // namespace metatree
