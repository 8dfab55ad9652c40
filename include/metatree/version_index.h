#pragma once

#include <metatree/logging.h>
#include <metatree/models.h>
#include <metatree/sharding.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace metatree {

// Immutable snapshot of the entries known for one (dataset_id,
// dataset_version). Each seal produces a new generation; older generations
// stay readable.
struct VersionIndex {
  using EntryMap = std::unordered_map<std::string, IndexEntry>;

  std::string dataset_id;
  std::string dataset_version;
  std::uint64_t generation = 0;
  // Store-wide seal counter of this generation and of the first generation
  // of this version. The latter orders versions of a dataset.
  std::uint64_t sequence = 0;
  std::uint64_t first_sequence = 0;
  double sealed_at = 0.0;
  // Dataset-level entries. "" is the dataset itself, other keys are the
  // paths of aggregated sub-datasets.
  EntryMap datasets;
  EntryMap files;

  const IndexEntry *DatasetLevel() const { return FindDataset(""); }
  const IndexEntry *FindDataset(const std::string &path) const;
  const IndexEntry *FindFile(const std::string &path) const;
  std::size_t Size() const { return datasets.size() + files.size(); }
};

nlohmann::json ToJson(const VersionIndex &index);
VersionIndex VersionIndexFromJson(const nlohmann::json &object);
nlohmann::json ToJson(const IndexEntry &entry);
IndexEntry IndexEntryFromJson(const nlohmann::json &object);

enum class VersionSelectorKind { kLatest, kAll, kExact };

struct VersionSelector {
  VersionSelectorKind kind = VersionSelectorKind::kLatest;
  std::string version;

  // "" and "latest" select the most recently sealed version, "*" all
  // versions, anything else the exact version.
  static VersionSelector Parse(std::string_view text);
  static VersionSelector Exact(std::string version) {
    return {VersionSelectorKind::kExact, std::move(version)};
  }
  static VersionSelector All() { return {VersionSelectorKind::kAll, {}}; }
};

struct IndexQuery {
  std::string dataset_id;
  std::string path_pattern = "*";
  VersionSelector versions;
  bool recursive = false;
};

struct ResolvedEntry {
  std::string dataset_id;
  std::string dataset_version;
  EntryKind kind = EntryKind::kFile;
  std::string path;
  IndexEntry entry;
};

enum class SealMode {
  // A version sealed for the first time starts from the entries of the
  // dataset's latest version.
  kInherit,
  // A version sealed for the first time starts empty.
  kFresh,
};

// Persists VersionIndex generations below a directory:
//   <uuid split>/<version key split>/generation-<n>.json
//   <uuid split>/<version key split>/HEAD
// Seals are serialized per store by an exclusive flock on LOCK and re-read
// HEAD before deriving the next generation, so concurrent seals never lose
// updates. On the same path the later seal wins.
class VersionIndexManager {
public:
  explicit VersionIndexManager(std::filesystem::path directory,
                               ShardParts dataset_shards = {2, 2, 2},
                               ShardParts version_shards = {2, 2},
                               std::shared_ptr<Logger> logger = nullptr);

  std::shared_ptr<const VersionIndex>
  Seal(const std::string &dataset_id, const std::string &dataset_version,
       const std::vector<IndexUpdate> &updates,
       SealMode mode = SealMode::kInherit);

  // nullptr if the version has never been sealed.
  std::shared_ptr<const VersionIndex>
  Head(const std::string &dataset_id,
       const std::string &dataset_version) const;
  // Throws NotFoundError for unknown generations.
  std::shared_ptr<const VersionIndex>
  LoadGeneration(const std::string &dataset_id,
                 const std::string &dataset_version,
                 std::uint64_t generation) const;

  std::vector<std::shared_ptr<const VersionIndex>> Heads() const;
  std::vector<std::string> DatasetIds() const;
  // In the order the versions were first sealed.
  std::vector<std::string> Versions(const std::string &dataset_id) const;
  std::optional<std::string> LatestVersion(const std::string &dataset_id) const;

  std::vector<ResolvedEntry> Resolve(const IndexQuery &query) const;
  std::vector<ResolvedEntry> Resolve(const std::string &dataset_id,
                                     const std::string &path_pattern,
                                     std::string_view version_pattern) const;

  const std::filesystem::path &Directory() const { return directory_; }

private:
  std::filesystem::path VersionDirectory(const std::string &dataset_id,
                                         const std::string &version) const;
  std::optional<std::uint64_t>
  ReadHeadGeneration(const std::filesystem::path &version_directory) const;
  std::shared_ptr<const VersionIndex>
  ReadSnapshot(const std::filesystem::path &path) const;
  std::uint64_t NextSequence();

  std::filesystem::path directory_;
  ShardParts dataset_shards_;
  ShardParts version_shards_;
  std::shared_ptr<Logger> logger_;
  std::mutex seal_mutex_;
  mutable std::mutex cache_mutex_;
  mutable std::map<std::pair<std::string, std::string>,
                   std::shared_ptr<const VersionIndex>>
      cache_;
};

} // namespace metatree
