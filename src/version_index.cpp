#include <metatree/version_index.h>

#include <metatree/errors.h>
#include <metatree/metadata_path.h>
#include <metatree/object_store.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <tuple>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace metatree {
namespace {

constexpr const char kHeadFile[] = "HEAD";
constexpr const char kLockFile[] = "LOCK";
constexpr const char kSequenceFile[] = "SEQUENCE";
constexpr const char kSnapshotPrefix[] = "generation-";
constexpr const char kSnapshotSuffix[] = ".json";

// Exclusive advisory lock held for the lifetime of the object.
class FileLock {
public:
  explicit FileLock(const std::filesystem::path &path) {
    std::filesystem::create_directories(path.parent_path());
    descriptor_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (descriptor_ < 0) {
      throw std::system_error(errno, std::generic_category(),
                              "Cannot open lock " + path.string());
    }
    while (::flock(descriptor_, LOCK_EX) != 0) {
      if (errno != EINTR) {
        const int error = errno;
        ::close(descriptor_);
        throw std::system_error(error, std::generic_category(),
                                "Cannot lock " + path.string());
      }
    }
  }
  ~FileLock() {
    ::flock(descriptor_, LOCK_UN);
    ::close(descriptor_);
  }
  FileLock(const FileLock &) = delete;
  FileLock &operator=(const FileLock &) = delete;

private:
  int descriptor_ = -1;
};

std::string SnapshotName(std::uint64_t generation) {
  return kSnapshotPrefix + std::to_string(generation) + kSnapshotSuffix;
}

double SecondsSinceEpoch() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration<double>(now).count();
}

nlohmann::json EntriesToJson(const VersionIndex::EntryMap &entries) {
  auto object = nlohmann::json::object();
  for (const auto &[path, entry] : entries) {
    object[path] = ToJson(entry);
  }
  return object;
}

VersionIndex::EntryMap EntriesFromJson(const nlohmann::json &object) {
  VersionIndex::EntryMap entries;
  for (const auto &item : object.items()) {
    entries.emplace(item.key(), IndexEntryFromJson(item.value()));
  }
  return entries;
}

void CollectMatches(const VersionIndex &index, EntryKind kind,
                    const VersionIndex::EntryMap &entries,
                    const GlobPattern &pattern, bool recursive,
                    std::vector<ResolvedEntry> &results) {
  for (const auto &[path, entry] : entries) {
    const bool matches =
        recursive ? pattern.MatchesRecursive(path) : pattern.Matches(path);
    if (matches) {
      results.push_back(ResolvedEntry{index.dataset_id, index.dataset_version,
                                      kind, path, entry});
    }
  }
}

} // namespace

const IndexEntry *VersionIndex::FindDataset(const std::string &path) const {
  const auto found = datasets.find(path);
  return found == datasets.end() ? nullptr : &found->second;
}

const IndexEntry *VersionIndex::FindFile(const std::string &path) const {
  const auto found = files.find(path);
  return found == files.end() ? nullptr : &found->second;
}

nlohmann::json ToJson(const IndexEntry &entry) {
  nlohmann::json object = {{"ref", entry.ref.Hex()},
                           {"version", entry.version}};
  if (entry.provenance) {
    const auto &provenance = *entry.provenance;
    object["provenance"] = {
        {"root_dataset_id", provenance.root_dataset_id},
        {"root_dataset_version",
         provenance.root_dataset_version
             ? nlohmann::json(*provenance.root_dataset_version)
             : nlohmann::json(nullptr)},
        {"dataset_path", provenance.dataset_path}};
  }
  return object;
}

IndexEntry IndexEntryFromJson(const nlohmann::json &object) {
  IndexEntry entry;
  entry.ref = ObjectRef::FromHex(object.at("ref").get<std::string>());
  entry.version = object.at("version").get<std::string>();
  if (object.contains("provenance")) {
    const auto &source = object.at("provenance");
    Provenance provenance;
    provenance.root_dataset_id = source.at("root_dataset_id").get<std::string>();
    if (!source.at("root_dataset_version").is_null()) {
      provenance.root_dataset_version =
          source.at("root_dataset_version").get<std::string>();
    }
    provenance.dataset_path = source.at("dataset_path").get<std::string>();
    entry.provenance = std::move(provenance);
  }
  return entry;
}

nlohmann::json ToJson(const VersionIndex &index) {
  return {{"dataset_id", index.dataset_id},
          {"dataset_version", index.dataset_version},
          {"generation", index.generation},
          {"sequence", index.sequence},
          {"first_sequence", index.first_sequence},
          {"sealed_at", index.sealed_at},
          {"datasets", EntriesToJson(index.datasets)},
          {"files", EntriesToJson(index.files)}};
}

VersionIndex VersionIndexFromJson(const nlohmann::json &object) {
  VersionIndex index;
  index.dataset_id = object.at("dataset_id").get<std::string>();
  index.dataset_version = object.at("dataset_version").get<std::string>();
  index.generation = object.at("generation").get<std::uint64_t>();
  index.sequence = object.at("sequence").get<std::uint64_t>();
  index.first_sequence = object.at("first_sequence").get<std::uint64_t>();
  index.sealed_at = object.at("sealed_at").get<double>();
  index.datasets = EntriesFromJson(object.at("datasets"));
  index.files = EntriesFromJson(object.at("files"));
  return index;
}

VersionSelector VersionSelector::Parse(std::string_view text) {
  if (text.empty() || text == "latest") {
    return {};
  }
  if (text == "*") {
    return All();
  }
  return Exact(std::string(text));
}

VersionIndexManager::VersionIndexManager(std::filesystem::path directory,
                                         ShardParts dataset_shards,
                                         ShardParts version_shards,
                                         std::shared_ptr<Logger> logger)
    : directory_(std::move(directory)),
      dataset_shards_(std::move(dataset_shards)),
      version_shards_(std::move(version_shards)),
      logger_(EnsureLogger(std::move(logger))) {}

std::filesystem::path
VersionIndexManager::VersionDirectory(const std::string &dataset_id,
                                      const std::string &version) const {
  return directory_ /
         ShardedPath(ShardKey(dataset_id, dataset_shards_), dataset_shards_) /
         ShardedPath(ShardKey(version, version_shards_), version_shards_);
}

std::optional<std::uint64_t> VersionIndexManager::ReadHeadGeneration(
    const std::filesystem::path &version_directory) const {
  const auto head_path = version_directory / kHeadFile;
  if (!std::filesystem::exists(head_path)) {
    return std::nullopt;
  }
  const auto content = ReadFile(head_path);
  try {
    return std::stoull(content);
  } catch (const std::logic_error &) {
    throw ConsistencyError("Unreadable index head " + head_path.string());
  }
}

std::shared_ptr<const VersionIndex>
VersionIndexManager::ReadSnapshot(const std::filesystem::path &path) const {
  const auto content = ReadFile(path);
  try {
    return std::make_shared<const VersionIndex>(
        VersionIndexFromJson(nlohmann::json::parse(content)));
  } catch (const nlohmann::json::exception &error) {
    throw ConsistencyError("Unreadable index snapshot " + path.string() +
                           ": " + error.what());
  } catch (const std::invalid_argument &error) {
    throw ConsistencyError("Unreadable index snapshot " + path.string() +
                           ": " + error.what());
  }
}

std::uint64_t VersionIndexManager::NextSequence() {
  const auto path = directory_ / kSequenceFile;
  std::uint64_t current = 0;
  if (std::filesystem::exists(path)) {
    try {
      current = std::stoull(ReadFile(path));
    } catch (const std::logic_error &) {
      throw ConsistencyError("Unreadable seal counter " + path.string());
    }
  }
  WriteFileAtomically(path, std::to_string(current + 1));
  return current + 1;
}

std::shared_ptr<const VersionIndex>
VersionIndexManager::Head(const std::string &dataset_id,
                          const std::string &dataset_version) const {
  const auto version_directory = VersionDirectory(dataset_id, dataset_version);
  const auto generation = ReadHeadGeneration(version_directory);
  if (!generation) {
    return nullptr;
  }

  const auto key = std::make_pair(dataset_id, dataset_version);
  {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    const auto cached = cache_.find(key);
    if (cached != cache_.end() && cached->second->generation == *generation) {
      return cached->second;
    }
  }

  auto snapshot = ReadSnapshot(version_directory / SnapshotName(*generation));
  if (snapshot->dataset_id != dataset_id ||
      snapshot->dataset_version != dataset_version) {
    throw ConsistencyError("Index snapshot in " + version_directory.string() +
                           " belongs to " + snapshot->dataset_id + "@" +
                           snapshot->dataset_version);
  }
  std::lock_guard<std::mutex> lock(cache_mutex_);
  cache_[key] = snapshot;
  return snapshot;
}

std::shared_ptr<const VersionIndex>
VersionIndexManager::LoadGeneration(const std::string &dataset_id,
                                    const std::string &dataset_version,
                                    std::uint64_t generation) const {
  const auto path =
      VersionDirectory(dataset_id, dataset_version) / SnapshotName(generation);
  if (!std::filesystem::exists(path)) {
    throw NotFoundError("No generation " + std::to_string(generation) +
                        " for " + dataset_id + "@" + dataset_version);
  }
  return ReadSnapshot(path);
}

std::shared_ptr<const VersionIndex>
VersionIndexManager::Seal(const std::string &dataset_id,
                          const std::string &dataset_version,
                          const std::vector<IndexUpdate> &updates,
                          SealMode mode) {
  if (dataset_id.empty() || dataset_version.empty()) {
    throw std::invalid_argument("Seal requires a dataset id and version");
  }
  for (const auto &update : updates) {
    if (update.entry.ref.Empty()) {
      throw std::invalid_argument("Index update for '" + update.path +
                                  "' has no object reference");
    }
    if (update.kind == EntryKind::kFile && update.path.empty()) {
      throw std::invalid_argument("File index update requires a path");
    }
  }

  std::lock_guard<std::mutex> guard(seal_mutex_);
  FileLock lock(directory_ / kLockFile);

  const auto head = Head(dataset_id, dataset_version);
  VersionIndex next;
  if (head) {
    next = *head;
  } else {
    next.dataset_id = dataset_id;
    next.dataset_version = dataset_version;
    if (mode == SealMode::kInherit) {
      if (const auto latest = LatestVersion(dataset_id)) {
        if (const auto base = Head(dataset_id, *latest)) {
          next.datasets = base->datasets;
          next.files = base->files;
        }
      }
    }
  }

  bool changed = head == nullptr;
  for (const auto &update : updates) {
    auto &entries =
        update.kind == EntryKind::kDataset ? next.datasets : next.files;
    const auto existing = entries.find(update.path);
    if (existing != entries.end() && existing->second == update.entry) {
      continue;
    }
    entries[update.path] = update.entry;
    changed = true;
  }
  if (!changed) {
    return head;
  }

  next.generation = head ? head->generation + 1 : 1;
  next.sequence = NextSequence();
  next.first_sequence = head ? head->first_sequence : next.sequence;
  next.sealed_at = SecondsSinceEpoch();

  const auto version_directory = VersionDirectory(dataset_id, dataset_version);
  WriteFileAtomically(version_directory / SnapshotName(next.generation),
                      ToJson(next).dump());
  WriteFileAtomically(version_directory / kHeadFile,
                      std::to_string(next.generation));

  auto sealed = std::make_shared<const VersionIndex>(std::move(next));
  {
    std::lock_guard<std::mutex> cache_lock(cache_mutex_);
    cache_[std::make_pair(dataset_id, dataset_version)] = sealed;
  }
  logger_->Log(LogLevel::kInfo, "index.seal",
               {{"dataset_id", dataset_id},
                {"dataset_version", dataset_version},
                {"generation", std::to_string(sealed->generation)},
                {"entries", std::to_string(sealed->Size())}});
  return sealed;
}

std::vector<std::shared_ptr<const VersionIndex>>
VersionIndexManager::Heads() const {
  std::vector<std::shared_ptr<const VersionIndex>> heads;
  if (!std::filesystem::exists(directory_)) {
    return heads;
  }
  for (const auto &entry :
       std::filesystem::recursive_directory_iterator(directory_)) {
    if (!entry.is_regular_file() || entry.path().filename() != kHeadFile) {
      continue;
    }
    const auto version_directory = entry.path().parent_path();
    const auto generation = ReadHeadGeneration(version_directory);
    if (!generation) {
      continue;
    }
    const auto snapshot =
        ReadSnapshot(version_directory / SnapshotName(*generation));
    heads.push_back(Head(snapshot->dataset_id, snapshot->dataset_version));
  }
  std::sort(heads.begin(), heads.end(), [](const auto &left, const auto &right) {
    return std::tie(left->dataset_id, left->first_sequence) <
           std::tie(right->dataset_id, right->first_sequence);
  });
  return heads;
}

std::vector<std::string> VersionIndexManager::DatasetIds() const {
  std::vector<std::string> ids;
  for (const auto &head : Heads()) {
    if (ids.empty() || ids.back() != head->dataset_id) {
      ids.push_back(head->dataset_id);
    }
  }
  return ids;
}

std::vector<std::string>
VersionIndexManager::Versions(const std::string &dataset_id) const {
  std::vector<std::string> versions;
  const auto dataset_directory =
      directory_ /
      ShardedPath(ShardKey(dataset_id, dataset_shards_), dataset_shards_);
  if (!std::filesystem::exists(dataset_directory)) {
    return versions;
  }

  std::vector<std::pair<std::uint64_t, std::string>> ordered;
  for (const auto &entry :
       std::filesystem::recursive_directory_iterator(dataset_directory)) {
    if (!entry.is_regular_file() || entry.path().filename() != kHeadFile) {
      continue;
    }
    const auto version_directory = entry.path().parent_path();
    const auto generation = ReadHeadGeneration(version_directory);
    if (!generation) {
      continue;
    }
    const auto snapshot =
        ReadSnapshot(version_directory / SnapshotName(*generation));
    if (snapshot->dataset_id == dataset_id) {
      ordered.emplace_back(snapshot->first_sequence, snapshot->dataset_version);
    }
  }
  std::sort(ordered.begin(), ordered.end());
  for (auto &item : ordered) {
    versions.push_back(std::move(item.second));
  }
  return versions;
}

std::optional<std::string>
VersionIndexManager::LatestVersion(const std::string &dataset_id) const {
  auto versions = Versions(dataset_id);
  if (versions.empty()) {
    return std::nullopt;
  }
  return std::move(versions.back());
}

std::vector<ResolvedEntry>
VersionIndexManager::Resolve(const IndexQuery &query) const {
  std::vector<std::string> versions;
  switch (query.versions.kind) {
  case VersionSelectorKind::kLatest:
    if (auto latest = LatestVersion(query.dataset_id)) {
      versions.push_back(std::move(*latest));
    }
    break;
  case VersionSelectorKind::kAll:
    versions = Versions(query.dataset_id);
    break;
  case VersionSelectorKind::kExact:
    versions.push_back(query.versions.version);
    break;
  }

  const GlobPattern pattern(query.path_pattern);
  std::vector<ResolvedEntry> results;
  for (const auto &version : versions) {
    const auto index = Head(query.dataset_id, version);
    if (!index) {
      continue;
    }
    std::vector<ResolvedEntry> matches;
    CollectMatches(*index, EntryKind::kDataset, index->datasets, pattern,
                   query.recursive, matches);
    CollectMatches(*index, EntryKind::kFile, index->files, pattern,
                   query.recursive, matches);
    std::sort(matches.begin(), matches.end(),
              [](const ResolvedEntry &left, const ResolvedEntry &right) {
                return std::tie(left.kind, left.path) <
                       std::tie(right.kind, right.path);
              });
    results.insert(results.end(), std::make_move_iterator(matches.begin()),
                   std::make_move_iterator(matches.end()));
  }
  return results;
}

std::vector<ResolvedEntry>
VersionIndexManager::Resolve(const std::string &dataset_id,
                             const std::string &path_pattern,
                             std::string_view version_pattern) const {
  IndexQuery query;
  query.dataset_id = dataset_id;
  query.path_pattern = path_pattern;
  query.versions = VersionSelector::Parse(version_pattern);
  return Resolve(query);
}

} // namespace metatree
