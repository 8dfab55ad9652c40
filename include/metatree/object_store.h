#pragma once

#include <metatree/logging.h>
#include <metatree/models.h>
#include <metatree/sharding.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace metatree {

// Append-only, content-addressed blob storage. A blob lives at
// <directory>/<hex split by shards>.json and is published by linking a fully
// written temporary file into place, so readers never see partial content.
// Safe for concurrent use from several threads and processes.
class ObjectStore {
public:
  explicit ObjectStore(std::filesystem::path directory,
                       ShardParts shards = {2, 2},
                       std::shared_ptr<Logger> logger = nullptr);

  // Idempotent. Throws ConsistencyError if a different blob already occupies
  // the digest of content.
  ObjectRef Put(std::string_view content);

  // Throws NotFoundError if ref is not stored.
  std::string Get(const ObjectRef &ref) const;
  std::optional<std::string> TryGet(const ObjectRef &ref) const;
  bool Contains(const ObjectRef &ref) const;

  std::vector<ObjectRef> List() const;
  std::size_t Count() const;

  const std::filesystem::path &Directory() const { return directory_; }
  std::filesystem::path PathFor(const ObjectRef &ref) const;

private:
  std::filesystem::path directory_;
  ShardParts shards_;
  std::shared_ptr<Logger> logger_;
};

// Writes content to a unique temporary file beside target and renames it over
// target. Used for files that are replaced as a whole (HEAD pointers, layout
// descriptors).
void WriteFileAtomically(const std::filesystem::path &target,
                         std::string_view content);

std::string ReadFile(const std::filesystem::path &path);

} // namespace metatree
