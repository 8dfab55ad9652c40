#pragma once

#include <nlohmann/json.hpp>

#include <compare>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace metatree {

inline constexpr int kRecordSchemaVersion = 1;

enum class RecordType { kDataset, kFile };

std::string ToString(RecordType type);
RecordType ParseRecordType(std::string_view text);

struct MetadataRecord {
  int schema_version = kRecordSchemaVersion;
  RecordType type = RecordType::kDataset;
  std::string dataset_id;
  std::string dataset_version;
  std::optional<std::string> path;
  std::string extractor_name;
  std::string extractor_version;
  nlohmann::json extraction_parameters = nlohmann::json::object();
  double extraction_time = 0.0;
  std::string agent_name;
  std::string agent_email;
  nlohmann::json extracted_metadata;

  friend bool operator==(const MetadataRecord &,
                         const MetadataRecord &) = default;
};

// Lower-case hex SHA-1 digest of a stored blob.
class ObjectRef {
public:
  static constexpr std::size_t kHexLength = 40;

  ObjectRef() = default;
  static ObjectRef FromHex(std::string_view hex);
  static bool IsValidHex(std::string_view hex);

  const std::string &Hex() const { return hex_; }
  bool Empty() const { return hex_.empty(); }

  friend bool operator==(const ObjectRef &, const ObjectRef &) = default;
  friend auto operator<=>(const ObjectRef &, const ObjectRef &) = default;

private:
  explicit ObjectRef(std::string hex) : hex_(std::move(hex)) {}

  std::string hex_;
};

// Containment information attached to entries imported from another dataset.
// An absent root_dataset_version means the entry could not be shown to have
// existed at dataset_path in any version of the root dataset.
struct Provenance {
  std::string root_dataset_id;
  std::optional<std::string> root_dataset_version;
  std::string dataset_path;

  bool IsAmbiguous() const { return !root_dataset_version.has_value(); }

  friend bool operator==(const Provenance &, const Provenance &) = default;
};

struct IndexEntry {
  ObjectRef ref;
  // dataset_version that produced the referenced record
  std::string version;
  std::optional<Provenance> provenance;

  friend bool operator==(const IndexEntry &, const IndexEntry &) = default;
};

enum class EntryKind { kDataset, kFile };

std::string ToString(EntryKind kind);

struct IndexUpdate {
  EntryKind kind = EntryKind::kFile;
  // File path for kFile, dataset path for kDataset ("" is the dataset itself).
  std::string path;
  IndexEntry entry;
};

struct AggregationEdge {
  std::string root_dataset_id;
  std::string root_dataset_version;
  std::string sub_path;
  std::string sub_dataset_id;
  std::string sub_dataset_version;
};

struct AgentInfo {
  std::string name;
  std::string email;
};

} // namespace metatree
