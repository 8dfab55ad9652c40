#pragma once

#include <metatree/models.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace metatree {

// Canonical form: keys sorted, no whitespace. The digest of this text is the
// identity of the record.
nlohmann::json ToJson(const MetadataRecord &record);
std::string SerializeRecord(const MetadataRecord &record);
MetadataRecord ParseRecord(std::string_view text);

// A record as exchanged between commands: the record keys plus, for records
// imported from another dataset, root_dataset_id, root_dataset_version and
// dataset_path.
struct WireRecord {
  MetadataRecord record;
  std::optional<Provenance> provenance;
  // Unknown keys dropped because WireOptions::allow_unknown was set.
  std::vector<std::string> ignored_keys;
};

struct WireOptions {
  nlohmann::json additional_values = nlohmann::json::object();
  bool allow_override = false;
  bool allow_unknown = false;
};

const std::vector<std::string> &RequiredRecordKeys();
const std::vector<std::string> &ProvenanceKeys();

nlohmann::json ToWireJson(const WireRecord &wire);
nlohmann::json ToWireJson(const MetadataRecord &record,
                          const std::optional<Provenance> &provenance);

// Validates a wire object the way "add" does: missing required keys,
// partially present provenance keys, type/path mismatches and (unless
// allowed) unknown keys or overridden keys raise MetadataKeyError.
WireRecord ParseWireRecord(const nlohmann::json &object,
                           const WireOptions &options = {});

class JsonLinesReader {
public:
  explicit JsonLinesReader(std::istream &stream);

  // Next non-empty line parsed as JSON; std::nullopt at end of stream.
  // Throws MetadataKeyError naming the line on malformed JSON.
  std::optional<nlohmann::json> Next();
  std::size_t LineNumber() const { return line_number_; }

private:
  std::istream *stream_;
  std::size_t line_number_ = 0;
};

void WriteJsonLine(std::ostream &stream, const nlohmann::json &value);

} // namespace metatree
