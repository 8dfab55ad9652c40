#include <metatree/record_codec.h>

#include <metatree/errors.h>
#include <metatree/metadata_path.h>

#include <algorithm>
#include <istream>
#include <ostream>
#include <stdexcept>

namespace metatree {
namespace {

constexpr const char kType[] = "type";
constexpr const char kPath[] = "path";
constexpr const char kSchemaVersion[] = "schema_version";
constexpr const char kRootDatasetId[] = "root_dataset_id";
constexpr const char kRootDatasetVersion[] = "root_dataset_version";
constexpr const char kDatasetPath[] = "dataset_path";

bool Contains(const std::vector<std::string> &values, const std::string &key) {
  return std::find(values.begin(), values.end(), key) != values.end();
}

std::string RequireString(const nlohmann::json &object, const char *key) {
  const auto &value = object.at(key);
  if (!value.is_string()) {
    throw MetadataKeyError("Key must hold a string", {key});
  }
  return value.get<std::string>();
}

} // namespace

const std::vector<std::string> &RequiredRecordKeys() {
  static const std::vector<std::string> keys = {
      "type",           "extractor_name",       "extractor_version",
      "extraction_parameter", "extraction_time", "agent_name",
      "agent_email",    "dataset_id",           "dataset_version",
      "extracted_metadata"};
  return keys;
}

const std::vector<std::string> &ProvenanceKeys() {
  static const std::vector<std::string> keys = {
      kRootDatasetId, kRootDatasetVersion, kDatasetPath};
  return keys;
}

nlohmann::json ToJson(const MetadataRecord &record) {
  nlohmann::json object = {
      {kSchemaVersion, record.schema_version},
      {kType, ToString(record.type)},
      {"dataset_id", record.dataset_id},
      {"dataset_version", record.dataset_version},
      {"extractor_name", record.extractor_name},
      {"extractor_version", record.extractor_version},
      {"extraction_parameter", record.extraction_parameters},
      {"extraction_time", record.extraction_time},
      {"agent_name", record.agent_name},
      {"agent_email", record.agent_email},
      {"extracted_metadata", record.extracted_metadata}};
  if (record.path) {
    object[kPath] = *record.path;
  }
  return object;
}

std::string SerializeRecord(const MetadataRecord &record) {
  return ToJson(record).dump();
}

MetadataRecord ParseRecord(std::string_view text) {
  nlohmann::json object;
  try {
    object = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error &error) {
    throw ConsistencyError(std::string("Stored record is not valid JSON: ") +
                           error.what());
  }

  WireRecord wire;
  try {
    wire = ParseWireRecord(object);
  } catch (const MetadataKeyError &error) {
    throw ConsistencyError(std::string("Stored record is malformed: ") +
                           error.what());
  }
  if (wire.provenance) {
    throw ConsistencyError("Stored record carries provenance keys");
  }
  return std::move(wire.record);
}

nlohmann::json ToWireJson(const MetadataRecord &record,
                          const std::optional<Provenance> &provenance) {
  auto object = ToJson(record);
  if (provenance) {
    object[kRootDatasetId] = provenance->root_dataset_id;
    object[kRootDatasetVersion] =
        provenance->root_dataset_version
            ? nlohmann::json(*provenance->root_dataset_version)
            : nlohmann::json(nullptr);
    object[kDatasetPath] = provenance->dataset_path;
  }
  return object;
}

nlohmann::json ToWireJson(const WireRecord &wire) {
  return ToWireJson(wire.record, wire.provenance);
}

WireRecord ParseWireRecord(const nlohmann::json &object,
                           const WireOptions &options) {
  if (!object.is_object()) {
    throw MetadataKeyError("Metadata must be a JSON object", {});
  }
  if (!options.additional_values.is_object()) {
    throw MetadataKeyError("Additional values must be a JSON object", {});
  }

  std::vector<std::string> overridden;
  for (const auto &item : options.additional_values.items()) {
    if (object.contains(item.key())) {
      overridden.push_back(item.key());
    }
  }
  if (!overridden.empty() && !options.allow_override) {
    throw MetadataKeyError("Keys overridden by additional values", overridden);
  }

  auto merged = object;
  merged.update(options.additional_values);

  std::vector<std::string> missing;
  for (const auto &key : RequiredRecordKeys()) {
    if (!merged.contains(key)) {
      missing.push_back(key);
    }
  }
  if (!missing.empty()) {
    throw MetadataKeyError("Missing keys", missing);
  }

  std::vector<std::string> present_provenance;
  std::vector<std::string> missing_provenance;
  for (const auto &key : ProvenanceKeys()) {
    if (merged.contains(key)) {
      present_provenance.push_back(key);
    } else {
      missing_provenance.push_back(key);
    }
  }
  if (!present_provenance.empty() && !missing_provenance.empty()) {
    throw MetadataKeyError("Non mandatory keys missing", missing_provenance);
  }

  std::vector<std::string> unknown;
  for (const auto &item : merged.items()) {
    const auto &key = item.key();
    if (!Contains(RequiredRecordKeys(), key) &&
        !Contains(ProvenanceKeys(), key) && key != kPath &&
        key != kSchemaVersion) {
      unknown.push_back(key);
    }
  }
  if (!unknown.empty() && !options.allow_unknown) {
    throw MetadataKeyError("Unknown keys", unknown);
  }

  WireRecord wire;
  wire.ignored_keys = unknown;
  auto &record = wire.record;
  try {
    record.type = ParseRecordType(RequireString(merged, kType));
  } catch (const std::invalid_argument &error) {
    throw MetadataKeyError(error.what(), {kType});
  }

  if (merged.contains(kSchemaVersion)) {
    const auto &schema = merged.at(kSchemaVersion);
    if (!schema.is_number_integer()) {
      throw MetadataKeyError("Key must hold an integer", {kSchemaVersion});
    }
    record.schema_version = schema.get<int>();
    if (record.schema_version > kRecordSchemaVersion) {
      throw MetadataKeyError("Unsupported record schema version " +
                                 std::to_string(record.schema_version),
                             {kSchemaVersion});
    }
  }

  record.dataset_id = RequireString(merged, "dataset_id");
  record.dataset_version = RequireString(merged, "dataset_version");
  record.extractor_name = RequireString(merged, "extractor_name");
  record.extractor_version = RequireString(merged, "extractor_version");
  record.agent_name = RequireString(merged, "agent_name");
  record.agent_email = RequireString(merged, "agent_email");

  const auto &parameters = merged.at("extraction_parameter");
  if (parameters.is_null()) {
    record.extraction_parameters = nlohmann::json::object();
  } else if (parameters.is_object()) {
    record.extraction_parameters = parameters;
  } else {
    throw MetadataKeyError("Key must hold an object",
                           {"extraction_parameter"});
  }

  const auto &time = merged.at("extraction_time");
  if (!time.is_number()) {
    throw MetadataKeyError("Key must hold a number", {"extraction_time"});
  }
  record.extraction_time = time.get<double>();
  record.extracted_metadata = merged.at("extracted_metadata");

  if (record.type == RecordType::kFile) {
    if (!merged.contains(kPath)) {
      throw MetadataKeyError("Missing path-property in file-type metadata",
                             {kPath});
    }
    try {
      record.path = NormalizeRelativePath(RequireString(merged, kPath));
    } catch (const std::invalid_argument &error) {
      throw MetadataKeyError(error.what(), {kPath});
    }
    if (record.path->empty()) {
      throw MetadataKeyError("File-type metadata requires a non-empty path",
                             {kPath});
    }
  } else if (merged.contains(kPath)) {
    throw MetadataKeyError("Extraneous path-property in dataset-type metadata",
                           {kPath});
  }

  if (!present_provenance.empty()) {
    Provenance provenance;
    provenance.root_dataset_id = RequireString(merged, kRootDatasetId);
    const auto &root_version = merged.at(kRootDatasetVersion);
    if (root_version.is_string()) {
      provenance.root_dataset_version = root_version.get<std::string>();
    } else if (!root_version.is_null()) {
      throw MetadataKeyError("Key must hold a string or null",
                             {kRootDatasetVersion});
    }
    try {
      provenance.dataset_path =
          NormalizeRelativePath(RequireString(merged, kDatasetPath));
    } catch (const std::invalid_argument &error) {
      throw MetadataKeyError(error.what(), {kDatasetPath});
    }
    wire.provenance = std::move(provenance);
  }
  return wire;
}

JsonLinesReader::JsonLinesReader(std::istream &stream) : stream_(&stream) {}

std::optional<nlohmann::json> JsonLinesReader::Next() {
  std::string line;
  while (std::getline(*stream_, line)) {
    ++line_number_;
    const auto first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
      continue;
    }
    try {
      return nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error &error) {
      throw MetadataKeyError("Invalid JSON on line " +
                                 std::to_string(line_number_) + ": " +
                                 error.what(),
                             {});
    }
  }
  return std::nullopt;
}

void WriteJsonLine(std::ostream &stream, const nlohmann::json &value) {
  stream << value.dump() << '\n';
}

} // namespace metatree
