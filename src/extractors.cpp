#include <metatree/extractors.h>

#include <metatree/digest.h>
#include <metatree/errors.h>
#include <metatree/object_store.h>

#include <chrono>
#include <filesystem>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace metatree {
namespace {

double SecondsSinceEpoch() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration<double>(now).count();
}

const TreeEntry &RequireFile(const ExtractorContext &context,
                             const char *extractor) {
  if (!context.file) {
    throw ConfigurationError(std::string("File extractor ") + extractor +
                             " needs a file");
  }
  return *context.file;
}

bool IsReadableFile(const TreeEntry &file) {
  std::error_code error;
  return std::filesystem::is_regular_file(file.absolute_path, error);
}

ExtractorResult Succeeded(std::string version, nlohmann::json parameters,
                          const char *type, nlohmann::json data) {
  ExtractorResult result;
  result.extractor_version = std::move(version);
  result.parameters = std::move(parameters);
  result.success = true;
  result.status_fields = {{"type", type}, {"status", "ok"}};
  result.immediate_data = std::move(data);
  return result;
}

} // namespace

std::string ToString(OutputMode mode) {
  return mode == OutputMode::kImmediate ? "immediate" : "file";
}

std::string ToString(ExtractorKind kind) {
  return kind == ExtractorKind::kDataset ? "dataset" : "file";
}

ExtractorKind ParseExtractorKind(const std::string &text) {
  if (text == "dataset") {
    return ExtractorKind::kDataset;
  }
  if (text == "file") {
    return ExtractorKind::kFile;
  }
  throw ConfigurationError("Unknown extractor type '" + text +
                           "', expected 'dataset' or 'file'");
}

MetadataRecord ExtractRecord(Extractor &extractor,
                             const std::string &extractor_name,
                             const ExtractorContext &context,
                             const AgentInfo &agent) {
  if (!context.dataset) {
    throw ConfigurationError("Extractor " + extractor_name +
                             " needs a dataset");
  }
  const auto kind = extractor.Kind();
  if (kind == ExtractorKind::kFile) {
    RequireFile(context, extractor_name.c_str());
  }

  std::ostringstream sink;
  const auto result = extractor.Extract(sink);
  if (!result.success) {
    throw ExternalFailure("Extractor " + extractor_name +
                          " reported failure: " + result.status_fields.dump());
  }

  nlohmann::json metadata;
  if (extractor.GetOutputMode() == OutputMode::kImmediate) {
    if (!result.immediate_data) {
      throw ExternalFailure("Extractor " + extractor_name +
                            " returned no immediate data");
    }
    metadata = *result.immediate_data;
  } else {
    try {
      metadata = nlohmann::json::parse(sink.str());
    } catch (const nlohmann::json::parse_error &error) {
      throw ExternalFailure("Extractor " + extractor_name +
                            " wrote invalid JSON: " + error.what());
    }
  }

  MetadataRecord record;
  if (kind == ExtractorKind::kFile) {
    record.type = RecordType::kFile;
    record.dataset_id = context.file->dataset_id;
    record.dataset_version = context.file->dataset_version;
    record.path = context.file->intra_dataset_path;
  } else {
    record.type = RecordType::kDataset;
    record.dataset_id = context.dataset->Id();
    record.dataset_version = context.dataset->Version();
  }
  record.extractor_name = extractor_name;
  record.extractor_version = result.extractor_version.empty()
                                 ? extractor.GetVersion()
                                 : result.extractor_version;
  record.extraction_parameters = result.parameters.is_object()
                                     ? result.parameters
                                     : nlohmann::json::object();
  record.extraction_time = SecondsSinceEpoch();
  record.agent_name = agent.name;
  record.agent_email = agent.email;
  record.extracted_metadata = std::move(metadata);
  return record;
}

ExampleFileExtractor::ExampleFileExtractor(ExtractorContext context)
    : context_(std::move(context)) {
  RequireFile(context_, "metalad_example_file");
}

bool ExampleFileExtractor::EnsureContentAvailable() {
  return IsReadableFile(*context_.file);
}

ExtractorResult ExampleFileExtractor::Extract(std::ostream &) {
  const auto &file = *context_.file;
  std::error_code error;
  const auto size = std::filesystem::file_size(file.absolute_path, error);
  nlohmann::json data = {
      {"@id", "file:" + Sha1Hex(file.dataset_id + ":" + file.intra_dataset_path)},
      {"type", "file"},
      {"path", file.intra_dataset_path},
      {"content_byte_size", error ? 0 : size},
      {"comment", "example file extractor executed at " +
                      std::to_string(SecondsSinceEpoch())}};
  return Succeeded(GetVersion(), context_.parameters, "file", std::move(data));
}

ExampleDatasetExtractor::ExampleDatasetExtractor(ExtractorContext context)
    : context_(std::move(context)) {
  if (!context_.dataset) {
    throw ConfigurationError("metalad_example_dataset needs a dataset");
  }
}

ExtractorResult ExampleDatasetExtractor::Extract(std::ostream &) {
  nlohmann::json data = {{"id", context_.dataset->Id()},
                         {"refcommit", context_.dataset->Version()},
                         {"comment", "example dataset extractor executed at " +
                                         std::to_string(SecondsSinceEpoch())}};
  return Succeeded(GetVersion(), context_.parameters, "dataset",
                   std::move(data));
}

CoreFileExtractor::CoreFileExtractor(ExtractorContext context)
    : context_(std::move(context)) {
  RequireFile(context_, "metalad_core_file");
}

bool CoreFileExtractor::EnsureContentAvailable() {
  return IsReadableFile(*context_.file);
}

ExtractorResult CoreFileExtractor::Extract(std::ostream &) {
  const auto &file = *context_.file;
  const auto content = ReadFile(file.absolute_path);
  const auto digest = Sha1Hex(content);
  nlohmann::json data = {{"@type", "file"},
                         {"@id", "sha1:" + digest},
                         {"path", file.intra_dataset_path},
                         {"contentbytesize", content.size()},
                         {"digest", {{"sha1", digest}}}};
  return Succeeded(GetVersion(), context_.parameters, "file", std::move(data));
}

} // namespace metatree
