#pragma once

#include <metatree/dataset_repository.h>
#include <metatree/logging.h>
#include <metatree/models.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

namespace metatree {

enum class OutputMode { kImmediate, kExternalFile };
enum class ExtractorKind { kDataset, kFile };

std::string ToString(OutputMode mode);
std::string ToString(ExtractorKind kind);
ExtractorKind ParseExtractorKind(const std::string &text);

struct ExtractorContext {
  std::shared_ptr<const DatasetRepository> dataset;
  // Set for file extractors.
  std::optional<TreeEntry> file;
  nlohmann::json parameters = nlohmann::json::object();
  std::shared_ptr<Logger> logger;
  std::chrono::milliseconds timeout{60000};
  // Raised when the surrounding run is asked to stop.
  const std::atomic<bool> *stop_requested = nullptr;
};

struct ExtractorResult {
  std::string extractor_version;
  nlohmann::json parameters = nlohmann::json::object();
  bool success = false;
  nlohmann::json status_fields = nlohmann::json::object();
  // Present for OutputMode::kImmediate.
  std::optional<nlohmann::json> immediate_data;
};

class Extractor {
public:
  virtual ~Extractor() = default;

  virtual std::string GetId() = 0;
  virtual std::string GetVersion() = 0;
  virtual OutputMode GetOutputMode() = 0;
  virtual ExtractorKind Kind() const = 0;
  // False if the data the extractor reads is not present locally.
  virtual bool EnsureContentAvailable() = 0;
  // kExternalFile extractors write one JSON document to sink.
  virtual ExtractorResult Extract(std::ostream &sink) = 0;
};

// Runs extractor and turns its output into a record for the context's
// dataset (and file). Throws ExternalFailure if extraction fails or yields
// no parseable metadata.
MetadataRecord ExtractRecord(Extractor &extractor,
                             const std::string &extractor_name,
                             const ExtractorContext &context,
                             const AgentInfo &agent);

class ExampleFileExtractor : public Extractor {
public:
  static constexpr const char *kId = "89fae179-eceb-4af2-8088-dfebdae6e2c0";

  explicit ExampleFileExtractor(ExtractorContext context);

  std::string GetId() override { return kId; }
  std::string GetVersion() override { return "0.0.1"; }
  OutputMode GetOutputMode() override { return OutputMode::kImmediate; }
  ExtractorKind Kind() const override { return ExtractorKind::kFile; }
  bool EnsureContentAvailable() override;
  ExtractorResult Extract(std::ostream &sink) override;

private:
  ExtractorContext context_;
};

class ExampleDatasetExtractor : public Extractor {
public:
  static constexpr const char *kId = "b3c487ea-e670-4801-bcdc-29639bf1269b";

  explicit ExampleDatasetExtractor(ExtractorContext context);

  std::string GetId() override { return kId; }
  std::string GetVersion() override { return "0.0.1"; }
  OutputMode GetOutputMode() override { return OutputMode::kImmediate; }
  ExtractorKind Kind() const override { return ExtractorKind::kDataset; }
  bool EnsureContentAvailable() override { return true; }
  ExtractorResult Extract(std::ostream &sink) override;

private:
  ExtractorContext context_;
};

// Size and SHA-1 of a file's content. Output depends on content only.
class CoreFileExtractor : public Extractor {
public:
  static constexpr const char *kId = "442d4ab4-3a5c-4bb9-a8e8-1c4b1fbf9d57";

  explicit CoreFileExtractor(ExtractorContext context);

  std::string GetId() override { return kId; }
  std::string GetVersion() override { return "1"; }
  OutputMode GetOutputMode() override { return OutputMode::kImmediate; }
  ExtractorKind Kind() const override { return ExtractorKind::kFile; }
  bool EnsureContentAvailable() override;
  ExtractorResult Extract(std::ostream &sink) override;

private:
  ExtractorContext context_;
};

} // namespace metatree
