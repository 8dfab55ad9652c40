#pragma once

#include <metatree/extractors.h>
#include <metatree/logging.h>
#include <metatree/metadata_store.h>
#include <metatree/pipeline.h>
#include <metatree/record_codec.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace metatree {

class ComponentRegistry;

struct ExtractOptions {
  ExtractorKind type = ExtractorKind::kFile;
  std::string extractor_name;
  nlohmann::json parameters = nlohmann::json::object();
  std::chrono::milliseconds timeout{60000};
  AgentInfo agent;
};

// Stage arguments: type (file|dataset), extractor, and any further key=value
// pair as extractor parameter. Values starting with '[' or '{' are parsed as
// JSON.
ExtractOptions ExtractOptionsFromArguments(const StageArguments &arguments,
                                           const ConductEnvironment &environment);

// Runs one extractor per item. Items of the other type are notneeded, items
// whose content is not present are impossible. Items inside sub-datasets get
// provenance relative to the traversal root.
class ExtractProcessor : public Processor {
public:
  // Throws ConfigurationError if the extractor is not registered.
  ExtractProcessor(ExtractOptions options, const ComponentRegistry &registry,
                   std::shared_ptr<const DatasetRepository> root,
                   std::shared_ptr<Logger> logger = nullptr);

  std::string Name() const override { return "extract"; }
  bool IsConcurrencySafe() const override { return true; }
  StageResult Process(PipelineItem &item,
                      const PipelineContext &context) override;

private:
  ExtractOptions options_;
  const ComponentRegistry *registry_;
  std::shared_ptr<const DatasetRepository> root_;
  std::shared_ptr<Logger> logger_;
};

struct AddOptions {
  WireOptions wire;
  // Accept records of datasets other than the target dataset.
  bool allow_id_mismatch = false;
};

// Stage arguments: allow_id_mismatch, allow_unknown, allow_override, and
// additional_values holding a JSON object.
AddOptions AddOptionsFromArguments(const StageArguments &arguments);

// Writes the records of an item into the store. Record items are validated
// as wire records first; items without records are notneeded.
class AddProcessor : public Processor {
public:
  AddProcessor(std::shared_ptr<MetadataStore> store,
               std::shared_ptr<const DatasetRepository> dataset,
               AddOptions options, std::shared_ptr<Logger> logger = nullptr);

  std::string Name() const override { return "add"; }
  bool IsConcurrencySafe() const override { return true; }
  StageResult Process(PipelineItem &item,
                      const PipelineContext &context) override;

  // Throws MetadataKeyError for id mismatches.
  void Add(const WireRecord &wire);

private:
  std::shared_ptr<MetadataStore> store_;
  std::shared_ptr<const DatasetRepository> dataset_;
  AddOptions options_;
  std::shared_ptr<Logger> logger_;
};

} // namespace metatree
