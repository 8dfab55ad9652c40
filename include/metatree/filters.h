#pragma once

#include <metatree/indexer.h>
#include <metatree/logging.h>
#include <metatree/metadata_path.h>
#include <metatree/models.h>
#include <metatree/pipeline.h>

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace metatree {

// Conditions a record has to meet. Unset conditions match every record.
struct RecordSelector {
  std::optional<RecordType> type;
  std::string extractor_name;
  std::optional<GlobPattern> path;
  // Key of the flattened extracted metadata, see FlatIndexer.
  std::string key;
  // Only checked together with key.
  std::optional<GlobPattern> value;

  bool Matches(const MetadataRecord &record) const;
};

// Stage arguments: type (file|dataset), extractor, path, key, value.
RecordSelector RecordSelectorFromArguments(const StageArguments &arguments);

// Drops the records of an item that do not match. Items left without a
// matching record are notneeded. Record items are matched but not changed.
class FilterProcessor : public Processor {
public:
  explicit FilterProcessor(RecordSelector selector,
                           std::shared_ptr<Logger> logger = nullptr);

  std::string Name() const override { return "filter"; }
  bool IsConcurrencySafe() const override { return true; }
  StageResult Process(PipelineItem &item,
                      const PipelineContext &context) override;

private:
  RecordSelector selector_;
  std::shared_ptr<Logger> logger_;
};

// Turns a stream of records into new records. Consume may emit records
// right away; Finish emits whatever depends on the whole stream.
class MetadataFilter {
public:
  virtual ~MetadataFilter() = default;
  virtual std::vector<MetadataRecord> Consume(const MetadataRecord &record) = 0;
  virtual std::vector<MetadataRecord> Finish() = 0;
};

// Passes on the records a RecordSelector accepts.
class MatchFilter : public MetadataFilter {
public:
  explicit MatchFilter(RecordSelector selector);

  std::vector<MetadataRecord> Consume(const MetadataRecord &record) override;
  std::vector<MetadataRecord> Finish() override { return {}; }

private:
  RecordSelector selector_;
};

// Collects every scalar of the extracted metadata under
// "<extractor_name>.<key path>", arrays indexed as "[n]", and emits one
// dataset record of the null dataset holding these histograms.
class HistogramFilter : public MetadataFilter {
public:
  static constexpr const char *kName = "metalad_demofilter";
  static constexpr const char *kId = "46a744da-1558-4532-bf32-51d26be6c27c";
  static constexpr const char *kVersion = "1.0";

  explicit HistogramFilter(StageArguments arguments = {});

  std::vector<MetadataRecord> Consume(const MetadataRecord &record) override;
  std::vector<MetadataRecord> Finish() override;

private:
  void Collect(const nlohmann::json &value, const std::string &key);

  StageArguments arguments_;
  std::map<std::string, nlohmann::json> histograms_;
};

} // namespace metatree
