#include <metatree/filters.h>

#include <metatree/errors.h>
#include <metatree/record_codec.h>

#include <chrono>
#include <stdexcept>
#include <utility>

namespace metatree {
namespace {

constexpr const char kNullDatasetId[] = "00000000-0000-0000-0000-000000000000";

double SecondsSinceEpoch() {
  return std::chrono::duration<double>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string Describe(const MetadataRecord &record) {
  return record.dataset_id + "@" + record.dataset_version + ":" +
         record.path.value_or(".");
}

} // namespace

bool RecordSelector::Matches(const MetadataRecord &record) const {
  if (type && record.type != *type) {
    return false;
  }
  if (!extractor_name.empty() && record.extractor_name != extractor_name) {
    return false;
  }
  if (path && !path->Matches(record.path.value_or(""))) {
    return false;
  }
  if (key.empty()) {
    return true;
  }
  const auto flat = FlatIndexer().Index(record);
  const auto found = flat.find(key);
  if (found == flat.end()) {
    return false;
  }
  return !value || value->Matches(found->second);
}

RecordSelector RecordSelectorFromArguments(const StageArguments &arguments) {
  RecordSelector selector;
  if (const auto type = StringArgument(arguments, "type")) {
    try {
      selector.type = ParseRecordType(*type);
    } catch (const std::invalid_argument &error) {
      throw ConfigurationError(std::string(error.what()) +
                               ", expected 'dataset' or 'file'");
    }
  }
  selector.extractor_name =
      StringArgument(arguments, "extractor").value_or("");
  if (const auto path = StringArgument(arguments, "path")) {
    selector.path.emplace(*path);
  }
  selector.key = StringArgument(arguments, "key").value_or("");
  if (const auto value = StringArgument(arguments, "value")) {
    if (selector.key.empty()) {
      throw ConfigurationError("filter 'value' needs a 'key'");
    }
    selector.value.emplace(*value);
  }
  return selector;
}

FilterProcessor::FilterProcessor(RecordSelector selector,
                                 std::shared_ptr<Logger> logger)
    : selector_(std::move(selector)),
      logger_(EnsureLogger(std::move(logger))) {}

StageResult FilterProcessor::Process(PipelineItem &item,
                                     const PipelineContext &) {
  if (item.work.record && item.records.empty()) {
    WireOptions lenient;
    lenient.allow_unknown = true;
    const auto wire = ParseWireRecord(*item.work.record, lenient);
    if (!selector_.Matches(wire.record)) {
      return {ItemOutcome::kNotNeeded, "record filtered out"};
    }
    return {ItemOutcome::kOk, "record kept"};
  }

  const auto total = item.records.size();
  std::erase_if(item.records, [this](const WireRecord &wire) {
    return !selector_.Matches(wire.record);
  });
  logger_->Log(LogLevel::kDebug, "filter.item",
               {{"item", item.work.path},
                {"kept", std::to_string(item.records.size())},
                {"dropped", std::to_string(total - item.records.size())}});
  if (item.records.empty()) {
    return {ItemOutcome::kNotNeeded, "no record matches"};
  }
  return {ItemOutcome::kOk, "kept " + std::to_string(item.records.size()) +
                                " of " + std::to_string(total) + " record(s)"};
}

MatchFilter::MatchFilter(RecordSelector selector)
    : selector_(std::move(selector)) {}

std::vector<MetadataRecord>
MatchFilter::Consume(const MetadataRecord &record) {
  if (!selector_.Matches(record)) {
    return {};
  }
  return {record};
}

HistogramFilter::HistogramFilter(StageArguments arguments)
    : arguments_(std::move(arguments)) {}

std::vector<MetadataRecord>
HistogramFilter::Consume(const MetadataRecord &record) {
  if (record.extractor_name.empty()) {
    throw MetadataKeyError("Record " + Describe(record) + " lacks keys",
                           {"extractor_name"});
  }
  Collect(record.extracted_metadata, record.extractor_name);
  return {};
}

void HistogramFilter::Collect(const nlohmann::json &value,
                              const std::string &key) {
  if (value.is_object()) {
    for (const auto &item : value.items()) {
      Collect(item.value(), key + "." + item.key());
    }
    return;
  }
  if (value.is_array()) {
    for (std::size_t index = 0; index < value.size(); ++index) {
      Collect(value[index], key + "[" + std::to_string(index) + "]");
    }
    return;
  }
  auto &bin = histograms_[key];
  if (bin.is_null()) {
    bin = nlohmann::json::array();
  }
  bin.push_back(value);
}

std::vector<MetadataRecord> HistogramFilter::Finish() {
  MetadataRecord record;
  record.type = RecordType::kDataset;
  record.dataset_id = kNullDatasetId;
  record.dataset_version = "0";
  record.extractor_name = std::string(kId) + "-" + kName;
  record.extractor_version = kVersion;
  record.extraction_parameters = arguments_;
  record.extraction_time = SecondsSinceEpoch();
  record.agent_name = "metatree demo filter";
  record.agent_email = "metatree-demo-filter@example.com";
  record.extracted_metadata = histograms_;
  histograms_.clear();
  return {std::move(record)};
}

} // namespace metatree
