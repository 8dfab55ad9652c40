#include <metatree/processors.h>

#include <metatree/component_registry.h>
#include <metatree/errors.h>

#include <utility>

namespace metatree {
namespace {

nlohmann::json ParameterValue(const std::string &key,
                              const std::string &value) {
  if (value.empty() || (value.front() != '[' && value.front() != '{')) {
    return value;
  }
  try {
    return nlohmann::json::parse(value);
  } catch (const nlohmann::json::parse_error &error) {
    throw ConfigurationError("Parameter '" + key +
                             "' is not valid JSON: " + error.what());
  }
}

} // namespace

ExtractOptions
ExtractOptionsFromArguments(const StageArguments &arguments,
                            const ConductEnvironment &environment) {
  ExtractOptions options;
  options.type = ParseExtractorKind(
      StringArgument(arguments, "type").value_or("file"));
  const auto name = StringArgument(arguments, "extractor");
  if (!name || name->empty()) {
    throw ConfigurationError("extract needs an 'extractor' argument");
  }
  options.extractor_name = *name;
  for (const auto &[key, value] : arguments) {
    if (key != "type" && key != "extractor") {
      options.parameters[key] = ParameterValue(key, value);
    }
  }
  options.timeout = environment.extractor_timeout;
  options.agent = environment.agent;
  return options;
}

ExtractProcessor::ExtractProcessor(ExtractOptions options,
                                   const ComponentRegistry &registry,
                                   std::shared_ptr<const DatasetRepository> root,
                                   std::shared_ptr<Logger> logger)
    : options_(std::move(options)), registry_(&registry),
      root_(std::move(root)), logger_(EnsureLogger(std::move(logger))) {
  if (!registry_->HasExtractor(options_.extractor_name)) {
    throw ConfigurationError("Unknown extractor '" + options_.extractor_name +
                             "'");
  }
}

StageResult ExtractProcessor::Process(PipelineItem &item,
                                      const PipelineContext &context) {
  const auto wanted = options_.type == ExtractorKind::kDataset
                          ? WorkItemKind::kDataset
                          : WorkItemKind::kFile;
  if (item.work.kind != wanted) {
    return {ItemOutcome::kNotNeeded,
            "not a " + ToString(options_.type) + " item"};
  }
  if (!item.work.entry || !item.work.dataset) {
    throw ConfigurationError("Item " + item.work.path + " has no dataset");
  }
  const auto &entry = *item.work.entry;

  ExtractorContext extractor_context;
  extractor_context.dataset = item.work.dataset;
  if (options_.type == ExtractorKind::kFile) {
    extractor_context.file = entry;
  }
  extractor_context.parameters = options_.parameters;
  extractor_context.logger = logger_;
  extractor_context.timeout = options_.timeout;
  extractor_context.stop_requested = context.stop_requested;

  auto extractor =
      registry_->CreateExtractor(options_.extractor_name, extractor_context);
  if (extractor->Kind() != options_.type) {
    throw ConfigurationError("Extractor " + options_.extractor_name +
                             " extracts " + ToString(extractor->Kind()) +
                             " metadata, not " + ToString(options_.type));
  }
  if (!extractor->EnsureContentAvailable()) {
    return {ItemOutcome::kImpossible,
            "content of " + item.work.path + " is not available"};
  }

  WireRecord wire;
  wire.record = ExtractRecord(*extractor, options_.extractor_name,
                              extractor_context, options_.agent);
  if (root_ && !entry.dataset_path.empty()) {
    wire.provenance =
        Provenance{root_->Id(), root_->Version(), entry.dataset_path};
  }
  item.records.push_back(std::move(wire));
  return {ItemOutcome::kOk, {}};
}

AddOptions AddOptionsFromArguments(const StageArguments &arguments) {
  AddOptions options;
  options.allow_id_mismatch =
      BoolArgument(arguments, "allow_id_mismatch", false);
  options.wire.allow_unknown = BoolArgument(arguments, "allow_unknown", false);
  options.wire.allow_override =
      BoolArgument(arguments, "allow_override", false);
  if (const auto values = StringArgument(arguments, "additional_values")) {
    const auto parsed = ParameterValue("additional_values", *values);
    if (!parsed.is_object()) {
      throw ConfigurationError("additional_values must be a JSON object");
    }
    options.wire.additional_values = parsed;
  }
  return options;
}

AddProcessor::AddProcessor(std::shared_ptr<MetadataStore> store,
                           std::shared_ptr<const DatasetRepository> dataset,
                           AddOptions options, std::shared_ptr<Logger> logger)
    : store_(std::move(store)), dataset_(std::move(dataset)),
      options_(std::move(options)), logger_(EnsureLogger(std::move(logger))) {
  if (!store_) {
    throw ConfigurationError("add needs a metadata store");
  }
}

void AddProcessor::Add(const WireRecord &wire) {
  const auto &expected_id = wire.provenance ? wire.provenance->root_dataset_id
                                            : wire.record.dataset_id;
  if (dataset_ && !options_.allow_id_mismatch && expected_id != dataset_->Id()) {
    throw MetadataKeyError("Metadata belongs to dataset " + expected_id +
                               ", not to " + dataset_->Id(),
                           {wire.provenance ? "root_dataset_id" : "dataset_id"});
  }
  store_->AddRecord(wire.record, wire.provenance);
}

StageResult AddProcessor::Process(PipelineItem &item, const PipelineContext &) {
  if (item.work.record && item.records.empty()) {
    auto wire = ParseWireRecord(*item.work.record, options_.wire);
    for (const auto &key : wire.ignored_keys) {
      logger_->Log(LogLevel::kWarn, "add.unknown_key",
                   {{"item", item.work.path}, {"key", key}});
    }
    item.records.push_back(std::move(wire));
  }
  if (item.records.empty()) {
    return {ItemOutcome::kNotNeeded, "no metadata to add"};
  }
  for (const auto &wire : item.records) {
    Add(wire);
  }
  return {ItemOutcome::kOk, "added " + std::to_string(item.records.size()) +
                                " record(s)"};
}

} // namespace metatree
