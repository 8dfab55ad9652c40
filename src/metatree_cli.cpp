#include <metatree/metatree_cli.h>

#include <metatree/aggregator.h>
#include <metatree/cli_exit_codes.h>
#include <metatree/component_registry.h>
#include <metatree/conduct_pipeline_builder.h>
#include <metatree/dataset_repository.h>
#include <metatree/errors.h>
#include <metatree/exporter.h>
#include <metatree/metadata_path.h>
#include <metatree/metadata_store.h>
#include <metatree/processors.h>
#include <metatree/providers.h>
#include <metatree/record_codec.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <utility>
#include <variant>

#include <yaml-cpp/yaml.h>

namespace {

using metatree::CliOptions;

std::atomic<bool> g_interrupted{false};

void HandleInterrupt(int) { g_interrupted.store(true); }

void PrintCommandUsage(const std::string &command, std::ostream &stream) {
  static const std::unordered_map<std::string, std::string> usages = {
      {"init", "Usage: metatree init [PATH] [--id <uuid>] [--version <token>]\n"
               "Creates .metatree/dataset.yaml and an empty metadata store.\n"},
      {"extract",
       "Usage: metatree extract <extractor> [FILE] [options]\n"
       "Runs a dataset extractor, or a file extractor if FILE is given, and\n"
       "prints the records as JSON Lines.\n"
       "  --parameter <key=value>  Extractor parameter (repeatable)\n"},
      {"add", "Usage: metatree add [FILE|-] [options]\n"
              "Adds JSON Lines records to the metadata store.\n"
              "  --allow-id-mismatch      Accept records of other datasets\n"
              "  --allow-unknown          Ignore unknown record keys\n"
              "  --allow-override         Let --additional-values replace keys\n"
              "  --additional-values <json>  Values merged into every record\n"},
      {"dump", "Usage: metatree dump [URL] [-r] [--indexer <name>]\n"
               "URL: uuid:UUID[@VERSION][:PATH] or "
               "[tree:][DATASET_PATH][@VERSION][:PATH]\n"
               "VERSION: exact token, '*' for all, empty for the latest.\n"},
      {"aggregate",
       "Usage: metatree aggregate [SUBDATASET_PATH...] [--subdataset-depth "
       "<n>]\n"
       "Copies metadata of sub-dataset stores into the dataset's store.\n"},
      {"conduct",
       "Usage: metatree conduct --processor <stage> [--processor <stage>...]\n"
       "                        [--provider <stage>] [-j <jobs>]\n"
       "stage: name[:key=value,key=value]\n"
       "providers: dataset-traversal (default), json-lines,\n"
       "           metadata-traversal:pattern=<URL>,recursive=true\n"
       "processors: extract:type=file|dataset,extractor=<name>,... ; add ;\n"
       "            filter:type=,extractor=,path=,key=,value=\n"},
      {"filter",
       "Usage: metatree filter <FILTER> <URL>... [-r] [++ ARGUMENT...]\n"
       "Runs a filter over the records of every URL and prints the records\n"
       "it produces as JSON Lines. ARGUMENT is key=value or a plain value.\n"
       "filters: match (type, extractor, path, key, value), "
       "metalad_demofilter\n"},
      {"export", "Usage: metatree export <DESTINATION>\n"},
      {"import", "Usage: metatree import <SOURCE>\n"}};

  if (const auto found = usages.find(command); found != usages.end()) {
    stream << found->second;
  }
  stream << "Common options:\n"
         << "  -d, --dataset <path>        Dataset root (default: .)\n"
         << "  --store <path>              Metadata store (default: "
            "<dataset>/.metatree/store)\n"
         << "  --config <file>             YAML config file\n"
         << "  -j, --jobs <n>              Worker threads\n"
         << "  --queue-capacity <n>        Pending items (default: 2 x jobs)\n"
         << "  --agent-name <name>         Agent recorded in new records\n"
         << "  --agent-email <email>\n"
         << "  --extractor-timeout <sec>   Timeout of external extractors\n"
         << "  -r, --recursive             Recurse (dump, traversal)\n"
         << "  --traverse-subdatasets      Enter sub-datasets while traversing\n"
         << "  --subdataset-depth <n>      Sub-dataset levels to visit\n"
         << "  --log-level <level>         error, warn, info or debug\n"
         << "  --verbose | --debug\n"
         << "  --help\n";
}

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseBool(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  if (normalized == "true" || normalized == "1" || normalized == "yes" ||
      normalized == "on") {
    return true;
  }
  if (normalized == "false" || normalized == "0" || normalized == "no" ||
      normalized == "off") {
    return false;
  }
  throw std::invalid_argument("Expected a boolean, got '" + value + "'");
}

std::size_t ParseSize(const std::string &value, const std::string &name) {
  const auto trimmed = Trim(value);
  if (trimmed.empty() ||
      !std::all_of(trimmed.begin(), trimmed.end(),
                   [](unsigned char c) { return std::isdigit(c) != 0; })) {
    throw std::invalid_argument(name + " expects a non-negative number, got '" +
                                value + "'");
  }
  try {
    return static_cast<std::size_t>(std::stoull(trimmed));
  } catch (const std::out_of_range &) {
    throw std::invalid_argument(name + " is out of range: " + value);
  }
}

std::chrono::milliseconds ParseSeconds(const std::string &value,
                                       const std::string &name) {
  double seconds = 0.0;
  try {
    std::size_t consumed = 0;
    seconds = std::stod(Trim(value), &consumed);
    if (consumed != Trim(value).size()) {
      throw std::invalid_argument(value);
    }
  } catch (const std::logic_error &) {
    throw std::invalid_argument(name + " expects seconds, got '" + value + "'");
  }
  if (seconds <= 0.0) {
    throw std::invalid_argument(name + " must be positive");
  }
  return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, CliOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level =
        metatree::ParseLogLevel(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = metatree::LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = metatree::LogLevel::kDebug;
    return true;
  }
  return false;
}

bool HandleTraversalOption(const std::vector<std::string> &arguments,
                           std::size_t &index, CliOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--recursive" || argument == "-r") {
    options.recursive = true;
    return true;
  }
  if (argument == "--traverse-subdatasets") {
    options.traverse_subdatasets = true;
    return true;
  }
  if (argument == "--subdataset-depth") {
    options.subdataset_depth =
        ParseSize(RequireValue(arguments, index, argument), argument);
    return true;
  }
  return false;
}

bool HandleRunOption(const std::vector<std::string> &arguments,
                     std::size_t &index, CliOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--jobs" || argument == "-j") {
    options.jobs = ParseSize(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--queue-capacity") {
    options.queue_capacity =
        ParseSize(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--extractor-timeout") {
    options.extractor_timeout =
        ParseSeconds(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--agent-name") {
    options.agent_name = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--agent-email") {
    options.agent_email = RequireValue(arguments, index, argument);
    return true;
  }
  return false;
}

bool HandleCommandOption(const std::vector<std::string> &arguments,
                         std::size_t &index, CliOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--id") {
    options.dataset_id = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--version") {
    options.dataset_version = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--parameter" || argument == "-p") {
    options.extractor_parameters.push_back(
        RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--allow-id-mismatch") {
    options.allow_id_mismatch = true;
    return true;
  }
  if (argument == "--allow-unknown") {
    options.allow_unknown = true;
    return true;
  }
  if (argument == "--allow-override") {
    options.allow_override = true;
    return true;
  }
  if (argument == "--additional-values") {
    options.additional_values = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--indexer") {
    options.indexer = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--provider") {
    options.provider = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--processor") {
    options.processors.push_back(RequireValue(arguments, index, argument));
    return true;
  }
  return false;
}

bool DispatchOption(const std::vector<std::string> &arguments,
                    std::size_t &index, CliOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--dataset" || argument == "-d") {
    options.dataset = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--store") {
    options.store = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, argument);
    return true;
  }
  return HandleLoggingOption(arguments, index, options) ||
         HandleTraversalOption(arguments, index, options) ||
         HandleRunOption(arguments, index, options) ||
         HandleCommandOption(arguments, index, options);
}

struct Session {
  std::shared_ptr<metatree::Logger> logger;
  metatree::AgentInfo agent;
};

Session OpenSession(const CliOptions &options, std::ostream &log_stream) {
  metatree::LoggingConfig logging;
  logging.level = options.log_level.value_or(metatree::LogLevel::kWarn);
  Session session;
  session.logger = metatree::MakeLogger(logging, log_stream);

  const char *user = std::getenv("USER");
  session.agent.name = options.agent_name.value_or(
      user != nullptr && *user != '\0' ? user : "unknown");
  session.agent.email = options.agent_email.value_or("");
  return session;
}

std::shared_ptr<metatree::DirectoryRepository>
OpenDataset(const CliOptions &options, const Session &session) {
  const auto root = std::filesystem::weakly_canonical(
      options.dataset.value_or(std::filesystem::current_path()));
  return std::make_shared<metatree::DirectoryRepository>(root, session.logger);
}

std::filesystem::path StorePath(const CliOptions &options,
                                const metatree::DatasetRepository &dataset) {
  return options.store ? *options.store : dataset.MetadataStorePath();
}

void RequirePositionals(const CliOptions &options, std::size_t minimum,
                        std::size_t maximum, const std::string &command) {
  const auto count = options.positionals.size();
  if (count < minimum || count > maximum) {
    throw std::invalid_argument("Wrong number of arguments for " + command +
                                ", see 'metatree " + command + " --help'");
  }
}

metatree::RunReport SingleItemReport(metatree::ItemReport item) {
  metatree::RunReport report;
  report.state = metatree::RunState::kCompleted;
  report.summary.Add(item.outcome);
  report.items.push_back(std::move(item));
  return report;
}

void PrintSummary(const metatree::RunReport &report, std::ostream &stream) {
  stream << "summary: " << metatree::SummaryJson(report).dump() << "\n";
}

// Stops conductor once SIGINT or SIGTERM arrives. Restores the previous
// handlers when destroyed.
class InterruptWatcher {
public:
  explicit InterruptWatcher(metatree::Conductor &conductor) {
    g_interrupted.store(false);
    previous_interrupt_ = std::signal(SIGINT, HandleInterrupt);
    previous_terminate_ = std::signal(SIGTERM, HandleInterrupt);
    thread_ = std::thread([this, &conductor] {
      while (!done_.load()) {
        if (g_interrupted.load()) {
          conductor.RequestStop();
          return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
    });
  }
  ~InterruptWatcher() {
    done_.store(true);
    if (thread_.joinable()) {
      thread_.join();
    }
    std::signal(SIGINT, previous_interrupt_);
    std::signal(SIGTERM, previous_terminate_);
  }
  InterruptWatcher(const InterruptWatcher &) = delete;
  InterruptWatcher &operator=(const InterruptWatcher &) = delete;

private:
  using Handler = void (*)(int);
  Handler previous_interrupt_ = SIG_DFL;
  Handler previous_terminate_ = SIG_DFL;
  std::atomic<bool> done_{false};
  std::thread thread_;
};

metatree::ConductOptions BuildConductOptions(const CliOptions &options) {
  metatree::ConductOptions conduct;
  conduct.jobs = options.jobs.value_or(1);
  conduct.queue_capacity = options.queue_capacity.value_or(0);
  return conduct;
}

metatree::RunReport RunPipeline(metatree::ConductPipelineBuilder &builder,
                                const metatree::CommandStreams &streams,
                                bool show_metadata) {
  auto conductor = builder.Build();
  const InterruptWatcher watcher(*conductor);
  return conductor->Run([&](const metatree::ItemReport &item) {
    auto line = metatree::ToJson(item);
    if (!show_metadata) {
      line.erase("metadata");
    }
    metatree::WriteJsonLine(*streams.output, line);
  });
}

int RunInit(const CliOptions &options, const metatree::CommandStreams &streams) {
  RequirePositionals(options, 0, 1, "init");
  const auto session = OpenSession(options, *streams.error);
  const auto root =
      options.positionals.empty()
          ? options.dataset.value_or(std::filesystem::current_path())
          : std::filesystem::path(options.positionals.front());
  std::filesystem::create_directories(root);
  const auto dataset = metatree::DirectoryRepository::Init(
      std::filesystem::weakly_canonical(root), options.dataset_id,
      options.dataset_version, session.logger);
  const auto store =
      metatree::MetadataStore::Open(StorePath(options, *dataset), session.logger);
  metatree::WriteJsonLine(*streams.output,
                          {{"action", "init"},
                           {"status", "ok"},
                           {"path", dataset->Root().string()},
                           {"dataset_id", dataset->Id()},
                           {"dataset_version", dataset->Version()},
                           {"store", store->Root().string()}});
  return metatree::kExitSuccess;
}

metatree::WorkItem ExtractionItem(const CliOptions &options,
                                  const metatree::DirectoryRepository &dataset,
                                  std::shared_ptr<const metatree::DatasetRepository>
                                      handle) {
  metatree::WorkItem item;
  if (options.positionals.size() == 1) {
    item.kind = metatree::WorkItemKind::kDataset;
    item.path = ".";
    item.entry = metatree::TreeEntry{dataset.Root(), "",
                                     metatree::TreeEntryType::kDataset,
                                     dataset.Id(), dataset.Version(), "", ""};
    item.dataset = std::move(handle);
    return item;
  }

  std::filesystem::path file(options.positionals[1]);
  if (file.is_absolute()) {
    file = std::filesystem::weakly_canonical(file).lexically_relative(
        dataset.Root());
  }
  const auto wanted = metatree::NormalizeRelativePath(file.generic_string());
  for (auto &entry : dataset.Enumerate(true)) {
    if (entry.type != metatree::TreeEntryType::kFile || entry.path != wanted) {
      continue;
    }
    item.kind = metatree::WorkItemKind::kFile;
    item.path = entry.path;
    if (entry.dataset_path.empty()) {
      item.dataset = std::move(handle);
    } else {
      item.dataset = dataset.OpenSubdataset(entry.dataset_path);
    }
    item.entry = std::move(entry);
    return item;
  }
  throw metatree::NotFoundError("'" + options.positionals[1] +
                                "' is not a file of dataset " +
                                dataset.Root().string());
}

int RunExtract(const CliOptions &options,
               const metatree::CommandStreams &streams) {
  RequirePositionals(options, 1, 2, "extract");
  const auto session = OpenSession(options, *streams.error);
  const auto dataset = OpenDataset(options, session);

  metatree::StageArguments arguments;
  for (const auto &parameter : options.extractor_parameters) {
    const auto equals = parameter.find('=');
    if (equals == std::string::npos || equals == 0) {
      throw std::invalid_argument("--parameter expects key=value, got '" +
                                  parameter + "'");
    }
    arguments[parameter.substr(0, equals)] = parameter.substr(equals + 1);
  }
  arguments["extractor"] = options.positionals.front();
  arguments["type"] = options.positionals.size() == 1 ? "dataset" : "file";

  metatree::ConductEnvironment environment;
  environment.dataset = dataset;
  environment.agent = session.agent;
  environment.logger = session.logger;
  if (options.extractor_timeout) {
    environment.extractor_timeout = *options.extractor_timeout;
  }
  metatree::ExtractProcessor processor(
      metatree::ExtractOptionsFromArguments(arguments, environment),
      metatree::GlobalComponentRegistry(), dataset, session.logger);

  metatree::PipelineItem item{ExtractionItem(options, *dataset, dataset), {}};
  metatree::ItemReport report;
  report.item = item.work.path;
  report.kind = item.work.kind;
  report.stage = processor.Name();
  const std::atomic<bool> never_stopped{false};
  try {
    auto result = processor.Process(
        item, metatree::PipelineContext{&never_stopped, session.logger});
    report.outcome = result.outcome;
    report.message = std::move(result.message);
  } catch (const metatree::ExternalFailure &error) {
    report.outcome = metatree::ItemOutcome::kError;
    report.message = error.what();
  }

  for (const auto &record : item.records) {
    metatree::WriteJsonLine(*streams.output, metatree::ToWireJson(record));
  }
  if (report.outcome != metatree::ItemOutcome::kOk) {
    *streams.error << metatree::ToJson(report).dump() << "\n";
  }
  const auto run = SingleItemReport(std::move(report));
  PrintSummary(run, *streams.error);
  return metatree::RunExitCode(run);
}

int RunAdd(const CliOptions &options, const metatree::CommandStreams &streams) {
  RequirePositionals(options, 0, 1, "add");
  const auto session = OpenSession(options, *streams.error);
  const auto dataset = OpenDataset(options, session);
  const auto store =
      metatree::MetadataStore::Open(StorePath(options, *dataset), session.logger);

  metatree::StageArguments add_arguments;
  add_arguments["allow_id_mismatch"] = options.allow_id_mismatch ? "true" : "false";
  add_arguments["allow_unknown"] = options.allow_unknown ? "true" : "false";
  add_arguments["allow_override"] = options.allow_override ? "true" : "false";
  if (options.additional_values) {
    add_arguments["additional_values"] = *options.additional_values;
  }

  metatree::ConductEnvironment environment;
  environment.dataset = dataset;
  environment.store = store;
  environment.input = streams.input;
  environment.logger = session.logger;

  metatree::ConductPipelineBuilder builder;
  builder.WithLogger(session.logger)
      .WithEnvironment(environment)
      .WithOptions(BuildConductOptions(options))
      .WithProviderSpec(metatree::StageSpec{
          "json-lines",
          {{"input", options.positionals.empty() ? std::string("-")
                                                 : options.positionals.front()}}})
      .WithProcessor(std::make_unique<metatree::AddProcessor>(
          store, dataset, metatree::AddOptionsFromArguments(add_arguments),
          session.logger));
  const auto report = RunPipeline(builder, streams, false);
  PrintSummary(report, *streams.error);
  return metatree::RunExitCode(report);
}

metatree::IndexQuery BuildDumpQuery(const CliOptions &options,
                                    const Session &session) {
  const auto url = metatree::ParseMetadataUrl(
      options.positionals.empty() ? "" : options.positionals.front());
  const auto root_id = url.scheme == metatree::MetadataUrlScheme::kUuid
                           ? std::string()
                           : OpenDataset(options, session)->Id();
  return metatree::QueryForUrl(url, root_id, options.recursive.value_or(false));
}

int RunDump(const CliOptions &options, const metatree::CommandStreams &streams) {
  RequirePositionals(options, 0, 1, "dump");
  const auto session = OpenSession(options, *streams.error);
  const auto store_path =
      options.store ? *options.store
                    : OpenDataset(options, session)->MetadataStorePath();
  const auto store =
      metatree::MetadataStore::OpenExisting(store_path, session.logger);
  const auto query = BuildDumpQuery(options, session);

  std::unique_ptr<metatree::Indexer> indexer;
  if (options.indexer) {
    indexer = metatree::GlobalComponentRegistry().CreateIndexer(*options.indexer);
  }

  const auto entries = store->Dump(query);
  for (const auto &entry : entries) {
    auto line = metatree::ToDumpJson(entry);
    if (indexer) {
      line["indexed_metadata"] = indexer->Index(entry.record);
    }
    metatree::WriteJsonLine(*streams.output, line);
  }
  if (entries.empty()) {
    *streams.error << "No metadata for '"
                   << (options.positionals.empty() ? ""
                                                   : options.positionals.front())
                   << "'\n";
  }
  return metatree::kExitSuccess;
}

metatree::StageArguments
FilterArguments(const std::vector<std::string> &arguments) {
  metatree::StageArguments parsed;
  std::size_t position = 0;
  for (const auto &argument : arguments) {
    const auto equals = argument.find('=');
    if (equals == std::string::npos) {
      parsed[std::to_string(position++)] = argument;
    } else {
      parsed[argument.substr(0, equals)] = argument.substr(equals + 1);
    }
  }
  return parsed;
}

int RunFilter(const CliOptions &options,
              const metatree::CommandStreams &streams) {
  RequirePositionals(options, 2, std::numeric_limits<std::size_t>::max(),
                     "filter");
  const auto session = OpenSession(options, *streams.error);
  // Only tree addresses and the default store need the dataset.
  std::shared_ptr<metatree::DirectoryRepository> dataset;
  const auto open_dataset = [&]() -> const metatree::DirectoryRepository & {
    if (!dataset) {
      dataset = OpenDataset(options, session);
    }
    return *dataset;
  };
  const auto store = metatree::MetadataStore::OpenExisting(
      options.store ? *options.store : open_dataset().MetadataStorePath(),
      session.logger);
  const auto filter = metatree::GlobalComponentRegistry().CreateFilter(
      options.positionals.front(), FilterArguments(options.filter_arguments));

  std::size_t produced = 0;
  const auto emit = [&](const std::vector<metatree::MetadataRecord> &records) {
    for (const auto &record : records) {
      metatree::WriteJsonLine(*streams.output,
                              metatree::ToWireJson(record, std::nullopt));
      ++produced;
    }
  };
  for (std::size_t i = 1; i < options.positionals.size(); ++i) {
    const auto url = metatree::ParseMetadataUrl(options.positionals[i]);
    const auto query = metatree::QueryForUrl(
        url,
        url.scheme == metatree::MetadataUrlScheme::kUuid ? std::string()
                                                         : open_dataset().Id(),
        options.recursive.value_or(false));
    for (const auto &location : store->Indices().Resolve(query)) {
      emit(filter->Consume(store->LoadRecord(location.entry.ref)));
    }
  }
  emit(filter->Finish());
  *streams.error << "summary: " << nlohmann::json{{"records", produced}}.dump()
                 << "\n";
  return metatree::kExitSuccess;
}

int RunAggregate(const CliOptions &options,
                 const metatree::CommandStreams &streams) {
  const auto session = OpenSession(options, *streams.error);
  const auto dataset = OpenDataset(options, session);
  const auto store =
      metatree::MetadataStore::Open(StorePath(options, *dataset), session.logger);

  metatree::AggregateOptions aggregate;
  aggregate.depth = options.subdataset_depth;
  aggregate.paths = options.positionals;

  metatree::Aggregator aggregator(store, session.logger);
  const auto report = aggregator.Aggregate(dataset, aggregate);
  for (const auto &sub : report.subdatasets) {
    metatree::WriteJsonLine(*streams.output, metatree::ToJson(sub));
  }
  *streams.error << "summary: "
                 << nlohmann::json{{"subdatasets", report.subdatasets.size()},
                                   {"failed", report.FailedCount()}}
                        .dump()
                 << "\n";
  return metatree::AggregationExitCode(report);
}

metatree::StageSpec ProviderSpec(const CliOptions &options) {
  auto spec = metatree::ParseStageSpec(
      options.provider.value_or("dataset-traversal"));
  const auto set_default = [&](const std::string &key, const std::string &value) {
    spec.arguments.emplace(key, value);
  };
  if (spec.name != "dataset-traversal" && spec.name != "metadata-traversal") {
    return spec;
  }
  if (options.recursive) {
    set_default("recursive", *options.recursive ? "true" : "false");
  }
  if (spec.name == "metadata-traversal") {
    return spec;
  }
  if (options.traverse_subdatasets) {
    set_default("traverse_subdatasets",
                *options.traverse_subdatasets ? "true" : "false");
  }
  if (options.subdataset_depth) {
    set_default("subdataset_depth", std::to_string(*options.subdataset_depth));
  }
  return spec;
}

int RunConduct(const CliOptions &options,
               const metatree::CommandStreams &streams) {
  RequirePositionals(options, 0, 0, "conduct");
  const auto session = OpenSession(options, *streams.error);
  const auto dataset = OpenDataset(options, session);
  const auto store =
      metatree::MetadataStore::Open(StorePath(options, *dataset), session.logger);

  metatree::ConductEnvironment environment;
  environment.dataset = dataset;
  environment.store = store;
  environment.agent = session.agent;
  environment.input = streams.input;
  environment.logger = session.logger;
  if (options.extractor_timeout) {
    environment.extractor_timeout = *options.extractor_timeout;
  }

  metatree::ConductPipelineBuilder builder;
  builder.WithLogger(session.logger)
      .WithEnvironment(environment)
      .WithOptions(BuildConductOptions(options))
      .WithProviderSpec(ProviderSpec(options));
  for (const auto &processor : options.processors) {
    builder.WithProcessorSpec(metatree::ParseStageSpec(processor));
  }
  const auto report = RunPipeline(builder, streams, true);
  PrintSummary(report, *streams.error);
  return metatree::RunExitCode(report);
}

int RunExport(const CliOptions &options,
              const metatree::CommandStreams &streams) {
  RequirePositionals(options, 1, 1, "export");
  const auto session = OpenSession(options, *streams.error);
  const auto store_path =
      options.store ? *options.store
                    : OpenDataset(options, session)->MetadataStorePath();
  const auto store =
      metatree::MetadataStore::OpenExisting(store_path, session.logger);
  const auto summary = metatree::ExportStore(
      *store, options.positionals.front(), session.logger);
  metatree::WriteJsonLine(*streams.output,
                          {{"action", "export"},
                           {"status", "ok"},
                           {"path", options.positionals.front()},
                           {"indices", summary.indices},
                           {"objects", summary.objects}});
  return metatree::kExitSuccess;
}

int RunImport(const CliOptions &options,
              const metatree::CommandStreams &streams) {
  RequirePositionals(options, 1, 1, "import");
  const auto session = OpenSession(options, *streams.error);
  const auto store_path =
      options.store ? *options.store
                    : OpenDataset(options, session)->MetadataStorePath();
  const auto store = metatree::MetadataStore::Open(store_path, session.logger);
  const auto summary = metatree::ImportStore(
      *store, options.positionals.front(), session.logger);
  metatree::WriteJsonLine(*streams.output,
                          {{"action", "import"},
                           {"status", "ok"},
                           {"path", options.positionals.front()},
                           {"indices", summary.indices},
                           {"objects", summary.objects}});
  return metatree::kExitSuccess;
}

} // namespace

namespace metatree {

CommandStreams StandardStreams() {
  return CommandStreams{&std::cin, &std::cout, &std::cerr};
}

const std::vector<std::string> &CommandNames() {
  static const std::vector<std::string> names = {
      "init", "extract", "add", "dump", "filter", "aggregate", "conduct",
      "export", "import"};
  return names;
}

void PrintGlobalUsage(std::ostream &stream) {
  stream << "Usage: metatree <command> [options]\n\n"
         << "Commands:\n"
         << "  init       Make a directory a dataset.\n"
         << "  extract    Run one extractor on a dataset or file.\n"
         << "  add        Add JSON Lines records to the metadata store.\n"
         << "  dump       Print stored metadata.\n"
         << "  filter     Run a metadata filter over stored records.\n"
         << "  aggregate  Copy sub-dataset metadata into the dataset's store.\n"
         << "  conduct    Run a provider/processor pipeline.\n"
         << "  export     Write the store to a directory tree.\n"
         << "  import     Read an exported tree into the store.\n\n"
         << "Run 'metatree <command> --help' for command options.\n";
}

CliOptions ParseCommandArguments(const std::vector<std::string> &arguments) {
  CliOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    if (argument == "++") {
      options.filter_arguments.assign(arguments.begin() + i + 1,
                                      arguments.end());
      break;
    }
    if (argument == "-" || argument.rfind('-', 0) != 0) {
      options.positionals.push_back(argument);
      continue;
    }
    if (!DispatchOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + argument);
    }
    if (options.show_help) {
      break;
    }
  }
  return options;
}

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {"dataset",
                                                "store",
                                                "jobs",
                                                "queue_capacity",
                                                "log_level",
                                                "agent_name",
                                                "agent_email",
                                                "extractor_timeout",
                                                "recursive",
                                                "traverse_subdatasets",
                                                "subdataset_depth"};
  return keys;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"dataset_path", "dataset"},
      {"store_path", "store"},
      {"workers", "jobs"},
      {"traverse_sub_datasets", "traverse_subdatasets"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

namespace {

using ConfigValue = std::variant<std::string, bool>;
using RawConfig = std::unordered_map<std::string, ConfigValue>;

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw ConfigurationError(message);
}

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = SupportedConfigKeys();
  if (std::find(supported.begin(), supported.end(), normalized) ==
      supported.end()) {
    ThrowUnknownKey(key);
  }
  return normalized;
}

ConfigValue ToConfigValue(const std::string &key, const YAML::Node &node) {
  if (!node.IsScalar()) {
    throw ConfigurationError("Config key '" + key + "' must be a scalar value");
  }
  if (key == "recursive" || key == "traverse_subdatasets") {
    return ConfigValue{ParseBool(node.as<std::string>())};
  }
  return ConfigValue{node.as<std::string>()};
}

RawConfig ParseYamlConfig(const std::filesystem::path &path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::Exception &error) {
    throw ConfigurationError("Cannot read " + path.string() + ": " +
                             error.what());
  }
  if (!root.IsMap()) {
    throw ConfigurationError("Config file must contain a mapping at the root");
  }

  RawConfig config;
  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey(entry.first.as<std::string>());
    config[key] = ToConfigValue(key, entry.second);
  }
  return config;
}

void ApplyConfig(const RawConfig &config, CliOptions &options) {
  for (const auto &[key, value] : config) {
    if (key == "recursive") {
      options.recursive = std::get<bool>(value);
      continue;
    }
    if (key == "traverse_subdatasets") {
      options.traverse_subdatasets = std::get<bool>(value);
      continue;
    }
    const auto &text = std::get<std::string>(value);
    if (key == "dataset") {
      options.dataset = text;
    } else if (key == "store") {
      options.store = text;
    } else if (key == "jobs") {
      options.jobs = ParseSize(text, key);
    } else if (key == "queue_capacity") {
      options.queue_capacity = ParseSize(text, key);
    } else if (key == "log_level") {
      options.log_level = ParseLogLevel(text);
    } else if (key == "agent_name") {
      options.agent_name = text;
    } else if (key == "agent_email") {
      options.agent_email = text;
    } else if (key == "extractor_timeout") {
      options.extractor_timeout = ParseSeconds(text, key);
    } else if (key == "subdataset_depth") {
      options.subdataset_depth = ParseSize(text, key);
    } else {
      ThrowUnknownKey(key);
    }
  }
}

} // namespace

CliOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw ConfigurationError("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw ConfigurationError("Unsupported config format: " + extension);
  }

  CliOptions options;
  options.config_file = path;
  ApplyConfig(ParseYamlConfig(path), options);
  return options;
}

CliOptions MergeOptions(const CliOptions &config_options,
                        const CliOptions &cli_options) {
  CliOptions merged = cli_options;
  const auto fallback = [](auto &target, const auto &source) {
    if (!target) {
      target = source;
    }
  };
  fallback(merged.dataset, config_options.dataset);
  fallback(merged.store, config_options.store);
  fallback(merged.config_file, config_options.config_file);
  fallback(merged.log_level, config_options.log_level);
  fallback(merged.agent_name, config_options.agent_name);
  fallback(merged.agent_email, config_options.agent_email);
  fallback(merged.jobs, config_options.jobs);
  fallback(merged.queue_capacity, config_options.queue_capacity);
  fallback(merged.extractor_timeout, config_options.extractor_timeout);
  fallback(merged.recursive, config_options.recursive);
  fallback(merged.traverse_subdatasets, config_options.traverse_subdatasets);
  fallback(merged.subdataset_depth, config_options.subdataset_depth);
  return merged;
}

CliOptions ResolveOptions(const CliOptions &cli_options) {
  if (cli_options.show_help || !cli_options.config_file) {
    return cli_options;
  }
  return MergeOptions(ParseConfigFile(*cli_options.config_file), cli_options);
}

int RunCommand(const std::string &command,
               const std::vector<std::string> &arguments,
               const CommandStreams &streams) {
  const auto &names = CommandNames();
  if (std::find(names.begin(), names.end(), command) == names.end()) {
    throw std::invalid_argument("Unknown command: " + command);
  }
  const auto cli_options = ParseCommandArguments(arguments);
  if (cli_options.show_help) {
    PrintCommandUsage(command, *streams.output);
    return kExitSuccess;
  }
  const auto options = ResolveOptions(cli_options);

  if (command == "init") {
    return RunInit(options, streams);
  }
  if (command == "extract") {
    return RunExtract(options, streams);
  }
  if (command == "add") {
    return RunAdd(options, streams);
  }
  if (command == "dump") {
    return RunDump(options, streams);
  }
  if (command == "filter") {
    return RunFilter(options, streams);
  }
  if (command == "aggregate") {
    return RunAggregate(options, streams);
  }
  if (command == "conduct") {
    return RunConduct(options, streams);
  }
  if (command == "export") {
    return RunExport(options, streams);
  }
  return RunImport(options, streams);
}

} // namespace metatree
