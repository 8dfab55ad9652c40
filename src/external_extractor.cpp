#include <metatree/external_extractor.h>

#include <metatree/errors.h>
#include <metatree/subprocess.h>

#include <ostream>
#include <system_error>
#include <utility>

namespace metatree {
namespace {

std::string TrimTrailingWhitespace(std::string text) {
  while (!text.empty() &&
         (text.back() == '\n' || text.back() == '\r' || text.back() == ' ' ||
          text.back() == '\t')) {
    text.pop_back();
  }
  return text;
}

std::vector<std::string> StringList(const nlohmann::json &value,
                                    const char *key) {
  if (value.is_string()) {
    return {value.get<std::string>()};
  }
  if (!value.is_array()) {
    throw ConfigurationError(std::string("Parameter '") + key +
                             "' must be a string or a list of strings");
  }
  std::vector<std::string> values;
  for (const auto &item : value) {
    if (!item.is_string()) {
      throw ConfigurationError(std::string("Parameter '") + key +
                               "' must only hold strings");
    }
    values.push_back(item.get<std::string>());
  }
  return values;
}

std::optional<std::string> OptionalString(const nlohmann::json &parameters,
                                          const char *key) {
  if (!parameters.contains(key)) {
    return std::nullopt;
  }
  const auto &value = parameters.at(key);
  if (!value.is_string()) {
    throw ConfigurationError(std::string("Parameter '") + key +
                             "' must be a string");
  }
  return value.get<std::string>();
}

} // namespace

OutputMode ParseOutputCategory(const std::string &text) {
  if (text == "IMMEDIATE") {
    return OutputMode::kImmediate;
  }
  if (text == "FILE") {
    return OutputMode::kExternalFile;
  }
  throw ConfigurationError("Expected 'IMMEDIATE' or 'FILE' as data output "
                           "category, got '" +
                           text + "'");
}

ExternalExtractorConfig
ExternalExtractorConfig::FromParameters(const nlohmann::json &parameters) {
  if (!parameters.is_object() || !parameters.contains("command")) {
    throw ConfigurationError("Missing parameter: 'command'");
  }
  ExternalExtractorConfig config;
  config.command = StringList(parameters.at("command"), "command");
  if (config.command.empty() || config.command.front().empty()) {
    throw ConfigurationError("Parameter 'command' must name a program");
  }
  if (parameters.contains("arguments")) {
    config.arguments = StringList(parameters.at("arguments"), "arguments");
  }
  config.version = OptionalString(parameters, "version");
  config.extractor_id = OptionalString(parameters, "extractor-id");
  if (const auto category =
          OptionalString(parameters, "data-output-category")) {
    config.output_mode = ParseOutputCategory(*category);
  }
  return config;
}

ExternalExtractor::ExternalExtractor(ExtractorKind kind,
                                     ExtractorContext context)
    : kind_(kind), context_(std::move(context)),
      config_(ExternalExtractorConfig::FromParameters(context_.parameters)) {
  context_.logger = EnsureLogger(std::move(context_.logger));
  if (!context_.dataset) {
    throw ConfigurationError("External extractor needs a dataset");
  }
  if (kind_ == ExtractorKind::kFile && !context_.file) {
    throw ConfigurationError("External file extractor needs a file");
  }
}

std::string
ExternalExtractor::Execute(const std::vector<std::string> &flags) const {
  auto argv = config_.command;
  argv.insert(argv.end(), config_.arguments.begin(), config_.arguments.end());
  argv.insert(argv.end(), flags.begin(), flags.end());

  ProcessOptions options;
  options.timeout = context_.timeout;
  options.working_directory = context_.dataset->Root();
  options.stop_requested = context_.stop_requested;

  context_.logger->Log(LogLevel::kDebug, "extractor.external.run",
                       {{"program", argv.front()},
                        {"arguments", std::to_string(argv.size() - 1)}});
  ProcessResult result;
  try {
    result = RunProcess(argv, options);
  } catch (const std::system_error &error) {
    throw ExternalFailure(error.what());
  }
  if (result.timed_out) {
    throw ExternalFailure(argv.front() + " timed out after " +
                          std::to_string(context_.timeout.count()) + " ms");
  }
  if (result.stopped) {
    throw ExternalFailure(argv.front() + " was stopped");
  }
  if (result.exit_code != 0) {
    const auto detail = result.exit_code < 0
                            ? "signal " + std::to_string(result.term_signal)
                            : "status " + std::to_string(result.exit_code);
    throw ExternalFailure(argv.front() + " failed with " + detail + ": " +
                          TrimTrailingWhitespace(result.standard_error));
  }
  return result.standard_output;
}

std::string ExternalExtractor::GetId() {
  if (!config_.extractor_id) {
    config_.extractor_id = TrimTrailingWhitespace(Execute({"--get-uuid"}));
  }
  return *config_.extractor_id;
}

std::string ExternalExtractor::GetVersion() {
  if (!config_.version) {
    config_.version = TrimTrailingWhitespace(Execute({"--get-version"}));
  }
  return *config_.version;
}

OutputMode ExternalExtractor::GetOutputMode() {
  if (!config_.output_mode) {
    try {
      config_.output_mode = ParseOutputCategory(
          TrimTrailingWhitespace(Execute({"--get-data-output-category"})));
    } catch (const ConfigurationError &error) {
      throw ExternalFailure(error.what());
    }
  }
  return *config_.output_mode;
}

bool ExternalExtractor::EnsureContentAvailable() {
  if (kind_ == ExtractorKind::kDataset) {
    return true;
  }
  std::error_code error;
  return std::filesystem::exists(context_.file->absolute_path, error);
}

std::vector<std::string> ExternalExtractor::ExtractArguments() const {
  std::vector<std::string> arguments = {"--extract",
                                        context_.dataset->Root().string(),
                                        context_.dataset->Version()};
  if (kind_ == ExtractorKind::kFile) {
    arguments.push_back(context_.file->absolute_path.string());
    arguments.push_back(context_.file->intra_dataset_path);
  }
  return arguments;
}

ExtractorResult ExternalExtractor::Extract(std::ostream &sink) {
  const auto mode = GetOutputMode();
  const auto output = Execute(ExtractArguments());

  ExtractorResult result;
  result.extractor_version = GetVersion();
  result.parameters = context_.parameters;
  result.success = true;
  result.status_fields = {{"type", ToString(kind_)}, {"status", "ok"}};
  if (mode == OutputMode::kExternalFile) {
    sink << output;
    return result;
  }
  try {
    result.immediate_data = nlohmann::json::parse(output);
  } catch (const nlohmann::json::parse_error &error) {
    throw ExternalFailure("Output of " + config_.command.front() +
                          " is not JSON: " + error.what());
  }
  return result;
}

} // namespace metatree
