#pragma once

#include <metatree/logging.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace metatree {

struct CliOptions {
  std::optional<std::filesystem::path> dataset;
  std::optional<std::filesystem::path> store;
  std::optional<std::filesystem::path> config_file;
  std::optional<LogLevel> log_level;
  std::optional<std::string> agent_name;
  std::optional<std::string> agent_email;
  std::optional<std::size_t> jobs;
  std::optional<std::size_t> queue_capacity;
  std::optional<std::chrono::milliseconds> extractor_timeout;
  std::optional<bool> recursive;
  std::optional<bool> traverse_subdatasets;
  std::optional<std::size_t> subdataset_depth;

  // init
  std::optional<std::string> dataset_id;
  std::optional<std::string> dataset_version;
  // extract
  std::vector<std::string> extractor_parameters;
  // add
  bool allow_id_mismatch = false;
  bool allow_unknown = false;
  bool allow_override = false;
  std::optional<std::string> additional_values;
  // dump
  std::optional<std::string> indexer;
  // conduct
  std::optional<std::string> provider;
  std::vector<std::string> processors;
  // filter: everything after "++"
  std::vector<std::string> filter_arguments;

  std::vector<std::string> positionals;
  bool show_help = false;
};

struct CommandStreams {
  std::istream *input;
  std::ostream *output;
  std::ostream *error;
};

CommandStreams StandardStreams();

const std::vector<std::string> &CommandNames();
const std::vector<std::string> &SupportedConfigKeys();
std::string NormalizeConfigKey(std::string key);

CliOptions ParseCommandArguments(const std::vector<std::string> &arguments);
CliOptions ParseConfigFile(const std::filesystem::path &path);
// Values set in cli_options win over config_options.
CliOptions MergeOptions(const CliOptions &config_options,
                        const CliOptions &cli_options);
CliOptions ResolveOptions(const CliOptions &cli_options);

// Runs one sub-command and returns its exit code. Usage and configuration
// errors are thrown.
int RunCommand(const std::string &command,
               const std::vector<std::string> &arguments,
               const CommandStreams &streams = StandardStreams());

void PrintGlobalUsage(std::ostream &stream);

} // namespace metatree
