#pragma once

#include <metatree/extractors.h>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace metatree {

// Parameters of external_dataset / external_file:
//   command               program, or program plus leading arguments
//   arguments             extra arguments placed before the protocol flags
//   version               skips asking the program with --get-version
//   extractor-id          skips asking the program with --get-uuid
//   data-output-category  IMMEDIATE or FILE, skips
//                         --get-data-output-category
struct ExternalExtractorConfig {
  std::vector<std::string> command;
  std::vector<std::string> arguments;
  std::optional<std::string> version;
  std::optional<std::string> extractor_id;
  std::optional<OutputMode> output_mode;

  // Throws ConfigurationError on a missing command or malformed values.
  static ExternalExtractorConfig FromParameters(const nlohmann::json &parameters);
};

OutputMode ParseOutputCategory(const std::string &text);

// Delegates extraction to a program:
//   <command> <arguments> --extract <dataset root> <dataset version>
//   <command> <arguments> --extract <dataset root> <dataset version>
//                                   <file path> <path in dataset>
// A non-zero exit, a timeout or a stop request is an ExternalFailure.
class ExternalExtractor : public Extractor {
public:
  ExternalExtractor(ExtractorKind kind, ExtractorContext context);

  std::string GetId() override;
  std::string GetVersion() override;
  OutputMode GetOutputMode() override;
  ExtractorKind Kind() const override { return kind_; }
  bool EnsureContentAvailable() override;
  ExtractorResult Extract(std::ostream &sink) override;

private:
  std::string Execute(const std::vector<std::string> &flags) const;
  std::vector<std::string> ExtractArguments() const;

  ExtractorKind kind_;
  ExtractorContext context_;
  ExternalExtractorConfig config_;
};

} // namespace metatree
