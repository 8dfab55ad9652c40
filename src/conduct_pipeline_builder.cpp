#include <metatree/conduct_pipeline_builder.h>

#include <metatree/errors.h>

#include <utility>

namespace metatree {
namespace {

std::vector<std::string> SplitArguments(std::string_view text) {
  std::vector<std::string> parts;
  std::string current;
  int depth = 0;
  bool quoted = false;
  for (const char c : text) {
    if (c == '"') {
      quoted = !quoted;
    } else if (!quoted && (c == '[' || c == '{')) {
      ++depth;
    } else if (!quoted && (c == ']' || c == '}')) {
      --depth;
    } else if (!quoted && depth == 0 && c == ',') {
      parts.push_back(current);
      current.clear();
      continue;
    }
    current.push_back(c);
  }
  if (quoted || depth != 0) {
    throw ConfigurationError("Unbalanced brackets or quotes in '" +
                             std::string(text) + "'");
  }
  parts.push_back(current);
  return parts;
}

} // namespace

StageSpec ParseStageSpec(std::string_view text) {
  StageSpec spec;
  const auto colon = text.find(':');
  spec.name = std::string(text.substr(0, colon));
  if (spec.name.empty()) {
    throw ConfigurationError("Stage name missing in '" + std::string(text) +
                             "'");
  }
  if (colon == std::string_view::npos) {
    return spec;
  }
  for (const auto &part : SplitArguments(text.substr(colon + 1))) {
    if (part.empty()) {
      continue;
    }
    const auto equals = part.find('=');
    const auto key = part.substr(0, equals);
    if (key.empty()) {
      throw ConfigurationError("Argument name missing in '" +
                               std::string(text) + "'");
    }
    spec.arguments[key] =
        equals == std::string::npos ? "true" : part.substr(equals + 1);
  }
  return spec;
}

ConductPipelineBuilder::ConductPipelineBuilder(
    const ComponentRegistry &registry)
    : registry_(&registry) {}

ConductPipelineBuilder &
ConductPipelineBuilder::WithProvider(std::unique_ptr<Provider> provider) {
  provider_ = std::move(provider);
  provider_spec_.reset();
  return *this;
}

ConductPipelineBuilder &ConductPipelineBuilder::WithProviderSpec(StageSpec spec) {
  provider_spec_ = std::move(spec);
  provider_.reset();
  return *this;
}

ConductPipelineBuilder &
ConductPipelineBuilder::WithProcessor(std::unique_ptr<Processor> processor) {
  processors_.push_back(ProcessorSlot{std::nullopt, std::move(processor)});
  return *this;
}

ConductPipelineBuilder &
ConductPipelineBuilder::WithProcessorSpec(StageSpec spec) {
  processors_.push_back(ProcessorSlot{std::move(spec), nullptr});
  return *this;
}

ConductPipelineBuilder &
ConductPipelineBuilder::WithEnvironment(ConductEnvironment environment) {
  environment_ = std::move(environment);
  return *this;
}

ConductPipelineBuilder &ConductPipelineBuilder::WithOptions(ConductOptions options) {
  options_ = options;
  return *this;
}

ConductPipelineBuilder &
ConductPipelineBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  logger_ = std::move(logger);
  return *this;
}

std::unique_ptr<Conductor> ConductPipelineBuilder::Build() {
  logger_ = EnsureLogger(logger_ ? std::move(logger_) : environment_.logger);
  environment_.logger = logger_;
  environment_.registry = registry_;

  if (!provider_) {
    const auto spec = provider_spec_.value_or(StageSpec{});
    provider_ =
        registry_->CreateProvider(spec.name, spec.arguments, environment_);
  }
  if (processors_.empty()) {
    throw ConfigurationError("A pipeline needs at least one processor");
  }

  std::vector<std::unique_ptr<Processor>> processors;
  processors.reserve(processors_.size());
  for (auto &slot : processors_) {
    if (slot.instance) {
      processors.push_back(std::move(slot.instance));
      continue;
    }
    processors.push_back(registry_->CreateProcessor(
        slot.spec->name, slot.spec->arguments, environment_));
  }
  processors_.clear();

  logger_->Log(LogLevel::kDebug, "conduct.build",
               {{"provider", provider_->Name()},
                {"processors", std::to_string(processors.size())}});
  return std::make_unique<Conductor>(std::move(provider_),
                                     std::move(processors), options_, logger_);
}

} // namespace metatree
