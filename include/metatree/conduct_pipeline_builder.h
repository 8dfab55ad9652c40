#pragma once

#include <metatree/component_registry.h>
#include <metatree/conductor.h>
#include <metatree/logging.h>
#include <metatree/pipeline.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace metatree {

struct StageSpec {
  std::string name;
  StageArguments arguments;
};

// "name" or "name:key=value,key=value". Commas inside [...], {...} or
// double quotes do not separate arguments, so JSON values can be passed.
// A key without '=' is set to "true".
StageSpec ParseStageSpec(std::string_view text);

class ConductPipelineBuilder {
public:
  explicit ConductPipelineBuilder(
      const ComponentRegistry &registry = GlobalComponentRegistry());

  ConductPipelineBuilder &WithProvider(std::unique_ptr<Provider> provider);
  ConductPipelineBuilder &WithProviderSpec(StageSpec spec);
  // Processors run in the order they are added.
  ConductPipelineBuilder &WithProcessor(std::unique_ptr<Processor> processor);
  ConductPipelineBuilder &WithProcessorSpec(StageSpec spec);
  ConductPipelineBuilder &WithEnvironment(ConductEnvironment environment);
  ConductPipelineBuilder &WithOptions(ConductOptions options);
  ConductPipelineBuilder &WithLogger(std::shared_ptr<Logger> logger);

  // Resolves every stage before anything runs; unknown names and bad
  // arguments throw ConfigurationError.
  std::unique_ptr<Conductor> Build();

private:
  struct ProcessorSlot {
    std::optional<StageSpec> spec;
    std::unique_ptr<Processor> instance;
  };

  const ComponentRegistry *registry_;
  std::optional<StageSpec> provider_spec_;
  std::unique_ptr<Provider> provider_;
  std::vector<ProcessorSlot> processors_;
  ConductEnvironment environment_;
  ConductOptions options_;
  std::shared_ptr<Logger> logger_;
};

} // namespace metatree
