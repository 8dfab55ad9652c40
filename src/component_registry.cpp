#include <metatree/component_registry.h>

#include <metatree/errors.h>
#include <metatree/external_extractor.h>
#include <metatree/filters.h>
#include <metatree/processors.h>
#include <metatree/providers.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace {

constexpr const char kDefaultIndexer[] = "flat";
constexpr const char kDefaultProvider[] = "dataset-traversal";

} // namespace

namespace metatree {

template <typename Factory>
std::vector<std::string>
ComponentRegistry::RegisteredNames(const ComponentSet<Factory> &set) {
  std::vector<std::string> names;
  names.reserve(set.factories.size());
  for (const auto &entry : set.factories) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

template <typename Factory>
std::string ComponentRegistry::JoinNames(const ComponentSet<Factory> &set) {
  const auto names = RegisteredNames(set);
  std::string message;
  for (std::size_t i = 0; i < names.size(); ++i) {
    message += names[i];
    if (i + 1 < names.size()) {
      message += ", ";
    }
  }
  return message;
}

template <typename Factory>
const Factory &ComponentRegistry::FindFactory(const std::string &name,
                                              const ComponentSet<Factory> &set,
                                              const std::string &kind) const {
  const auto target_name = name.empty() ? set.default_name : name;
  if (target_name.empty()) {
    throw ConfigurationError("No default " + kind + " registered");
  }
  const auto found = set.factories.find(target_name);
  if (found == set.factories.end()) {
    throw ConfigurationError("Unknown " + kind + " '" + target_name +
                             "'. Registered: " + JoinNames(set));
  }
  return found->second;
}

template <typename Factory>
void ComponentRegistry::RegisterComponent(const std::string &name,
                                          Factory factory,
                                          bool set_as_default,
                                          ComponentSet<Factory> &set) {
  if (name.empty()) {
    throw std::invalid_argument("Component name cannot be empty");
  }
  if (!factory) {
    throw std::invalid_argument("Factory for '" + name + "' cannot be null");
  }
  if (set.factories.count(name) != 0) {
    throw std::invalid_argument("Component with name '" + name +
                                "' already registered");
  }
  set.factories.emplace(name, std::move(factory));
  if (set_as_default || set.default_name.empty()) {
    set.default_name = name;
  }
}

namespace {

template <typename Component>
std::unique_ptr<Component> RequireInstance(std::unique_ptr<Component> instance,
                                           const std::string &kind,
                                           const std::string &name) {
  if (!instance) {
    throw std::runtime_error("Factory for " + kind + " '" + name +
                             "' returned null");
  }
  return instance;
}

} // namespace

void ComponentRegistry::RegisterExtractor(const std::string &name,
                                          ExtractorFactory factory,
                                          bool set_as_default) {
  RegisterComponent(name, std::move(factory), set_as_default, extractors_);
}

void ComponentRegistry::RegisterIndexer(const std::string &name,
                                        IndexerFactory factory,
                                        bool set_as_default) {
  RegisterComponent(name, std::move(factory), set_as_default, indexers_);
}

void ComponentRegistry::RegisterFilter(const std::string &name,
                                       FilterFactory factory) {
  RegisterComponent(name, std::move(factory), false, filters_);
}

void ComponentRegistry::RegisterProvider(const std::string &name,
                                         ProviderFactory factory,
                                         bool set_as_default) {
  RegisterComponent(name, std::move(factory), set_as_default, providers_);
}

void ComponentRegistry::RegisterProcessor(const std::string &name,
                                          ProcessorFactory factory,
                                          bool set_as_default) {
  RegisterComponent(name, std::move(factory), set_as_default, processors_);
}

std::unique_ptr<Extractor>
ComponentRegistry::CreateExtractor(const std::string &name,
                                   ExtractorContext context) const {
  if (name.empty()) {
    throw ConfigurationError("An extractor name is required");
  }
  const auto &factory = FindFactory(name, extractors_, "extractor");
  return RequireInstance(factory(std::move(context)), "extractor", name);
}

std::unique_ptr<Indexer>
ComponentRegistry::CreateIndexer(const std::string &name) const {
  const auto &factory = FindFactory(name, indexers_, "indexer");
  return RequireInstance(factory(), "indexer", name);
}

std::unique_ptr<MetadataFilter>
ComponentRegistry::CreateFilter(const std::string &name,
                                const StageArguments &arguments) const {
  if (name.empty()) {
    throw ConfigurationError("A filter name is required");
  }
  const auto &factory = FindFactory(name, filters_, "filter");
  return RequireInstance(factory(arguments), "filter", name);
}

std::unique_ptr<Provider>
ComponentRegistry::CreateProvider(const std::string &name,
                                  const StageArguments &arguments,
                                  const ConductEnvironment &environment) const {
  const auto &factory = FindFactory(name, providers_, "provider");
  return RequireInstance(factory(arguments, environment), "provider", name);
}

std::unique_ptr<Processor> ComponentRegistry::CreateProcessor(
    const std::string &name, const StageArguments &arguments,
    const ConductEnvironment &environment) const {
  if (name.empty()) {
    throw ConfigurationError("A processor name is required");
  }
  const auto &factory = FindFactory(name, processors_, "processor");
  return RequireInstance(factory(arguments, environment), "processor", name);
}

bool ComponentRegistry::HasExtractor(const std::string &name) const {
  return extractors_.factories.count(name) != 0;
}

std::vector<std::string> ComponentRegistry::ExtractorNames() const {
  return RegisteredNames(extractors_);
}

std::vector<std::string> ComponentRegistry::IndexerNames() const {
  return RegisteredNames(indexers_);
}

std::vector<std::string> ComponentRegistry::FilterNames() const {
  return RegisteredNames(filters_);
}

std::vector<std::string> ComponentRegistry::ProviderNames() const {
  return RegisteredNames(providers_);
}

std::vector<std::string> ComponentRegistry::ProcessorNames() const {
  return RegisteredNames(processors_);
}

const std::string &ComponentRegistry::DefaultIndexerName() const {
  return indexers_.default_name;
}

const std::string &ComponentRegistry::DefaultProviderName() const {
  return providers_.default_name;
}

ComponentRegistry MakeComponentRegistryWithDefaults() {
  ComponentRegistry registry;
  registry.RegisterExtractor("metalad_example_file", [](ExtractorContext context) {
    return std::make_unique<ExampleFileExtractor>(std::move(context));
  });
  registry.RegisterExtractor(
      "metalad_example_dataset", [](ExtractorContext context) {
        return std::make_unique<ExampleDatasetExtractor>(std::move(context));
      });
  registry.RegisterExtractor("metalad_core_file", [](ExtractorContext context) {
    return std::make_unique<CoreFileExtractor>(std::move(context));
  });
  registry.RegisterExtractor("external_file", [](ExtractorContext context) {
    return std::make_unique<ExternalExtractor>(ExtractorKind::kFile,
                                               std::move(context));
  });
  registry.RegisterExtractor("external_dataset", [](ExtractorContext context) {
    return std::make_unique<ExternalExtractor>(ExtractorKind::kDataset,
                                               std::move(context));
  });

  registry.RegisterIndexer(
      kDefaultIndexer, []() { return std::make_unique<FlatIndexer>(); }, true);

  registry.RegisterFilter(HistogramFilter::kName,
                          [](const StageArguments &arguments) {
                            return std::make_unique<HistogramFilter>(arguments);
                          });
  registry.RegisterFilter("match", [](const StageArguments &arguments) {
    return std::make_unique<MatchFilter>(RecordSelectorFromArguments(arguments));
  });

  registry.RegisterProvider(
      kDefaultProvider,
      [](const StageArguments &arguments,
         const ConductEnvironment &environment) -> std::unique_ptr<Provider> {
        return std::make_unique<DatasetTraverser>(
            environment.dataset, TraversalOptionsFromArguments(arguments),
            environment.logger);
      },
      true);
  registry.RegisterProvider(
      "json-lines",
      [](const StageArguments &arguments,
         const ConductEnvironment &environment) -> std::unique_ptr<Provider> {
        const auto input = StringArgument(arguments, "input").value_or("-");
        if (input != "-") {
          return std::make_unique<JsonLinesProvider>(
              std::filesystem::path(input), environment.dataset);
        }
        if (environment.input == nullptr) {
          throw ConfigurationError("json-lines has no standard input to read");
        }
        return std::make_unique<JsonLinesProvider>(*environment.input,
                                                   environment.dataset);
      });

  registry.RegisterProvider(
      "metadata-traversal",
      [](const StageArguments &arguments,
         const ConductEnvironment &environment) -> std::unique_ptr<Provider> {
        return std::make_unique<MetadataTraverser>(
            environment.store,
            MetadataQueryFromArguments(arguments, environment.dataset.get()),
            environment.dataset, environment.logger);
      });

  registry.RegisterProcessor(
      "extract",
      [](const StageArguments &arguments,
         const ConductEnvironment &environment) -> std::unique_ptr<Processor> {
        const auto &registry = environment.registry != nullptr
                                   ? *environment.registry
                                   : GlobalComponentRegistry();
        return std::make_unique<ExtractProcessor>(
            ExtractOptionsFromArguments(arguments, environment), registry,
            environment.dataset, environment.logger);
      });
  registry.RegisterProcessor(
      "add",
      [](const StageArguments &arguments,
         const ConductEnvironment &environment) -> std::unique_ptr<Processor> {
        return std::make_unique<AddProcessor>(
            environment.store, environment.dataset,
            AddOptionsFromArguments(arguments), environment.logger);
      });
  registry.RegisterProcessor(
      "filter",
      [](const StageArguments &arguments,
         const ConductEnvironment &environment) -> std::unique_ptr<Processor> {
        return std::make_unique<FilterProcessor>(
            RecordSelectorFromArguments(arguments), environment.logger);
      });
  return registry;
}

const ComponentRegistry &GlobalComponentRegistry() {
  static const ComponentRegistry registry = MakeComponentRegistryWithDefaults();
  return registry;
}

template const ComponentRegistry::ExtractorFactory &
ComponentRegistry::FindFactory<ComponentRegistry::ExtractorFactory>(
    const std::string &, const ComponentSet<ExtractorFactory> &,
    const std::string &) const;

template const ComponentRegistry::IndexerFactory &
ComponentRegistry::FindFactory<ComponentRegistry::IndexerFactory>(
    const std::string &, const ComponentSet<IndexerFactory> &,
    const std::string &) const;

template const ComponentRegistry::FilterFactory &
ComponentRegistry::FindFactory<ComponentRegistry::FilterFactory>(
    const std::string &, const ComponentSet<FilterFactory> &,
    const std::string &) const;

template const ComponentRegistry::ProviderFactory &
ComponentRegistry::FindFactory<ComponentRegistry::ProviderFactory>(
    const std::string &, const ComponentSet<ProviderFactory> &,
    const std::string &) const;

template const ComponentRegistry::ProcessorFactory &
ComponentRegistry::FindFactory<ComponentRegistry::ProcessorFactory>(
    const std::string &, const ComponentSet<ProcessorFactory> &,
    const std::string &) const;

template void
ComponentRegistry::RegisterComponent<ComponentRegistry::ExtractorFactory>(
    const std::string &, ComponentRegistry::ExtractorFactory, bool,
    ComponentSet<ComponentRegistry::ExtractorFactory> &);

template void
ComponentRegistry::RegisterComponent<ComponentRegistry::IndexerFactory>(
    const std::string &, ComponentRegistry::IndexerFactory, bool,
    ComponentSet<ComponentRegistry::IndexerFactory> &);

template void
ComponentRegistry::RegisterComponent<ComponentRegistry::FilterFactory>(
    const std::string &, ComponentRegistry::FilterFactory, bool,
    ComponentSet<ComponentRegistry::FilterFactory> &);

template void
ComponentRegistry::RegisterComponent<ComponentRegistry::ProviderFactory>(
    const std::string &, ComponentRegistry::ProviderFactory, bool,
    ComponentSet<ComponentRegistry::ProviderFactory> &);

template void
ComponentRegistry::RegisterComponent<ComponentRegistry::ProcessorFactory>(
    const std::string &, ComponentRegistry::ProcessorFactory, bool,
    ComponentSet<ComponentRegistry::ProcessorFactory> &);

} // namespace metatree
