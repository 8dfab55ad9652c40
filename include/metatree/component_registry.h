#pragma once

#include <metatree/extractors.h>
#include <metatree/filters.h>
#include <metatree/indexer.h>
#include <metatree/pipeline.h>

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace metatree {

class ComponentRegistry {
public:
  using ExtractorFactory =
      std::function<std::unique_ptr<Extractor>(ExtractorContext)>;
  using IndexerFactory = std::function<std::unique_ptr<Indexer>()>;
  using FilterFactory =
      std::function<std::unique_ptr<MetadataFilter>(const StageArguments &)>;
  using ProviderFactory = std::function<std::unique_ptr<Provider>(
      const StageArguments &, const ConductEnvironment &)>;
  using ProcessorFactory = std::function<std::unique_ptr<Processor>(
      const StageArguments &, const ConductEnvironment &)>;

  void RegisterExtractor(const std::string &name, ExtractorFactory factory,
                         bool set_as_default = false);
  void RegisterIndexer(const std::string &name, IndexerFactory factory,
                       bool set_as_default = false);
  void RegisterFilter(const std::string &name, FilterFactory factory);
  void RegisterProvider(const std::string &name, ProviderFactory factory,
                        bool set_as_default = false);
  void RegisterProcessor(const std::string &name, ProcessorFactory factory,
                         bool set_as_default = false);

  // Unknown names throw ConfigurationError listing the registered ones.
  std::unique_ptr<Extractor> CreateExtractor(const std::string &name,
                                             ExtractorContext context) const;
  std::unique_ptr<Indexer> CreateIndexer(const std::string &name = "") const;
  std::unique_ptr<MetadataFilter>
  CreateFilter(const std::string &name, const StageArguments &arguments) const;
  std::unique_ptr<Provider>
  CreateProvider(const std::string &name, const StageArguments &arguments,
                 const ConductEnvironment &environment) const;
  std::unique_ptr<Processor>
  CreateProcessor(const std::string &name, const StageArguments &arguments,
                  const ConductEnvironment &environment) const;

  bool HasExtractor(const std::string &name) const;

  std::vector<std::string> ExtractorNames() const;
  std::vector<std::string> IndexerNames() const;
  std::vector<std::string> FilterNames() const;
  std::vector<std::string> ProviderNames() const;
  std::vector<std::string> ProcessorNames() const;

  const std::string &DefaultIndexerName() const;
  const std::string &DefaultProviderName() const;

  template <typename Factory>
  struct ComponentSet {
    std::unordered_map<std::string, Factory> factories;
    std::string default_name;
  };

private:
  template <typename Factory>
  static std::vector<std::string>
  RegisteredNames(const ComponentSet<Factory> &set);

  template <typename Factory>
  static std::string JoinNames(const ComponentSet<Factory> &set);

  template <typename Factory>
  const Factory &FindFactory(const std::string &name,
                             const ComponentSet<Factory> &set,
                             const std::string &kind) const;

  template <typename Factory>
  void RegisterComponent(const std::string &name, Factory factory,
                         bool set_as_default, ComponentSet<Factory> &set);

  ComponentSet<ExtractorFactory> extractors_;
  ComponentSet<IndexerFactory> indexers_;
  ComponentSet<FilterFactory> filters_;
  ComponentSet<ProviderFactory> providers_;
  ComponentSet<ProcessorFactory> processors_;
};

ComponentRegistry MakeComponentRegistryWithDefaults();
const ComponentRegistry &GlobalComponentRegistry();

} // namespace metatree
