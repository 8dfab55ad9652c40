#include <metatree/component_registry.h>
#include <metatree/errors.h>
#include <metatree/filters.h>
#include <metatree/indexer.h>
#include <metatree/metadata_store.h>
#include <metatree/processors.h>
#include <metatree/providers.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include "test_support/sample_records.h"
#include "test_support/temporary_dataset.h"

namespace metatree {
namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

class UpperIndexer : public Indexer {
public:
  FlatMetadata Index(const MetadataRecord &) override {
    return {{"KEY", "VALUE"}};
  }
};

TEST(ComponentRegistryTest, RegistersTheBuiltInComponents) {
  const auto registry = MakeComponentRegistryWithDefaults();

  EXPECT_THAT(registry.ExtractorNames(),
              ElementsAre("external_dataset", "external_file",
                          "metalad_core_file", "metalad_example_dataset",
                          "metalad_example_file"));
  EXPECT_THAT(registry.IndexerNames(), ElementsAre("flat"));
  EXPECT_THAT(registry.ProviderNames(),
              ElementsAre("dataset-traversal", "json-lines",
                          "metadata-traversal"));
  EXPECT_THAT(registry.ProcessorNames(),
              ElementsAre("add", "extract", "filter"));
  EXPECT_THAT(registry.FilterNames(),
              ElementsAre("match", "metalad_demofilter"));
  EXPECT_EQ(registry.DefaultProviderName(), "dataset-traversal");
  EXPECT_TRUE(registry.HasExtractor("metalad_core_file"));
  EXPECT_FALSE(registry.HasExtractor("metalad_core"));
}

TEST(ComponentRegistryTest, CreatesTheDefaultProvider) {
  test::TemporaryDataset directory;
  ConductEnvironment environment;
  environment.dataset = directory.InitDataset("", test::kRootId, "v1");

  const auto registry = MakeComponentRegistryWithDefaults();
  const auto provider = registry.CreateProvider("", {}, environment);

  EXPECT_NE(dynamic_cast<DatasetTraverser *>(provider.get()), nullptr);
}

TEST(ComponentRegistryTest, CreatesTheMetadataStages) {
  test::TemporaryDataset directory;
  ConductEnvironment environment;
  environment.dataset = directory.InitDataset("", test::kRootId, "v1");
  environment.store = MetadataStore::Open(directory.root() / "store");

  const auto registry = MakeComponentRegistryWithDefaults();
  const auto provider = registry.CreateProvider(
      "metadata-traversal", {{"pattern", ":*"}}, environment);
  const auto processor =
      registry.CreateProcessor("filter", {{"type", "file"}}, environment);

  EXPECT_NE(dynamic_cast<MetadataTraverser *>(provider.get()), nullptr);
  EXPECT_NE(dynamic_cast<FilterProcessor *>(processor.get()), nullptr);
  EXPECT_FALSE(provider->Next().has_value());
  EXPECT_NE(dynamic_cast<HistogramFilter *>(
                registry.CreateFilter("metalad_demofilter", {}).get()),
            nullptr);
  EXPECT_THROW(registry.CreateFilter("", {}), ConfigurationError);
  EXPECT_THROW(registry.CreateFilter("histogram", {}), ConfigurationError);
}

TEST(ComponentRegistryTest, UnknownNamesListTheRegisteredOnes) {
  const auto registry = MakeComponentRegistryWithDefaults();

  try {
    registry.CreateIndexer("fancy");
    FAIL() << "expected ConfigurationError";
  } catch (const ConfigurationError &error) {
    EXPECT_THAT(error.what(), HasSubstr("Unknown indexer 'fancy'"));
    EXPECT_THAT(error.what(), HasSubstr("flat"));
  }
  EXPECT_THROW(registry.CreateExtractor("nope", ExtractorContext{}),
               ConfigurationError);
  EXPECT_THROW(registry.CreateExtractor("", ExtractorContext{}),
               ConfigurationError);
  EXPECT_THROW(registry.CreateProcessor("", {}, ConductEnvironment{}),
               ConfigurationError);
}

TEST(ComponentRegistryTest, CustomComponentsCanBecomeTheDefault) {
  auto registry = MakeComponentRegistryWithDefaults();
  registry.RegisterIndexer(
      "upper", [] { return std::make_unique<UpperIndexer>(); }, true);

  EXPECT_EQ(registry.DefaultIndexerName(), "upper");
  EXPECT_NE(dynamic_cast<UpperIndexer *>(registry.CreateIndexer().get()),
            nullptr);
  EXPECT_NE(dynamic_cast<FlatIndexer *>(registry.CreateIndexer("flat").get()),
            nullptr);
  EXPECT_THAT(registry.IndexerNames(), Contains("upper"));
}

TEST(ComponentRegistryTest, RejectsInvalidRegistrations) {
  ComponentRegistry registry;
  registry.RegisterIndexer("flat",
                           [] { return std::make_unique<FlatIndexer>(); });

  EXPECT_THROW(registry.RegisterIndexer(
                   "flat", [] { return std::make_unique<FlatIndexer>(); }),
               std::invalid_argument);
  EXPECT_THROW(registry.RegisterIndexer(
                   "", [] { return std::make_unique<FlatIndexer>(); }),
               std::invalid_argument);
  EXPECT_THROW(registry.RegisterIndexer("empty", nullptr),
               std::invalid_argument);
}

TEST(ComponentRegistryTest, FactoriesMustReturnAnInstance) {
  ComponentRegistry registry;
  registry.RegisterIndexer("broken",
                           []() -> std::unique_ptr<Indexer> { return nullptr; });

  EXPECT_THROW(registry.CreateIndexer("broken"), std::runtime_error);
}

TEST(ComponentRegistryTest, EmptyRegistryHasNoDefaults) {
  ComponentRegistry registry;
  EXPECT_THROW(registry.CreateIndexer(), ConfigurationError);
  EXPECT_THROW(registry.CreateProvider("", {}, ConductEnvironment{}),
               ConfigurationError);
}

} // namespace
} // namespace metatree
