#include <metatree/errors.h>
#include <metatree/providers.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "test_support/sample_records.h"
#include "test_support/temporary_dataset.h"

namespace metatree {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

std::vector<std::string> Drain(Provider &provider) {
  std::vector<std::string> paths;
  while (auto item = provider.Next()) {
    paths.push_back(item->path);
  }
  return paths;
}

class DatasetTraverserTest : public ::testing::Test {
protected:
  void SetUp() override {
    root_ = directory_.InitDataset("", test::kRootId, "r1");
    directory_.InitDataset("sub", test::kSubId, "s1");
    directory_.InitDataset("sub/deep", test::kOtherId, "d1");
    directory_.AddFile("top.txt");
    directory_.AddFile("dir/nested.txt");
    directory_.AddFile("sub/inner.txt");
    directory_.AddFile("sub/deep/bottom.txt");
  }

  test::TemporaryDataset directory_;
  std::shared_ptr<DirectoryRepository> root_;
};

TEST_F(DatasetTraverserTest, ListsTheRootDatasetOnly) {
  DatasetTraverser traverser(root_, TraversalOptions{});
  EXPECT_THAT(Drain(traverser), ElementsAre(".", "dir/nested.txt", "top.txt"));
}

TEST_F(DatasetTraverserTest, EntersSubdatasetsBreadthFirst) {
  TraversalOptions options;
  options.traverse_subdatasets = true;
  DatasetTraverser traverser(root_, options);

  EXPECT_THAT(Drain(traverser),
              ElementsAre(".", "dir/nested.txt", "top.txt", "sub",
                          "sub/inner.txt", "sub/deep", "sub/deep/bottom.txt"));
}

TEST_F(DatasetTraverserTest, ListsDirectoriesOnlyWhenReached) {
  DatasetTraverser traverser(root_, TraversalOptions{});
  ASSERT_EQ(traverser.Next()->path, ".");

  directory_.AddFile("dir/later.txt");
  directory_.AddFile("top-later.txt");

  EXPECT_THAT(Drain(traverser),
              ElementsAre("dir/later.txt", "dir/nested.txt", "top.txt"));
}

TEST_F(DatasetTraverserTest, FindsSubdatasetsBelowPlainDirectories) {
  directory_.InitDataset("dir/nested-sub", test::kOtherId, "n1");
  TraversalOptions options;
  options.recursive = false;
  options.traverse_subdatasets = true;
  options.subdataset_depth = 1;
  options.report_files = false;
  DatasetTraverser traverser(root_, options);

  EXPECT_THAT(Drain(traverser), ElementsAre(".", "dir/nested-sub", "sub"));
}

TEST_F(DatasetTraverserTest, LimitsSubdatasetDepth) {
  TraversalOptions options;
  options.traverse_subdatasets = true;
  options.subdataset_depth = 1;
  options.report_datasets = false;
  DatasetTraverser traverser(root_, options);

  EXPECT_THAT(Drain(traverser),
              ElementsAre("dir/nested.txt", "top.txt", "sub/inner.txt"));
}

TEST_F(DatasetTraverserTest, ItemsCarryTheirDataset) {
  TraversalOptions options;
  options.traverse_subdatasets = true;
  options.report_datasets = false;
  DatasetTraverser traverser(root_, options);

  std::optional<WorkItem> inner;
  while (auto item = traverser.Next()) {
    if (item->path == "sub/inner.txt") {
      inner = item;
    }
  }
  ASSERT_TRUE(inner.has_value());
  EXPECT_EQ(inner->kind, WorkItemKind::kFile);
  EXPECT_EQ(inner->dataset->Id(), test::kSubId);
  EXPECT_EQ(inner->entry->dataset_path, "sub");
  EXPECT_EQ(inner->entry->intra_dataset_path, "inner.txt");
}

TEST_F(DatasetTraverserTest, NonRecursiveSkipsSubdirectories) {
  TraversalOptions options;
  options.recursive = false;
  options.report_datasets = false;
  DatasetTraverser traverser(root_, options);

  EXPECT_THAT(Drain(traverser), ElementsAre("top.txt"));
}

TEST(TraversalOptionsTest, ReadsStageArguments) {
  const auto options = TraversalOptionsFromArguments(
      {{"item_type", "dataset"},
       {"traverse_subdatasets", "true"},
       {"subdataset_depth", "2"},
       {"recursive", "false"}});

  EXPECT_TRUE(options.report_datasets);
  EXPECT_FALSE(options.report_files);
  EXPECT_TRUE(options.traverse_subdatasets);
  ASSERT_TRUE(options.subdataset_depth.has_value());
  EXPECT_EQ(*options.subdataset_depth, 2u);
  EXPECT_FALSE(options.recursive);

  EXPECT_THROW(TraversalOptionsFromArguments({{"item_type", "symlink"}}),
               ConfigurationError);
  EXPECT_THROW(TraversalOptionsFromArguments({{"subdataset_depth", "-1"}}),
               ConfigurationError);
}

TEST(TraversalOptionsTest, KeepsDefaultsForMissingArguments) {
  TraversalOptions defaults;
  defaults.traverse_subdatasets = true;
  const auto options = TraversalOptionsFromArguments({}, defaults);
  EXPECT_TRUE(options.traverse_subdatasets);
  EXPECT_FALSE(options.subdataset_depth.has_value());
}

TEST(JsonLinesProviderTest, YieldsOneItemPerLine) {
  std::istringstream input("{\"a\":1}\n\n{\"b\":2}\n");
  JsonLinesProvider provider(input, nullptr);

  const auto first = provider.Next();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->kind, WorkItemKind::kRecord);
  EXPECT_EQ(first->path, "line 1");
  EXPECT_EQ(first->record->at("a"), 1);

  const auto second = provider.Next();
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->path, "line 3");
  EXPECT_FALSE(provider.Next().has_value());
}

TEST(JsonLinesProviderTest, MalformedLinesThrow) {
  std::istringstream input("{\"a\":1}\nnot json\n");
  JsonLinesProvider provider(input, nullptr);
  provider.Next();

  try {
    provider.Next();
    FAIL() << "expected MetadataKeyError";
  } catch (const MetadataKeyError &error) {
    EXPECT_THAT(error.what(), HasSubstr("line 2"));
  }
}

TEST(JsonLinesProviderTest, ReadsFiles) {
  test::TemporaryDataset directory;
  const auto path = directory.AddFile("records.jsonl", "{\"x\":true}\n");

  JsonLinesProvider provider(path, nullptr);
  EXPECT_THAT(Drain(provider), ElementsAre("line 1"));
  EXPECT_THROW(JsonLinesProvider(directory.root() / "missing.jsonl", nullptr),
               NotFoundError);
}

class MetadataTraverserTest : public ::testing::Test {
protected:
  void SetUp() override {
    root_ = directory_.InitDataset("", test::kRootId, "r1");
    store_ = MetadataStore::Open(directory_.root() / "store");
    store_->AddRecord(test::FileRecord(test::kRootId, "v1", "b/c.txt"));
    store_->AddRecord(test::FileRecord(test::kRootId, "v1", "a.txt"));
  }

  IndexQuery RootQuery() const {
    IndexQuery query;
    query.dataset_id = test::kRootId;
    query.path_pattern = "*";
    return query;
  }

  test::TemporaryDataset directory_;
  std::shared_ptr<DirectoryRepository> root_;
  std::shared_ptr<MetadataStore> store_;
};

TEST_F(MetadataTraverserTest, YieldsOneRecordItemPerEntry) {
  MetadataTraverser traverser(store_, RootQuery(), root_);

  const auto first = traverser.Next();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->kind, WorkItemKind::kRecord);
  EXPECT_EQ(first->path, std::string(test::kRootId) + "@v1:a.txt");
  EXPECT_EQ(first->dataset, root_);
  ASSERT_TRUE(first->record.has_value());
  EXPECT_EQ(first->record->at("path"), "a.txt");
  EXPECT_EQ(first->record->at("dataset_version"), "v1");

  const auto second = traverser.Next();
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->record->at("path"), "b/c.txt");
  EXPECT_FALSE(traverser.Next().has_value());
}

TEST_F(MetadataTraverserTest, EntriesAddedBeforeTheFirstItemAreSeen) {
  MetadataTraverser traverser(store_, RootQuery(), root_);
  store_->AddRecord(test::FileRecord(test::kRootId, "v1", "d.txt"));

  EXPECT_THAT(Drain(traverser),
              ElementsAre(std::string(test::kRootId) + "@v1:a.txt",
                          std::string(test::kRootId) + "@v1:b/c.txt",
                          std::string(test::kRootId) + "@v1:d.txt"));
}

TEST_F(MetadataTraverserTest, DanglingReferencesFailTheRun) {
  const auto head = store_->Indices().Head(test::kRootId, "v1");
  std::filesystem::remove(
      store_->Objects().PathFor(head->FindFile("a.txt")->ref));
  MetadataTraverser traverser(store_, RootQuery(), root_);

  try {
    traverser.Next();
    FAIL() << "expected ConsistencyError";
  } catch (const ConsistencyError &error) {
    EXPECT_THAT(error.what(), HasSubstr("Dangling reference"));
  }
}

TEST_F(MetadataTraverserTest, NeedsAStore) {
  EXPECT_THROW(MetadataTraverser(nullptr, RootQuery(), root_),
               ConfigurationError);
}

TEST(MetadataQueryTest, ReadsStageArguments) {
  test::TemporaryDataset directory;
  const auto root = directory.InitDataset("", test::kRootId, "r1");

  const auto tree = MetadataQueryFromArguments(
      {{"pattern", "data/*"}, {"recursive", "true"}}, root.get());
  EXPECT_EQ(tree.dataset_id, test::kRootId);
  EXPECT_EQ(tree.path_pattern, "data/*");
  EXPECT_TRUE(tree.recursive);

  const auto uuid = MetadataQueryFromArguments(
      {{"pattern", std::string("uuid:") + test::kSubId + "@s1:x.txt"}},
      nullptr);
  EXPECT_EQ(uuid.dataset_id, test::kSubId);
  EXPECT_EQ(uuid.path_pattern, "x.txt");
  EXPECT_FALSE(uuid.recursive);
}

TEST(MetadataQueryTest, RejectsUnusablePatterns) {
  EXPECT_THROW(MetadataQueryFromArguments({{"pattern", "uuid:1234"}}, nullptr),
               ConfigurationError);
  EXPECT_THROW(MetadataQueryFromArguments({{"pattern", "a.txt"}}, nullptr),
               ConfigurationError);
}

} // namespace
} // namespace metatree
