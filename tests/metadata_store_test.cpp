#include <metatree/errors.h>
#include <metatree/metadata_store.h>
#include <metatree/record_codec.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "test_support/sample_records.h"
#include "test_support/temporary_dataset.h"

namespace metatree {
namespace {

using ::testing::SizeIs;

TEST(MetadataStoreTest, OpenCreatesLayoutDescriptor) {
  test::TemporaryDataset directory;
  const auto path = directory.root() / "store";

  EXPECT_FALSE(MetadataStore::Exists(path));
  const auto store = MetadataStore::Open(path);

  EXPECT_TRUE(MetadataStore::Exists(path));
  const auto descriptor =
      nlohmann::json::parse(directory.ReadFile("store/version.json"));
  EXPECT_EQ(descriptor.at("@id"), "MetadataStore");
  EXPECT_EQ(descriptor.at("layout_version"), "1.0");
  EXPECT_EQ(descriptor.at("digest"), "sha1");
  EXPECT_EQ(store->Layout().object_shards, (ShardParts{2, 2}));
}

TEST(MetadataStoreTest, OpenExistingRequiresAStore) {
  test::TemporaryDataset directory;
  EXPECT_THROW(MetadataStore::OpenExisting(directory.root() / "missing"),
               NotFoundError);
}

TEST(MetadataStoreTest, RefusesForeignNonEmptyDirectories) {
  test::TemporaryDataset directory;
  directory.AddFile("store/unrelated.txt", "x");
  EXPECT_THROW(MetadataStore::Open(directory.root() / "store"),
               ConsistencyError);
}

TEST(MetadataStoreTest, RejectsNewerLayoutVersions) {
  test::TemporaryDataset directory;
  directory.AddFile("store/version.json",
                    R"({"@id": "MetadataStore", "layout_version": "2.0",
                        "digest": "sha1", "object_shards": [2, 2],
                        "dataset_shards": [2, 2, 2], "version_shards": [2, 2]})");
  EXPECT_THROW(MetadataStore::Open(directory.root() / "store"),
               ConsistencyError);
}

TEST(MetadataStoreTest, AddRecordIndexesFileAndDatasetRecords) {
  test::TemporaryDataset directory;
  auto store = MetadataStore::Open(directory.root() / "store");

  store->AddRecord(test::DatasetRecord(test::kRootId, "v1"));
  const auto index =
      store->AddRecord(test::FileRecord(test::kRootId, "v1", "data/a.csv"));

  ASSERT_NE(index->DatasetLevel(), nullptr);
  ASSERT_NE(index->FindFile("data/a.csv"), nullptr);
  EXPECT_EQ(index->FindFile("data/a.csv")->version, "v1");
  EXPECT_EQ(store->LoadRecord(index->FindFile("data/a.csv")->ref),
            test::FileRecord(test::kRootId, "v1", "data/a.csv"));
}

TEST(MetadataStoreTest, StoresIdenticalRecordsOnce) {
  test::TemporaryDataset directory;
  auto store = MetadataStore::Open(directory.root() / "store");

  store->AddRecord(test::FileRecord(test::kRootId, "v1", "a"));
  store->AddRecord(test::FileRecord(test::kRootId, "v1", "a"));

  EXPECT_EQ(store->Objects().Count(), 1u);
  EXPECT_EQ(store->Indices().Head(test::kRootId, "v1")->generation, 1u);
}

TEST(MetadataStoreTest, StarPatternFindsNestedFiles) {
  test::TemporaryDataset directory;
  auto store = MetadataStore::Open(directory.root() / "store");
  store->AddRecord(test::FileRecord(test::kRootId, "v1", "a/b/c"));
  store->AddRecord(test::FileRecord(test::kRootId, "v1", "d/e/f"));

  IndexQuery query;
  query.dataset_id = test::kRootId;
  query.path_pattern = "*";
  query.versions = VersionSelector::Exact("v1");
  EXPECT_THAT(store->Dump(query), SizeIs(2));

  store->AddRecord(test::FileRecord(test::kRootId, "v1", "a/b/c"));
  EXPECT_EQ(store->Objects().Count(), 2u);
}

TEST(MetadataStoreTest, ProvenWithRootVersionIsIndexedUnderTheRootToo) {
  test::TemporaryDataset directory;
  auto store = MetadataStore::Open(directory.root() / "store");
  const Provenance provenance{test::kRootId, std::string("r1"), "sub"};

  store->AddRecord(test::FileRecord(test::kSubId, "s1", "x.txt"), provenance);

  const auto sub = store->Indices().Head(test::kSubId, "s1");
  ASSERT_NE(sub, nullptr);
  EXPECT_EQ(sub->FindFile("x.txt")->provenance, provenance);
  const auto root = store->Indices().Head(test::kRootId, "r1");
  ASSERT_NE(root, nullptr);
  EXPECT_NE(root->FindFile("sub/x.txt"), nullptr);
}

TEST(MetadataStoreTest, AmbiguousRecordsStayOutOfTheRootIndex) {
  test::TemporaryDataset directory;
  auto store = MetadataStore::Open(directory.root() / "store");
  const Provenance provenance{test::kRootId, std::nullopt, "sub"};

  store->AddRecord(test::FileRecord(test::kSubId, "s1", "x.txt"), provenance);

  EXPECT_NE(store->Indices().Head(test::kSubId, "s1"), nullptr);
  EXPECT_TRUE(store->Indices().Versions(test::kRootId).empty());
}

TEST(MetadataStoreTest, DumpReturnsRecordsWithTheirProvenance) {
  test::TemporaryDataset directory;
  auto store = MetadataStore::Open(directory.root() / "store");
  store->AddRecord(test::FileRecord(test::kSubId, "s1", "x.txt"),
                   Provenance{test::kRootId, std::nullopt, "sub"});

  IndexQuery query;
  query.dataset_id = test::kSubId;
  const auto entries = store->Dump(query);

  ASSERT_THAT(entries, SizeIs(1));
  const auto json = ToDumpJson(entries.front());
  EXPECT_EQ(json.at("path"), "x.txt");
  EXPECT_EQ(json.at("root_dataset_id"), test::kRootId);
  EXPECT_TRUE(json.at("root_dataset_version").is_null());
  EXPECT_EQ(json.at("dataset_path"), "sub");
}

TEST(MetadataStoreTest, DumpReportsDanglingReferences) {
  test::TemporaryDataset directory;
  auto store = MetadataStore::Open(directory.root() / "store");
  const auto index = store->AddRecord(test::FileRecord(test::kRootId, "v1", "a"));
  std::filesystem::remove(store->Objects().PathFor(index->FindFile("a")->ref));

  IndexQuery query;
  query.dataset_id = test::kRootId;
  EXPECT_THROW(store->Dump(query), ConsistencyError);
}

TEST(MetadataStoreTest, LoadRecordRejectsBlobsThatAreNotRecords) {
  test::TemporaryDataset directory;
  auto store = MetadataStore::Open(directory.root() / "store");
  const auto ref = store->Objects().Put("not json");

  EXPECT_THROW(store->LoadRecord(ref), ConsistencyError);
}

TEST(MetadataStoreTest, ReopenedStoreSeesEarlierRecords) {
  test::TemporaryDataset directory;
  {
    auto store = MetadataStore::Open(directory.root() / "store");
    store->AddRecord(test::DatasetRecord(test::kRootId, "v1"));
  }
  const auto store = MetadataStore::OpenExisting(directory.root() / "store");

  EXPECT_EQ(store->Indices().LatestVersion(test::kRootId), "v1");
}

} // namespace
} // namespace metatree
