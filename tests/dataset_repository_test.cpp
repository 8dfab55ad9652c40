#include <metatree/dataset_repository.h>
#include <metatree/errors.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "test_support/sample_records.h"
#include "test_support/temporary_dataset.h"

namespace metatree {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

std::vector<std::string> Paths(const std::vector<TreeEntry> &entries) {
  std::vector<std::string> paths;
  for (const auto &entry : entries) {
    paths.push_back(entry.path);
  }
  return paths;
}

TEST(DatasetRepositoryTest, InitGeneratesIdAndVersion) {
  test::TemporaryDataset directory;
  const auto dataset =
      DirectoryRepository::Init(directory.root(), std::nullopt, std::nullopt);

  EXPECT_TRUE(IsUuid(dataset->Id()));
  EXPECT_FALSE(dataset->Version().empty());
  EXPECT_TRUE(DirectoryRepository::IsDataset(directory.root()));
  EXPECT_EQ(dataset->MetadataStorePath(),
            directory.root() / ".metatree" / "store");
}

TEST(DatasetRepositoryTest, InitKeepsTheExistingId) {
  test::TemporaryDataset directory;
  directory.InitDataset("", test::kRootId, "v1");

  const auto again =
      DirectoryRepository::Init(directory.root(), std::nullopt, "v2");
  EXPECT_EQ(again->Id(), test::kRootId);
  EXPECT_EQ(again->Version(), "v2");

  EXPECT_THROW(
      DirectoryRepository::Init(directory.root(), test::kOtherId, std::nullopt),
      ConfigurationError);
}

TEST(DatasetRepositoryTest, RejectsInvalidDescriptors) {
  test::TemporaryDataset directory;
  EXPECT_THROW(DirectoryRepository(directory.root()), NotFoundError);

  directory.AddFile(".metatree/dataset.yaml", "id: not-a-uuid\nversion: v1\n");
  EXPECT_THROW(DirectoryRepository(directory.root()), ConfigurationError);

  directory.AddFile(".metatree/dataset.yaml", "- just\n- a list\n");
  EXPECT_THROW(DirectoryRepository(directory.root()), ConfigurationError);

  EXPECT_THROW(DirectoryRepository::Init(directory.root() / "x", "nope",
                                         std::nullopt),
               ConfigurationError);
}

TEST(DatasetRepositoryTest, EnumeratesFilesInPathOrder) {
  test::TemporaryDataset directory;
  const auto dataset = directory.InitDataset("", test::kRootId, "v1");
  directory.AddFile("b.txt", "b");
  directory.AddFile("a/z.txt", "z");
  directory.AddFile(".git/config", "ignored");

  const auto entries = dataset->Enumerate(false);

  EXPECT_THAT(Paths(entries), ElementsAre("", "a/z.txt", "b.txt"));
  EXPECT_EQ(entries.front().type, TreeEntryType::kDataset);
  EXPECT_EQ(entries[1].intra_dataset_path, "a/z.txt");
  EXPECT_EQ(entries[1].dataset_id, test::kRootId);
}

TEST(DatasetRepositoryTest, ListsSubdatasetsAndDescendsOnRequest) {
  test::TemporaryDataset directory;
  const auto root = directory.InitDataset("", test::kRootId, "r1");
  directory.InitDataset("sub", test::kSubId, "s1");
  directory.AddFile("top.txt");
  directory.AddFile("sub/inner.txt");

  EXPECT_THAT(Paths(root->Enumerate(false)), ElementsAre("", "sub", "top.txt"));

  const auto all = root->Enumerate(true);
  EXPECT_THAT(Paths(all), ElementsAre("", "sub", "sub/inner.txt", "top.txt"));
  EXPECT_EQ(all[2].dataset_id, test::kSubId);
  EXPECT_EQ(all[2].dataset_path, "sub");
  EXPECT_EQ(all[2].intra_dataset_path, "inner.txt");

  const auto links = root->Subdatasets();
  ASSERT_EQ(links.size(), 1u);
  EXPECT_EQ(links.front().path, "sub");
  EXPECT_EQ(links.front().dataset_version, "s1");
}

TEST(DatasetRepositoryTest, ListShowsOneDirectoryLevel) {
  test::TemporaryDataset directory;
  const auto root = directory.InitDataset("", test::kRootId, "r1");
  directory.InitDataset("sub", test::kSubId, "s1");
  directory.AddFile("a/z.txt");
  directory.AddFile("a/deeper/y.txt");
  directory.AddFile("b.txt");

  const auto top = root->List("");
  EXPECT_THAT(Paths(top), ElementsAre("a", "b.txt", "sub"));
  EXPECT_EQ(top[0].type, TreeEntryType::kDirectory);
  EXPECT_EQ(top[1].type, TreeEntryType::kFile);
  EXPECT_EQ(top[2].type, TreeEntryType::kDataset);
  EXPECT_EQ(top[2].dataset_id, test::kSubId);

  EXPECT_THAT(Paths(root->List("a")), ElementsAre("a/deeper", "a/z.txt"));
  EXPECT_THROW(root->List("missing"), NotFoundError);
  EXPECT_EQ(ToString(TreeEntryType::kDirectory), "directory");
}

TEST(DatasetRepositoryTest, SubdatasetLinksCarryDescriptorErrors) {
  test::TemporaryDataset directory;
  const auto root = directory.InitDataset("", test::kRootId, "r1");
  directory.AddFile("bad/.metatree/dataset.yaml", "version: b1\n");
  directory.InitDataset("nested/good", test::kSubId, "s1");

  const auto links = root->Subdatasets();

  ASSERT_EQ(links.size(), 2u);
  EXPECT_EQ(links[0].path, "bad");
  EXPECT_TRUE(links[0].dataset_id.empty());
  EXPECT_THAT(links[0].error, HasSubstr("must map 'id' and 'version'"));
  EXPECT_EQ(links[1].path, "nested/good");
  EXPECT_EQ(links[1].dataset_id, test::kSubId);
  EXPECT_TRUE(links[1].error.empty());
}

TEST(DatasetRepositoryTest, OpensSubdatasetsByPath) {
  test::TemporaryDataset directory;
  const auto root = directory.InitDataset("", test::kRootId, "r1");
  directory.InitDataset("sub", test::kSubId, "s1");
  directory.AddFile("plain/file.txt");

  EXPECT_EQ(root->OpenSubdataset("sub")->Id(), test::kSubId);
  EXPECT_THROW(root->OpenSubdataset("plain"), NotFoundError);
  EXPECT_THROW(root->OpenSubdataset(""), NotFoundError);
}

TEST(DatasetRepositoryTest, RecognizesUuids) {
  EXPECT_TRUE(IsUuid(test::kRootId));
  EXPECT_TRUE(IsUuid(GenerateUuid()));
  EXPECT_FALSE(IsUuid("11111111-1111-4111-8111-11111111111"));
  EXPECT_FALSE(IsUuid("1111111101111-4111-8111-111111111111"));
  EXPECT_NE(GenerateUuid(), GenerateUuid());
}

} // namespace
} // namespace metatree
