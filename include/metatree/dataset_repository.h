#pragma once

#include <metatree/logging.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace metatree {

enum class TreeEntryType { kDataset, kFile, kDirectory };

std::string ToString(TreeEntryType type);

struct TreeEntry {
  std::filesystem::path absolute_path;
  // Relative to the dataset the enumeration started from.
  std::string path;
  TreeEntryType type = TreeEntryType::kFile;
  // The dataset itself for kDataset, the containing dataset otherwise.
  std::string dataset_id;
  std::string dataset_version;
  // Path of that dataset relative to the enumeration root ("" for the root).
  std::string dataset_path;
  // Path of a file relative to its containing dataset.
  std::string intra_dataset_path;
};

struct SubdatasetLink {
  std::string path;
  std::string dataset_id;
  std::string dataset_version;
  // Set when the sub-dataset's descriptor cannot be read; id and version
  // are empty then.
  std::string error;
};

// Handle on one dataset of a tree. All tree and version information reaches
// the store, aggregator and pipeline through this interface.
class DatasetRepository {
public:
  virtual ~DatasetRepository() = default;

  virtual const std::string &Id() const = 0;
  virtual const std::string &Version() const = 0;
  virtual const std::filesystem::path &Root() const = 0;
  virtual std::filesystem::path MetadataStorePath() const = 0;

  // The dataset itself, its files and its sub-datasets. With recursive set
  // the files and sub-datasets of installed sub-datasets follow their
  // dataset entry.
  virtual std::vector<TreeEntry> Enumerate(bool recursive) const = 0;
  // Immediate children of directory ("" for the root) in name order: files,
  // sub-datasets and kDirectory entries for plain directories.
  virtual std::vector<TreeEntry> List(const std::string &directory) const = 0;
  // Sub-datasets at any depth below the root that are not nested in another
  // sub-dataset. Unreadable descriptors are reported in SubdatasetLink::error.
  virtual std::vector<SubdatasetLink> Subdatasets() const = 0;
  // Throws NotFoundError if path is not a sub-dataset.
  virtual std::shared_ptr<DatasetRepository>
  OpenSubdataset(const std::string &path) const = 0;
};

// Dataset described by <root>/.metatree/dataset.yaml:
//   id: <uuid>
//   version: <opaque token>
// Directories holding such a descriptor below the root are sub-datasets.
class DirectoryRepository : public DatasetRepository {
public:
  static constexpr const char *kControlDirectory = ".metatree";
  static constexpr const char *kDescriptorFile = "dataset.yaml";
  static constexpr const char *kStoreDirectory = "store";

  // Throws NotFoundError without a descriptor, ConfigurationError for a
  // malformed one.
  explicit DirectoryRepository(std::filesystem::path root,
                               std::shared_ptr<Logger> logger = nullptr);

  // Writes a descriptor, generating an id when none is given. An existing
  // descriptor keeps its id; passing a different id is a ConfigurationError.
  static std::shared_ptr<DirectoryRepository>
  Init(const std::filesystem::path &root, std::optional<std::string> id,
       std::optional<std::string> version,
       std::shared_ptr<Logger> logger = nullptr);
  static bool IsDataset(const std::filesystem::path &path);
  static std::filesystem::path
  DescriptorPath(const std::filesystem::path &root);

  const std::string &Id() const override { return id_; }
  const std::string &Version() const override { return version_; }
  const std::filesystem::path &Root() const override { return root_; }
  std::filesystem::path MetadataStorePath() const override;

  std::vector<TreeEntry> Enumerate(bool recursive) const override;
  // Throws NotFoundError if directory does not exist.
  std::vector<TreeEntry> List(const std::string &directory) const override;
  std::vector<SubdatasetLink> Subdatasets() const override;
  std::shared_ptr<DatasetRepository>
  OpenSubdataset(const std::string &path) const override;

private:
  void Walk(const std::string &directory, bool recursive,
            std::vector<TreeEntry> &entries) const;

  std::filesystem::path root_;
  std::string id_;
  std::string version_;
  std::shared_ptr<Logger> logger_;
};

// Names skipped when walking a dataset: control directories of metatree and
// version control.
bool IsExcludedName(std::string_view name);

std::string GenerateUuid();
bool IsUuid(std::string_view text);

} // namespace metatree
