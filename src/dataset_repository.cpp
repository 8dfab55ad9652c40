#include <metatree/dataset_repository.h>

#include <metatree/digest.h>
#include <metatree/errors.h>
#include <metatree/metadata_path.h>
#include <metatree/object_store.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace metatree {
namespace {

struct Descriptor {
  std::string id;
  std::string version;
};

Descriptor LoadDescriptor(const std::filesystem::path &path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::Exception &error) {
    throw ConfigurationError("Cannot read dataset descriptor " +
                             path.string() + ": " + error.what());
  }
  if (!root.IsMap() || !root["id"] || !root["version"] ||
      !root["id"].IsScalar() || !root["version"].IsScalar()) {
    throw ConfigurationError("Dataset descriptor " + path.string() +
                             " must map 'id' and 'version' to scalars");
  }
  Descriptor descriptor{root["id"].as<std::string>(),
                        root["version"].as<std::string>()};
  if (!IsUuid(descriptor.id)) {
    throw ConfigurationError("Dataset id '" + descriptor.id + "' in " +
                             path.string() + " is not a UUID");
  }
  if (descriptor.version.empty()) {
    throw ConfigurationError("Empty dataset version in " + path.string());
  }
  return descriptor;
}

void WriteDescriptor(const std::filesystem::path &path,
                     const Descriptor &descriptor) {
  YAML::Emitter emitter;
  emitter << YAML::BeginMap;
  emitter << YAML::Key << "id" << YAML::Value << descriptor.id;
  emitter << YAML::Key << "version" << YAML::Value << descriptor.version;
  emitter << YAML::EndMap;
  WriteFileAtomically(path, std::string(emitter.c_str()) + "\n");
}

std::string GenerateVersion(const std::string &id) {
  const auto now = std::chrono::system_clock::now().time_since_epoch().count();
  return Sha1Hex(id + ":" + std::to_string(now));
}

std::vector<std::filesystem::directory_entry>
SortedChildren(const std::filesystem::path &directory) {
  std::vector<std::filesystem::directory_entry> children(
      std::filesystem::directory_iterator(directory), {});
  std::sort(children.begin(), children.end(),
            [](const auto &left, const auto &right) {
              return left.path().filename() < right.path().filename();
            });
  return children;
}

// Sub-dataset links below directory without opening the sub-datasets, so a
// broken descriptor only affects its own link.
void CollectLinks(const std::filesystem::path &directory,
                  const std::string &prefix,
                  std::vector<SubdatasetLink> &links) {
  for (const auto &child : SortedChildren(directory)) {
    const auto name = child.path().filename().string();
    if (IsExcludedName(name) || !child.is_directory() || child.is_symlink()) {
      continue;
    }
    const auto relative = JoinMetadataPath(prefix, name);
    if (!DirectoryRepository::IsDataset(child.path())) {
      CollectLinks(child.path(), relative, links);
      continue;
    }
    SubdatasetLink link;
    link.path = relative;
    try {
      auto descriptor =
          LoadDescriptor(DirectoryRepository::DescriptorPath(child.path()));
      link.dataset_id = std::move(descriptor.id);
      link.dataset_version = std::move(descriptor.version);
    } catch (const ConfigurationError &error) {
      link.error = error.what();
    }
    links.push_back(std::move(link));
  }
}

} // namespace

std::string ToString(TreeEntryType type) {
  switch (type) {
  case TreeEntryType::kDataset:
    return "dataset";
  case TreeEntryType::kDirectory:
    return "directory";
  case TreeEntryType::kFile:
    break;
  }
  return "file";
}

bool IsExcludedName(std::string_view name) {
  return name == DirectoryRepository::kControlDirectory ||
         name.substr(0, 4) == ".git" || name == ".datalad" ||
         name == ".noannex";
}

std::string GenerateUuid() {
  static thread_local std::mt19937_64 generator{std::random_device{}()};
  std::uniform_int_distribution<std::uint64_t> distribution;
  auto high = distribution(generator);
  auto low = distribution(generator);
  high = (high & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
  low = (low & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

  std::ostringstream stream;
  stream << std::hex << std::setfill('0') << std::setw(8) << (high >> 32)
         << '-' << std::setw(4) << ((high >> 16) & 0xffff) << '-'
         << std::setw(4) << (high & 0xffff) << '-' << std::setw(4)
         << (low >> 48) << '-' << std::setw(12) << (low & 0xffffffffffffULL);
  return stream.str();
}

bool IsUuid(std::string_view text) {
  if (text.size() != 36) {
    return false;
  }
  for (std::size_t i = 0; i < text.size(); ++i) {
    const auto character = text[i];
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (character != '-') {
        return false;
      }
    } else if (!std::isxdigit(static_cast<unsigned char>(character))) {
      return false;
    }
  }
  return true;
}

std::filesystem::path
DirectoryRepository::DescriptorPath(const std::filesystem::path &root) {
  return root / kControlDirectory / kDescriptorFile;
}

bool DirectoryRepository::IsDataset(const std::filesystem::path &path) {
  return std::filesystem::is_regular_file(DescriptorPath(path));
}

DirectoryRepository::DirectoryRepository(std::filesystem::path root,
                                         std::shared_ptr<Logger> logger)
    : root_(std::filesystem::absolute(std::move(root)).lexically_normal()),
      logger_(EnsureLogger(std::move(logger))) {
  if (!root_.has_filename()) {
    root_ = root_.parent_path();
  }
  if (!IsDataset(root_)) {
    throw NotFoundError("No dataset at " + root_.string());
  }
  auto descriptor = LoadDescriptor(DescriptorPath(root_));
  id_ = std::move(descriptor.id);
  version_ = std::move(descriptor.version);
}

std::shared_ptr<DirectoryRepository>
DirectoryRepository::Init(const std::filesystem::path &root,
                          std::optional<std::string> id,
                          std::optional<std::string> version,
                          std::shared_ptr<Logger> logger) {
  logger = EnsureLogger(std::move(logger));
  const auto path = DescriptorPath(root);
  Descriptor descriptor;
  if (std::filesystem::exists(path)) {
    descriptor = LoadDescriptor(path);
    if (id && *id != descriptor.id) {
      throw ConfigurationError("Dataset at " + root.string() +
                               " already has id " + descriptor.id);
    }
  } else {
    descriptor.id = id ? *id : GenerateUuid();
    if (!IsUuid(descriptor.id)) {
      throw ConfigurationError("Dataset id '" + descriptor.id +
                               "' is not a UUID");
    }
  }
  if (version) {
    if (version->empty()) {
      throw ConfigurationError("Dataset version must not be empty");
    }
    descriptor.version = *version;
  } else if (descriptor.version.empty()) {
    descriptor.version = GenerateVersion(descriptor.id);
  }
  WriteDescriptor(path, descriptor);
  logger->Log(LogLevel::kInfo, "dataset.init",
              {{"path", root.string()},
               {"dataset_id", descriptor.id},
               {"dataset_version", descriptor.version}});
  return std::make_shared<DirectoryRepository>(root, std::move(logger));
}

std::filesystem::path DirectoryRepository::MetadataStorePath() const {
  return root_ / kControlDirectory / kStoreDirectory;
}

std::vector<TreeEntry>
DirectoryRepository::List(const std::string &directory) const {
  const auto prefix =
      directory.empty() ? std::string() : NormalizeRelativePath(directory);
  const auto base = prefix.empty() ? root_ : root_ / prefix;
  if (!std::filesystem::is_directory(base)) {
    throw NotFoundError("No directory '" + directory + "' in " +
                        root_.string());
  }

  std::vector<TreeEntry> entries;
  for (const auto &child : SortedChildren(base)) {
    const auto name = child.path().filename().string();
    if (IsExcludedName(name)) {
      continue;
    }
    const auto relative = JoinMetadataPath(prefix, name);

    if (child.is_directory() && !child.is_symlink()) {
      if (!IsDataset(child.path())) {
        entries.push_back(TreeEntry{child.path(), relative,
                                    TreeEntryType::kDirectory, id_, version_,
                                    "", relative});
        continue;
      }
      const DirectoryRepository subdataset(child.path(), logger_);
      entries.push_back(TreeEntry{child.path(), relative,
                                  TreeEntryType::kDataset, subdataset.Id(),
                                  subdataset.Version(), relative, ""});
      continue;
    }

    if (child.is_regular_file() || child.is_symlink()) {
      entries.push_back(TreeEntry{child.path(), relative, TreeEntryType::kFile,
                                  id_, version_, "", relative});
    }
  }
  return entries;
}

void DirectoryRepository::Walk(const std::string &directory, bool recursive,
                               std::vector<TreeEntry> &entries) const {
  for (auto &entry : List(directory)) {
    if (entry.type == TreeEntryType::kDirectory) {
      Walk(entry.path, recursive, entries);
      continue;
    }
    const auto path = entry.path;
    const auto absolute_path = entry.absolute_path;
    const bool is_dataset = entry.type == TreeEntryType::kDataset;
    entries.push_back(std::move(entry));
    if (!is_dataset || !recursive) {
      continue;
    }
    const DirectoryRepository subdataset(absolute_path, logger_);
    for (auto &nested : subdataset.Enumerate(true)) {
      if (nested.type == TreeEntryType::kDataset && nested.path.empty()) {
        continue;
      }
      nested.path = JoinMetadataPath(path, nested.path);
      nested.dataset_path = JoinMetadataPath(path, nested.dataset_path);
      entries.push_back(std::move(nested));
    }
  }
}

std::vector<TreeEntry> DirectoryRepository::Enumerate(bool recursive) const {
  std::vector<TreeEntry> entries;
  entries.push_back(
      TreeEntry{root_, "", TreeEntryType::kDataset, id_, version_, "", ""});
  Walk("", recursive, entries);
  return entries;
}

std::vector<SubdatasetLink> DirectoryRepository::Subdatasets() const {
  std::vector<SubdatasetLink> links;
  CollectLinks(root_, "", links);
  return links;
}

std::shared_ptr<DatasetRepository>
DirectoryRepository::OpenSubdataset(const std::string &path) const {
  const auto normalized = NormalizeRelativePath(path);
  if (normalized.empty() || !IsDataset(root_ / normalized)) {
    throw NotFoundError("No sub-dataset '" + path + "' in " + root_.string());
  }
  return std::make_shared<DirectoryRepository>(root_ / normalized, logger_);
}

} // namespace metatree
