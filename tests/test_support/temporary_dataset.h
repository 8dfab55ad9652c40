#ifndef METATREE_TEST_SUPPORT_TEMPORARY_DATASET_H
#define METATREE_TEST_SUPPORT_TEMPORARY_DATASET_H

#include <metatree/dataset_repository.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

namespace metatree {
namespace test {

// Scratch directory removed on destruction. Optionally initialized as a
// dataset with the given id and version.
class TemporaryDataset {
public:
  TemporaryDataset() {
    static std::atomic<unsigned> counter{0};
    const auto timestamp =
        std::chrono::steady_clock::now().time_since_epoch().count();
    root_ = std::filesystem::temp_directory_path() /
            ("metatree-test-" + std::to_string(timestamp) + "-" +
             std::to_string(counter++));
    std::filesystem::create_directories(root_);
  }

  ~TemporaryDataset() {
    std::error_code ignored;
    std::filesystem::remove_all(root_, ignored);
  }

  TemporaryDataset(const TemporaryDataset &) = delete;
  TemporaryDataset &operator=(const TemporaryDataset &) = delete;

  std::filesystem::path AddFile(const std::filesystem::path &relative,
                                const std::string &content = "") const {
    const auto full_path = root_ / relative;
    std::filesystem::create_directories(full_path.parent_path());
    std::ofstream stream(full_path);
    stream << content;
    return full_path;
  }

  // Makes root()/relative a dataset ("" for root() itself).
  std::shared_ptr<DirectoryRepository>
  InitDataset(const std::filesystem::path &relative, const std::string &id,
              const std::string &version) const {
    const auto path = relative.empty() ? root_ : root_ / relative;
    std::filesystem::create_directories(path);
    return DirectoryRepository::Init(path, id, version);
  }

  std::string ReadFile(const std::filesystem::path &relative) const {
    std::ifstream stream(root_ / relative);
    return std::string((std::istreambuf_iterator<char>(stream)),
                       std::istreambuf_iterator<char>());
  }

  const std::filesystem::path &root() const { return root_; }

private:
  std::filesystem::path root_;
};

} // namespace test
} // namespace metatree

#endif // METATREE_TEST_SUPPORT_TEMPORARY_DATASET_H
