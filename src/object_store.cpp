#include <metatree/object_store.h>

#include <metatree/digest.h>
#include <metatree/errors.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <fstream>
#include <functional>
#include <iterator>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace metatree {
namespace {

constexpr const char kObjectSuffix[] = ".json";
constexpr const char kTemporaryPrefix[] = ".tmp-";

std::atomic<unsigned long> temporary_counter{0};

std::filesystem::path TemporaryPathBeside(const std::filesystem::path &target) {
  std::ostringstream name;
  name << kTemporaryPrefix << ::getpid() << "-"
       << std::hash<std::thread::id>{}(std::this_thread::get_id()) << "-"
       << temporary_counter.fetch_add(1) << "-"
       << target.filename().string();
  return target.parent_path() / name.str();
}

[[noreturn]] void ThrowErrno(const std::string &what,
                             const std::filesystem::path &path) {
  throw std::system_error(errno, std::generic_category(),
                          what + " " + path.string());
}

// Owns a temporary file and removes it unless it was renamed away.
class TemporaryFile {
public:
  explicit TemporaryFile(std::filesystem::path path) : path_(std::move(path)) {}
  ~TemporaryFile() {
    std::error_code ignored;
    std::filesystem::remove(path_, ignored);
  }
  TemporaryFile(const TemporaryFile &) = delete;
  TemporaryFile &operator=(const TemporaryFile &) = delete;

  const std::filesystem::path &Path() const { return path_; }

private:
  std::filesystem::path path_;
};

void WriteNewFile(const std::filesystem::path &path, std::string_view content) {
  const int descriptor =
      ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
  if (descriptor < 0) {
    ThrowErrno("Cannot create", path);
  }
  std::size_t written = 0;
  while (written < content.size()) {
    const auto result = ::write(descriptor, content.data() + written,
                                content.size() - written);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      const int error = errno;
      ::close(descriptor);
      errno = error;
      ThrowErrno("Cannot write", path);
    }
    written += static_cast<std::size_t>(result);
  }
  if (::close(descriptor) != 0) {
    ThrowErrno("Cannot close", path);
  }
}

} // namespace

void WriteFileAtomically(const std::filesystem::path &target,
                         std::string_view content) {
  std::filesystem::create_directories(target.parent_path());
  TemporaryFile temporary(TemporaryPathBeside(target));
  WriteNewFile(temporary.Path(), content);
  if (::rename(temporary.Path().c_str(), target.c_str()) != 0) {
    ThrowErrno("Cannot publish", target);
  }
}

std::string ReadFile(const std::filesystem::path &path) {
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    throw NotFoundError("Cannot open " + path.string());
  }
  return std::string(std::istreambuf_iterator<char>(stream),
                     std::istreambuf_iterator<char>());
}

ObjectStore::ObjectStore(std::filesystem::path directory, ShardParts shards,
                         std::shared_ptr<Logger> logger)
    : directory_(std::move(directory)), shards_(std::move(shards)),
      logger_(EnsureLogger(std::move(logger))) {}

std::filesystem::path ObjectStore::PathFor(const ObjectRef &ref) const {
  auto path = directory_ / ShardedPath(ref.Hex(), shards_);
  path += kObjectSuffix;
  return path;
}

ObjectRef ObjectStore::Put(std::string_view content) {
  const auto ref = ObjectRef::FromHex(Sha1Hex(content));
  const auto target = PathFor(ref);
  if (std::filesystem::exists(target)) {
    if (ReadFile(target) != content) {
      throw ConsistencyError("Digest collision for object " + ref.Hex());
    }
    return ref;
  }

  std::filesystem::create_directories(target.parent_path());
  TemporaryFile temporary(TemporaryPathBeside(target));
  WriteNewFile(temporary.Path(), content);

  // link(2) fails instead of replacing, so the first writer wins.
  if (::link(temporary.Path().c_str(), target.c_str()) != 0) {
    if (errno != EEXIST) {
      ThrowErrno("Cannot publish object", target);
    }
    if (ReadFile(target) != content) {
      throw ConsistencyError("Digest collision for object " + ref.Hex());
    }
    return ref;
  }

  if (logger_->IsEnabled(LogLevel::kDebug)) {
    logger_->Log(LogLevel::kDebug, "store.put",
                 {{"ref", ref.Hex()},
                  {"bytes", std::to_string(content.size())}});
  }
  return ref;
}

std::optional<std::string> ObjectStore::TryGet(const ObjectRef &ref) const {
  const auto path = PathFor(ref);
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    return std::nullopt;
  }
  return std::string(std::istreambuf_iterator<char>(stream),
                     std::istreambuf_iterator<char>());
}

std::string ObjectStore::Get(const ObjectRef &ref) const {
  auto content = TryGet(ref);
  if (!content) {
    throw NotFoundError("Object " + ref.Hex() + " not found in " +
                        directory_.string());
  }
  return std::move(*content);
}

bool ObjectStore::Contains(const ObjectRef &ref) const {
  return std::filesystem::exists(PathFor(ref));
}

std::vector<ObjectRef> ObjectStore::List() const {
  std::vector<ObjectRef> refs;
  if (!std::filesystem::exists(directory_)) {
    return refs;
  }
  for (const auto &entry :
       std::filesystem::recursive_directory_iterator(directory_)) {
    if (!entry.is_regular_file() ||
        entry.path().extension() != kObjectSuffix) {
      continue;
    }
    const auto relative = entry.path().lexically_relative(directory_);
    std::string hex;
    for (const auto &component : relative) {
      hex += component.string();
    }
    hex.resize(hex.size() - (sizeof(kObjectSuffix) - 1));
    if (ObjectRef::IsValidHex(hex)) {
      refs.push_back(ObjectRef::FromHex(hex));
    }
  }
  std::sort(refs.begin(), refs.end());
  return refs;
}

std::size_t ObjectStore::Count() const { return List().size(); }

} // namespace metatree
