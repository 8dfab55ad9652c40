#pragma once

#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace metatree {

enum class MetadataUrlScheme { kTree, kUuid };

// Parsed query address:
//   uuid:UUID[@VERSION][:LOCAL_PATH]
//   [tree:][DATASET_PATH][@VERSION][:LOCAL_PATH]
// Without a scheme a tree address is assumed. An empty dataset path names the
// root dataset.
struct MetadataUrl {
  MetadataUrlScheme scheme = MetadataUrlScheme::kTree;
  std::string dataset_id;
  std::string dataset_path;
  std::optional<std::string> version;
  std::string local_path;
};

MetadataUrl ParseMetadataUrl(std::string_view text);

// Dataset-relative path in '/' form: leading '/' and "." segments are dropped,
// repeated separators collapsed. "." and "" yield "". Throws
// std::invalid_argument for ".." segments.
std::string NormalizeRelativePath(std::string_view path);

std::string JoinMetadataPath(std::string_view prefix, std::string_view path);

// True if path equals directory or lies below it. Every path lies below "".
bool IsPathBelow(std::string_view path, std::string_view directory);

// Shell-style pattern over dataset-relative paths. '*' matches any sequence
// including '/', '?' one character, "[...]" a character class ("[!...]"
// negated). A recursive match also accepts paths below a matching directory.
class GlobPattern {
public:
  explicit GlobPattern(std::string pattern);

  bool Matches(std::string_view path) const;
  bool MatchesRecursive(std::string_view path) const;
  const std::string &Text() const { return pattern_; }

private:
  std::string pattern_;
  std::regex regex_;
};

} // namespace metatree
