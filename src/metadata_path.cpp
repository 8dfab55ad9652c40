#include <metatree/metadata_path.h>

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

namespace metatree {
namespace {

constexpr std::string_view kUuidHeader = "uuid:";
constexpr std::string_view kTreeHeader = "tree:";
constexpr std::size_t kUuidLength = 36;

std::string TranslateGlob(std::string_view pattern) {
  std::string expression;
  for (std::size_t i = 0; i < pattern.size(); ++i) {
    const auto character = pattern[i];
    switch (character) {
    case '*':
      expression += ".*";
      break;
    case '?':
      expression += ".";
      break;
    case '[': {
      const auto close = pattern.find(']', i + 1);
      if (close == std::string_view::npos) {
        expression += "\\[";
        break;
      }
      auto body = std::string(pattern.substr(i + 1, close - i - 1));
      expression += '[';
      if (!body.empty() && body.front() == '!') {
        expression += '^';
        body.erase(0, 1);
      }
      for (const auto member : body) {
        if (member == '\\' || member == '^' || member == '[') {
          expression += '\\';
        }
        expression += member;
      }
      expression += ']';
      i = close;
      break;
    }
    case '.':
    case '+':
    case '(':
    case ')':
    case '{':
    case '}':
    case '^':
    case '$':
    case '|':
    case '\\':
    case ']':
      expression += '\\';
      expression += character;
      break;
    default:
      expression += character;
    }
  }
  return expression;
}

} // namespace

MetadataUrl ParseMetadataUrl(std::string_view text) {
  MetadataUrl url;
  if (text.substr(0, kUuidHeader.size()) == kUuidHeader) {
    text.remove_prefix(kUuidHeader.size());
    if (text.size() < kUuidLength) {
      throw std::invalid_argument("Truncated dataset id in metadata address");
    }
    url.scheme = MetadataUrlScheme::kUuid;
    url.dataset_id = std::string(text.substr(0, kUuidLength));
    text.remove_prefix(kUuidLength);
    if (!text.empty() && text.front() == '@') {
      text.remove_prefix(1);
      const auto colon = text.find(':');
      url.version = std::string(text.substr(0, colon));
      text = colon == std::string_view::npos ? std::string_view{}
                                             : text.substr(colon);
    }
    if (!text.empty()) {
      if (text.front() != ':') {
        throw std::invalid_argument("Unexpected text after dataset id: " +
                                    std::string(text));
      }
      text.remove_prefix(1);
      url.local_path = NormalizeRelativePath(text);
    }
    return url;
  }

  if (text.substr(0, kTreeHeader.size()) == kTreeHeader) {
    text.remove_prefix(kTreeHeader.size());
  }
  const auto at = text.find('@');
  if (at != std::string_view::npos) {
    url.dataset_path = NormalizeRelativePath(text.substr(0, at));
    text.remove_prefix(at + 1);
    const auto colon = text.find(':');
    url.version = std::string(text.substr(0, colon));
    if (colon != std::string_view::npos) {
      url.local_path = NormalizeRelativePath(text.substr(colon + 1));
    }
    return url;
  }
  const auto colon = text.find(':');
  url.dataset_path = NormalizeRelativePath(text.substr(0, colon));
  if (colon != std::string_view::npos) {
    url.local_path = NormalizeRelativePath(text.substr(colon + 1));
  }
  return url;
}

std::string NormalizeRelativePath(std::string_view path) {
  std::vector<std::string_view> segments;
  std::size_t start = 0;
  while (start <= path.size()) {
    const auto end = std::min(path.find('/', start), path.size());
    const auto segment = path.substr(start, end - start);
    if (segment == "..") {
      throw std::invalid_argument("Path must not leave the dataset: " +
                                  std::string(path));
    }
    if (!segment.empty() && segment != ".") {
      segments.push_back(segment);
    }
    start = end + 1;
  }

  std::string normalized;
  for (const auto segment : segments) {
    if (!normalized.empty()) {
      normalized.push_back('/');
    }
    normalized.append(segment);
  }
  return normalized;
}

std::string JoinMetadataPath(std::string_view prefix, std::string_view path) {
  if (prefix.empty()) {
    return std::string(path);
  }
  if (path.empty()) {
    return std::string(prefix);
  }
  return std::string(prefix) + "/" + std::string(path);
}

bool IsPathBelow(std::string_view path, std::string_view directory) {
  if (directory.empty() || path == directory) {
    return true;
  }
  return path.size() > directory.size() &&
         path.substr(0, directory.size()) == directory &&
         path[directory.size()] == '/';
}

GlobPattern::GlobPattern(std::string pattern)
    : pattern_(std::move(pattern)),
      regex_(TranslateGlob(pattern_), std::regex::ECMAScript) {}

bool GlobPattern::Matches(std::string_view path) const {
  return std::regex_match(path.begin(), path.end(), regex_);
}

bool GlobPattern::MatchesRecursive(std::string_view path) const {
  if (Matches(path) || pattern_.empty()) {
    return true;
  }
  for (auto slash = path.find('/'); slash != std::string_view::npos;
       slash = path.find('/', slash + 1)) {
    if (Matches(path.substr(0, slash))) {
      return true;
    }
  }
  return false;
}

} // namespace metatree
