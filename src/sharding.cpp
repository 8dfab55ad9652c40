#include <metatree/sharding.h>

#include <metatree/digest.h>

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace metatree {
namespace {
bool IsPlainCharacter(char character) {
  return (character >= 'a' && character <= 'z') ||
         (character >= 'A' && character <= 'Z') ||
         (character >= '0' && character <= '9') || character == '.' ||
         character == '_' || character == '-';
}
} // namespace

ShardSplit SplitName(std::string_view name, const ShardParts &parts) {
  const auto required =
      std::accumulate(parts.begin(), parts.end(), std::size_t{0});
  if (required >= name.size()) {
    throw std::invalid_argument("Name '" + std::string(name) +
                                "' is too short to be split into " +
                                std::to_string(parts.size()) + " prefixes");
  }

  ShardSplit split;
  std::size_t position = 0;
  for (const auto part : parts) {
    split.directory /= std::string(name.substr(position, part));
    position += part;
  }
  split.remainder = std::string(name.substr(position));
  return split;
}

std::filesystem::path ShardedPath(std::string_view name,
                                  const ShardParts &parts) {
  const auto split = SplitName(name, parts);
  return split.directory / split.remainder;
}

std::string ShardKey(std::string_view token, const ShardParts &parts) {
  const auto required =
      std::accumulate(parts.begin(), parts.end(), std::size_t{0});
  const bool plain = token.size() > required && token.front() != '.' &&
                     std::all_of(token.begin(), token.end(), IsPlainCharacter);
  if (plain) {
    return std::string(token);
  }
  return "~" + Sha1Hex(token);
}

} // namespace metatree
