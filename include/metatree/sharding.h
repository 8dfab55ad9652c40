#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace metatree {

using ShardParts = std::vector<std::size_t>;

// Splits the leading parts[i]-sized prefixes off name, e.g. "abcdef" with
// {2, 2} yields directory "ab/cd" and remainder "ef". Throws
// std::invalid_argument if name is not longer than the sum of parts.
struct ShardSplit {
  std::filesystem::path directory;
  std::string remainder;
};

ShardSplit SplitName(std::string_view name, const ShardParts &parts);

// directory / remainder of SplitName.
std::filesystem::path ShardedPath(std::string_view name,
                                  const ShardParts &parts);

// Directory-safe name for an arbitrary token. Tokens that are long enough and
// use only [A-Za-z0-9._-] are returned unchanged, others are replaced by
// "~" + SHA-1 of the token, so distinct tokens never share a directory.
std::string ShardKey(std::string_view token, const ShardParts &parts);

} // namespace metatree
