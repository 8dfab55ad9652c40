#pragma once

#include <string>
#include <string_view>

namespace metatree {

// SHA-1 of the given bytes as 40 lower-case hex characters.
std::string Sha1Hex(std::string_view content);

} // namespace metatree
