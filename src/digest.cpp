#include <metatree/digest.h>

#include <openssl/evp.h>

#include <array>
#include <stdexcept>

namespace metatree {

std::string Sha1Hex(std::string_view content) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int length = 0;
  if (EVP_Digest(content.data(), content.size(), digest.data(), &length,
                 EVP_sha1(), nullptr) != 1) {
    throw std::runtime_error("SHA-1 computation failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(length * 2);
  for (unsigned int i = 0; i < length; ++i) {
    hex.push_back(kHex[digest[i] >> 4]);
    hex.push_back(kHex[digest[i] & 0x0f]);
  }
  return hex;
}

} // namespace metatree
