#include "common/hash_utils.h"

#include <openssl/evp.h>

namespace Common {

auto toHex(const unsigned char* bytes, size_t len) -> std::string {
  static constexpr char DIGITS[] = "0123456789abcdef";
  std::string out;
  out.resize(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out[2 * i] = DIGITS[bytes[i] >> 4];
    out[2 * i + 1] = DIGITS[bytes[i] & 0x0F];
  }
  return out;
}

auto sha256Hex(std::string_view data) -> std::string {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
    return {};
  }
  return toHex(digest, digest_len);
}

} // namespace Common
