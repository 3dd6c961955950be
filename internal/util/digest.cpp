#include "digest.hpp"

#include <openssl/sha.h>

#include <array>

namespace mediacache::util {

std::string Sha256Hex(std::string_view data) {
  std::array<unsigned char, SHA256_DIGEST_LENGTH> hash{};
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash.data());

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(hash.size() * 2);
  for (auto byte : hash) {
    result.push_back(kHex[(byte >> 4) & 0x0F]);
    result.push_back(kHex[byte & 0x0F]);
  }
  return result;
}

} // namespace mediacache::util
