#include "seb/crypto/sha256.h"

#include "seb/common.h"
#include "seb/crypto/provider.h"

namespace seb::crypto {

std::array<uint8_t, 32> SHA256_Hash(std::span<const uint8_t> data) {
  auto provider = GetCryptoProviderShared();
  return provider->SHA256(data);
}

std::array<uint8_t, 32> SHA256_Hash(const std::vector<uint8_t>& data) {
  return SHA256_Hash(std::span<const uint8_t>(data.data(), data.size()));
}

std::string SHA256_Hex(std::string_view text) {
  const auto digest = SHA256_Hash(seb::AsBytes(text));
  return seb::HexEncode(std::span<const uint8_t>(digest.data(), digest.size()));
}

}  // namespace seb::crypto
