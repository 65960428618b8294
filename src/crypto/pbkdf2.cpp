#include "seb/crypto/pbkdf2.h"

#include <algorithm>
#include <vector>

#include "seb/crypto/hmac_sha256.h"
#include "seb/security/zeroizer.h"

namespace seb::crypto {

std::array<uint8_t, 32> PBKDF2_HMAC_SHA256(std::span<const uint8_t> password,
                                           std::span<const uint8_t> salt,
                                           uint32_t iterations) {
  iterations = std::max<uint32_t>(iterations, 1u);

  // salt || INT_32_BE(1)
  std::vector<uint8_t> block(salt.begin(), salt.end());
  block.insert(block.end(), {0x00, 0x00, 0x00, 0x01});
  security::Zeroizer::ScopeWiper<uint8_t> block_guard(std::span<uint8_t>(block.data(), block.size()));

  auto iter = HMAC_SHA256::Compute(password, std::span<const uint8_t>(block.data(), block.size()));
  security::Zeroizer::ScopeWiper<uint8_t> iter_guard(std::span<uint8_t>(iter.data(), iter.size()));
  std::array<uint8_t, 32> output = iter;

  for (uint32_t i = 1; i < iterations; ++i) {
    iter = HMAC_SHA256::Compute(password, std::span<const uint8_t>(iter.data(), iter.size()));
    for (size_t j = 0; j < output.size(); ++j) {
      output[j] ^= iter[j];
    }
  }
  return output;
}

}  // namespace seb::crypto
