#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace seb::crypto {

// Derives a single 32-byte PBKDF2-HMAC-SHA256 block (RFC 8018 with dkLen equal
// to the hash length). |iterations| below one is treated as one.
std::array<uint8_t, 32> PBKDF2_HMAC_SHA256(std::span<const uint8_t> password,
                                           std::span<const uint8_t> salt,
                                           uint32_t iterations);

}  // namespace seb::crypto
