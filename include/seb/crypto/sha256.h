#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace seb::crypto {
std::array<uint8_t,32> SHA256_Hash(std::span<const uint8_t> data);
std::array<uint8_t,32> SHA256_Hash(const std::vector<uint8_t>& data);
// Lowercase hex digest of the UTF-8 bytes of |text|.
std::string SHA256_Hex(std::string_view text);
} // namespace seb::crypto
