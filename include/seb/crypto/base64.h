#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace seb::crypto {

// Standard alphabet, '=' padded, no line breaks.
std::string Base64Encode(std::span<const uint8_t> data);

// Inverse of Base64Encode. Throws FormatError (errors::format::kBase64Malformed)
// when |text| is not a padded standard-alphabet encoding.
std::vector<uint8_t> Base64Decode(std::string_view text);

}  // namespace seb::crypto
