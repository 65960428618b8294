#include "seb/crypto/base64.h"

#include <limits>

#include <openssl/evp.h>

#include "seb/error.h"
#include "seb/errors.h"

namespace seb::crypto {

std::string Base64Encode(std::span<const uint8_t> data) {
  if (data.empty()) {
    return {};
  }
  if (data.size() > static_cast<size_t>(std::numeric_limits<int>::max() / 4 * 3)) {
    throw Error(ErrorDomain::Crypto, errors::crypto::kProviderFailure, "Base64 input too large");
  }
  std::string out(4 * ((data.size() + 2) / 3), '\0');
  const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                      data.data(), static_cast<int>(data.size()));
  if (written < 0) {
    throw Error(ErrorDomain::Crypto, errors::crypto::kProviderFailure, "EVP_EncodeBlock failed");
  }
  out.resize(static_cast<size_t>(written));
  return out;
}

std::vector<uint8_t> Base64Decode(std::string_view text) {
  if (text.empty()) {
    return {};
  }
  if (text.size() % 4 != 0 ||
      text.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
    throw FormatError(std::string(errors::msg::kBase64Malformed),
                      errors::format::kBase64Malformed);
  }
  // Padding may only occupy the last one or two positions.
  if (const auto pad = text.find('='); pad != std::string_view::npos) {
    if (pad < text.size() - 2 || text.find_first_not_of('=', pad) != std::string_view::npos) {
      throw FormatError(std::string(errors::msg::kBase64Malformed),
                        errors::format::kBase64Malformed);
    }
  }
  std::vector<uint8_t> out(text.size() / 4 * 3);
  const int written = EVP_DecodeBlock(out.data(),
                                      reinterpret_cast<const unsigned char*>(text.data()),
                                      static_cast<int>(text.size()));
  if (written < 0) {
    throw FormatError(std::string(errors::msg::kBase64Malformed),
                      errors::format::kBase64Malformed);
  }
  // EVP_DecodeBlock keeps the zero bytes produced by padding.
  size_t padding = 0;
  if (text.back() == '=') {
    ++padding;
    if (text[text.size() - 2] == '=') {
      ++padding;
    }
  }
  out.resize(static_cast<size_t>(written) - padding);
  return out;
}

}  // namespace seb::crypto
