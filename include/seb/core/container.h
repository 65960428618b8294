#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace seb::core {

// .seb container layout, outermost first:
//
//   gzip( tag[4] || payload )
//
//   tag "plnd": payload = gzip(xml)
//   tag "pwcc": payload = salt[16] || iv[16] || AES-256-CBC(key, iv, gzip(xml))
//               key     = PBKDF2-HMAC-SHA256(password, salt, 10000 iterations, 32 bytes)
//
// The ciphertext carries PKCS#7 padding and no MAC; a wrong password shows up
// as a padding failure.
inline constexpr std::array<char, 4> kPlainTag{'p', 'l', 'n', 'd'};
inline constexpr std::array<char, 4> kPasswordTag{'p', 'w', 'c', 'c'};
inline constexpr size_t kTagSize = 4;
inline constexpr size_t kSaltSize = 16;
inline constexpr size_t kIvSize = 16;
inline constexpr uint32_t kPbkdf2Iterations = 10000;

enum class ContainerKind { kPlain, kEncrypted };

const char* ContainerKindName(ContainerKind kind) noexcept;

std::vector<uint8_t> EncodePlain(std::string_view xml);

// An empty |password| is valid and distinct from no password.
std::vector<uint8_t> EncodeEncrypted(std::string_view xml, std::string_view password);

// Recovers the XML payload.
//  FormatError:     outer or inner gzip is corrupt, the framing is truncated,
//                   or the tag is unknown (the message names it).
//  PasswordError:   the container is encrypted and |password| is absent.
//  DecryptionError: the password does not unlock the payload.
std::string Decode(std::span<const uint8_t> data,
                   std::optional<std::string_view> password = std::nullopt);

// Reads only the tag; nothing is decrypted.
ContainerKind Inspect(std::span<const uint8_t> data);

}  // namespace seb::core
