#pragma once

#include <string_view>

namespace seb::errors::msg {
// Centralized message catalog.
inline constexpr std::string_view kPasswordRequired{"Password required for encrypted SEB file"};
inline constexpr std::string_view kUnknownContainerTag{"Unrecognized SEB container tag"};
inline constexpr std::string_view kContainerTooShort{"SEB container too short for its framing"};
inline constexpr std::string_view kEncryptedPayloadTruncated{"Encrypted SEB payload truncated"};
inline constexpr std::string_view kDecryptionFailed{"Failed to decrypt SEB container (wrong password or corrupt data)"};
inline constexpr std::string_view kGzipCorrupt{"Compressed data is corrupt or truncated"};
inline constexpr std::string_view kGzipInitFailed{"Failed to initialize gzip stream"};
inline constexpr std::string_view kGzipDeflateFailed{"gzip compression failed"};
inline constexpr std::string_view kGzipInputTooLarge{"Input too large for gzip stream"};
inline constexpr std::string_view kGzipOutputTooLarge{"Decompressed data exceeds the size limit"};
inline constexpr std::string_view kBase64Malformed{"Malformed Base64 text"};
inline constexpr std::string_view kDigestCapabilityMissing{"SHA-256 digest capability is not available in this environment"};
inline constexpr std::string_view kClientCapabilityMissing{"SEB client API is not available in this environment"};
inline constexpr std::string_view kDocumentRejected{"Configuration document failed validation"};
inline constexpr std::string_view kRandomUnavailable{"System random source unavailable"};
inline constexpr std::string_view kAtomicReplaceFailed{"Atomic file replace failed"};
}  // namespace seb::errors::msg
