#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include "seb/core/value.h"

namespace seb::core {

// Request header through which a client presents its RequestHash.
inline constexpr std::string_view kConfigKeyHashHeader = "X-SafeExamBrowser-ConfigKeyHash";

inline constexpr size_t kConfigKeyHexLength = 64;

// Source of SHA-256 digests for the request-hash protocol. Call sites receive
// a handle once and pass it down; a null handle means the environment offers
// no digest function.
class DigestCapability {
public:
  virtual ~DigestCapability() = default;
  virtual std::array<uint8_t, 32> Sha256(std::span<const uint8_t> data) = 0;
};

// Digest capability backed by the process crypto provider.
std::shared_ptr<DigestCapability> LocalDigestCapability();

// Lowercase SHA-256 hex of the canonical form of |doc|.
std::string ComputeConfigKey(const Dictionary& doc);

// Drops everything from the first '#' onward.
std::string_view NormalizeUrl(std::string_view url) noexcept;

// sha256_hex(NormalizeUrl(url) + config_key), lowercase. No separator.
std::string ComputeRequestHash(std::string_view url, std::string_view config_key);

// Case-insensitive comparison of |received_hash| with ComputeRequestHash.
bool VerifyRequestHash(std::string_view url, std::string_view config_key,
                       std::string_view received_hash);

// Same computations through an injected digest handle. Throw
// CapabilityUnavailableError when |digest| is null.
std::string ComputeRequestHash(std::string_view url, std::string_view config_key,
                               DigestCapability* digest);
bool VerifyRequestHash(std::string_view url, std::string_view config_key,
                       std::string_view received_hash, DigestCapability* digest);

}  // namespace seb::core
