#include "seb/core/config_key.h"

#include "seb/common.h"
#include "seb/core/canonical_json.h"
#include "seb/crypto/ct.h"
#include "seb/crypto/sha256.h"
#include "seb/error.h"
#include "seb/errors.h"

namespace seb::core {
namespace {

class ProviderDigestCapability final : public DigestCapability {
public:
  std::array<uint8_t, 32> Sha256(std::span<const uint8_t> data) override {
    return crypto::SHA256_Hash(data);
  }
};

std::string HexDigest(DigestCapability& digest, std::string_view text) {
  const auto hash = digest.Sha256(seb::AsBytes(text));
  return seb::HexEncode(std::span<const uint8_t>(hash.data(), hash.size()));
}

std::string RequestPreimage(std::string_view url, std::string_view config_key) {
  std::string combined(NormalizeUrl(url));
  combined += config_key;
  return combined;
}

}  // namespace

std::shared_ptr<DigestCapability> LocalDigestCapability() {
  static const auto capability = std::make_shared<ProviderDigestCapability>();
  return capability;
}

std::string ComputeConfigKey(const Dictionary& doc) {
  return crypto::SHA256_Hex(SerializeCanonical(doc));
}

std::string_view NormalizeUrl(std::string_view url) noexcept {
  return url.substr(0, url.find('#'));
}

std::string ComputeRequestHash(std::string_view url, std::string_view config_key) {
  return crypto::SHA256_Hex(RequestPreimage(url, config_key));
}

bool VerifyRequestHash(std::string_view url, std::string_view config_key,
                       std::string_view received_hash) {
  const auto expected = ComputeRequestHash(url, config_key);
  return crypto::ct::StringCompare(expected, seb::AsciiLowercase(received_hash));
}

std::string ComputeRequestHash(std::string_view url, std::string_view config_key,
                               DigestCapability* digest) {
  if (digest == nullptr) {
    throw CapabilityUnavailableError(std::string(errors::msg::kDigestCapabilityMissing));
  }
  return HexDigest(*digest, RequestPreimage(url, config_key));
}

bool VerifyRequestHash(std::string_view url, std::string_view config_key,
                       std::string_view received_hash, DigestCapability* digest) {
  const auto expected = ComputeRequestHash(url, config_key, digest);
  return crypto::ct::StringCompare(expected, seb::AsciiLowercase(received_hash));
}

}  // namespace seb::core
