#include "seb/core/container.h"

#include <algorithm>

#include "seb/codec/gzip.h"
#include "seb/common.h"
#include "seb/crypto/aes_cbc.h"
#include "seb/crypto/pbkdf2.h"
#include "seb/crypto/random.h"
#include "seb/error.h"
#include "seb/errors.h"
#include "seb/orchestrator/event_bus.h"
#include "seb/security/zeroizer.h"

namespace seb::core {
namespace {

static_assert(kSaltSize + kIvSize == 32);
static_assert(kIvSize == crypto::AES256_CBC::IV_SIZE);

constexpr size_t kMinEncryptedPayload = kSaltSize + kIvSize + crypto::AES256_CBC::BLOCK_SIZE;

bool TagEquals(std::span<const uint8_t> data, const std::array<char, 4>& tag) {
  return data.size() >= kTagSize &&
         std::equal(tag.begin(), tag.end(), data.begin(),
                    [](char a, uint8_t b) { return static_cast<uint8_t>(a) == b; });
}

// Printable rendering of an unknown tag for the error message.
std::string DescribeTag(std::span<const uint8_t> tag) {
  std::string out;
  for (auto byte : tag) {
    if (byte >= 0x20 && byte < 0x7F) {
      out.push_back(static_cast<char>(byte));
    } else {
      static constexpr char kHex[] = "0123456789abcdef";
      out += "\\x";
      out.push_back(kHex[byte >> 4]);
      out.push_back(kHex[byte & 0x0F]);
    }
  }
  return out;
}

std::array<uint8_t, crypto::AES256_CBC::KEY_SIZE> DeriveKey(std::string_view password,
                                                            std::span<const uint8_t> salt) {
  return crypto::PBKDF2_HMAC_SHA256(seb::AsBytes(password), salt, kPbkdf2Iterations);
}

void AppendTag(std::vector<uint8_t>& out, const std::array<char, 4>& tag) {
  for (char ch : tag) {
    out.push_back(static_cast<uint8_t>(ch));
  }
}

void PublishDecryptionFailure() {
  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kSecurity;
  event.severity = orchestrator::EventSeverity::kWarning;
  event.event_id = "container_decrypt_failed";
  event.message = "Encrypted SEB container could not be unlocked";
  orchestrator::EventBus::Instance().Publish(event);
}

std::string DecodeEncrypted(std::span<const uint8_t> payload, std::string_view password) {
  if (payload.size() < kMinEncryptedPayload) {
    throw FormatError(std::string(errors::msg::kEncryptedPayloadTruncated),
                      errors::format::kContainerTruncated);
  }
  const auto salt = payload.subspan(0, kSaltSize);
  const auto iv = payload.subspan<kSaltSize, kIvSize>();
  const auto ciphertext = payload.subspan(kSaltSize + kIvSize);

  auto key = DeriveKey(password, salt);
  security::Zeroizer::ScopeWiper<uint8_t> key_guard(std::span<uint8_t>(key.data(), key.size()));

  std::vector<uint8_t> compressed;
  try {
    compressed = crypto::AES256_CBC_Decrypt(
        ciphertext, std::span<const uint8_t, crypto::AES256_CBC::IV_SIZE>(iv.data(), iv.size()),
        std::span<const uint8_t, crypto::AES256_CBC::KEY_SIZE>(key.data(), key.size()));
  } catch (const DecryptionError&) {
    PublishDecryptionFailure();
    throw DecryptionError(std::string(errors::msg::kDecryptionFailed));
  }

  // A wrong key that happens to unpad cleanly leaves garbage where the inner
  // gzip member should be.
  try {
    return seb::BytesToString(codec::GzipDecompress(compressed));
  } catch (const FormatError& err) {
    if (err.code == errors::format::kDecompressedTooLarge) {
      throw;
    }
    PublishDecryptionFailure();
    throw DecryptionError(std::string(errors::msg::kDecryptionFailed));
  }
}

}  // namespace

const char* ContainerKindName(ContainerKind kind) noexcept {
  switch (kind) {
  case ContainerKind::kPlain:
    return "plain";
  case ContainerKind::kEncrypted:
    return "encrypted";
  }
  return "unknown";
}

std::vector<uint8_t> EncodePlain(std::string_view xml) {
  const auto inner = codec::GzipCompress(seb::AsBytes(xml));
  std::vector<uint8_t> framed;
  framed.reserve(kTagSize + inner.size());
  AppendTag(framed, kPlainTag);
  framed.insert(framed.end(), inner.begin(), inner.end());
  return codec::GzipCompress(framed);
}

std::vector<uint8_t> EncodeEncrypted(std::string_view xml, std::string_view password) {
  const auto inner = codec::GzipCompress(seb::AsBytes(xml));
  const auto salt = crypto::RandomArray<kSaltSize>();
  const auto iv = crypto::RandomArray<kIvSize>();

  auto key = DeriveKey(password, salt);
  security::Zeroizer::ScopeWiper<uint8_t> key_guard(std::span<uint8_t>(key.data(), key.size()));
  const auto ciphertext = crypto::AES256_CBC_Encrypt(
      inner, std::span<const uint8_t, crypto::AES256_CBC::IV_SIZE>(iv),
      std::span<const uint8_t, crypto::AES256_CBC::KEY_SIZE>(key));

  std::vector<uint8_t> framed;
  framed.reserve(kTagSize + kSaltSize + kIvSize + ciphertext.size());
  AppendTag(framed, kPasswordTag);
  framed.insert(framed.end(), salt.begin(), salt.end());
  framed.insert(framed.end(), iv.begin(), iv.end());
  framed.insert(framed.end(), ciphertext.begin(), ciphertext.end());
  return codec::GzipCompress(framed);
}

std::string Decode(std::span<const uint8_t> data, std::optional<std::string_view> password) {
  const auto framed = codec::GzipDecompress(data);
  const std::span<const uint8_t> view(framed.data(), framed.size());
  if (view.size() < kTagSize) {
    throw FormatError(std::string(errors::msg::kContainerTooShort),
                      errors::format::kContainerTruncated);
  }
  const auto payload = view.subspan(kTagSize);
  if (TagEquals(view, kPlainTag)) {
    return seb::BytesToString(codec::GzipDecompress(payload));
  }
  if (TagEquals(view, kPasswordTag)) {
    if (!password) {
      throw PasswordError(std::string(errors::msg::kPasswordRequired));
    }
    return DecodeEncrypted(payload, *password);
  }
  throw FormatError(std::string(errors::msg::kUnknownContainerTag) + ": '" +
                        DescribeTag(view.first(kTagSize)) + "'",
                    errors::format::kUnknownContainerTag);
}

ContainerKind Inspect(std::span<const uint8_t> data) {
  const auto framed = codec::GzipDecompress(data);
  const std::span<const uint8_t> view(framed.data(), framed.size());
  if (view.size() < kTagSize) {
    throw FormatError(std::string(errors::msg::kContainerTooShort),
                      errors::format::kContainerTruncated);
  }
  if (TagEquals(view, kPlainTag)) {
    return ContainerKind::kPlain;
  }
  if (TagEquals(view, kPasswordTag)) {
    return ContainerKind::kEncrypted;
  }
  throw FormatError(std::string(errors::msg::kUnknownContainerTag) + ": '" +
                        DescribeTag(view.first(kTagSize)) + "'",
                    errors::format::kUnknownContainerTag);
}

}  // namespace seb::core
