#include "seb/crypto/provider.h"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#if defined(_MSC_VER)
#include <intrin.h>
#elif defined(__GNUC__) && (defined(__x86_64__) || defined(__i386__))
#include <cpuid.h>
#endif

#if defined(__linux__) && defined(__aarch64__)
#include <asm/hwcap.h>
#include <sys/auxv.h>
#endif

#include <algorithm>
#include <array>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "seb/crypto/ct.h"
#include "seb/error.h"
#include "seb/orchestrator/event_bus.h"

namespace seb::crypto {

namespace {

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  ERR_clear_error();
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

class EVPContextDeleter {
public:
  void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
};

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EVPContextDeleter>;

struct HardwareCapabilities {
  bool aesni{false};
  bool sha{false};
};

struct RuntimeState {
  std::once_flag once;
  HardwareCapabilities caps{};
  bool kat_passed{false};
};

RuntimeState& MutableRuntimeState() {
  static RuntimeState state{};
  return state;
}

HardwareCapabilities DetectHardwareCapabilities() {
  HardwareCapabilities caps{};
#if defined(_MSC_VER) && (defined(_M_X64) || defined(_M_IX86))
  int cpu_info[4] = {0};
  __cpuid(cpu_info, 1);
  caps.aesni = (cpu_info[2] & (1 << 25)) != 0;
  __cpuidex(cpu_info, 7, 0);
  caps.sha = (cpu_info[1] & (1 << 29)) != 0;
#elif defined(__GNUC__) && (defined(__x86_64__) || defined(__i386__))
  unsigned int eax = 0;
  unsigned int ebx = 0;
  unsigned int ecx = 0;
  unsigned int edx = 0;
  unsigned int max_leaf = __get_cpuid_max(0, nullptr);
  if (max_leaf >= 1) {
    __cpuid(1, eax, ebx, ecx, edx);
    caps.aesni = (ecx & (1u << 25)) != 0;
  }
  if (max_leaf >= 7) {
    __cpuid_count(7, 0, eax, ebx, ecx, edx);
    caps.sha = (ebx & (1u << 29)) != 0;
  }
#elif defined(__linux__) && defined(__aarch64__)
  unsigned long hwcap = getauxval(AT_HWCAP);
#ifdef HWCAP_AES
  caps.aesni = (hwcap & HWCAP_AES) != 0;
#endif
#ifdef HWCAP_SHA2
  caps.sha = (hwcap & HWCAP_SHA2) != 0;
#endif
#endif
  return caps;
}

std::mutex& ProviderMutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<CryptoProvider>& ProviderInstance() {
  static std::shared_ptr<CryptoProvider> instance;
  return instance;
}

[[noreturn]] void ThrowCryptoError(const std::string& message,
                                   int code = errors::crypto::kProviderFailure) {
  throw seb::Error(seb::ErrorDomain::Crypto, code, message);
}

void RunKnownAnswerTests() {
  // SHA-256("abc"), FIPS 180-2 appendix B.1.
  static constexpr std::array<uint8_t, 3> kShaMessage{'a', 'b', 'c'};
  static constexpr std::array<uint8_t, 32> kShaExpected{
      0xba, 0x78, 0x16, 0xbf, 0x8f, 0x01, 0xcf, 0xea, 0x41, 0x41, 0x40, 0xde, 0x5d, 0xae, 0x22, 0x23,
      0xb0, 0x03, 0x61, 0xa3, 0x96, 0x17, 0x7a, 0x9c, 0xb4, 0x10, 0xff, 0x61, 0xf2, 0x00, 0x15, 0xad};
  // CBC-AES256 block #1, NIST SP 800-38A F.2.5.
  static constexpr std::array<uint8_t, AES256_CBC::KEY_SIZE> kKey{
      0x60, 0x3d, 0xeb, 0x10, 0x15, 0xca, 0x71, 0xbe, 0x2b, 0x73, 0xae, 0xf0, 0x85, 0x7d, 0x77, 0x81,
      0x1f, 0x35, 0x2c, 0x07, 0x3b, 0x61, 0x08, 0xd7, 0x2d, 0x98, 0x10, 0xa3, 0x09, 0x14, 0xdf, 0xf4};
  static constexpr std::array<uint8_t, AES256_CBC::IV_SIZE> kIv{
      0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09, 0x0a, 0x0b, 0x0c, 0x0d, 0x0e, 0x0f};
  static constexpr std::array<uint8_t, 16> kPlaintext{
      0x6b, 0xc1, 0xbe, 0xe2, 0x2e, 0x40, 0x9f, 0x96, 0xe9, 0x3d, 0x7e, 0x11, 0x73, 0x93, 0x17, 0x2a};
  static constexpr std::array<uint8_t, 16> kExpectedBlock{
      0xf5, 0x8c, 0x4c, 0x04, 0xd6, 0xe5, 0xf1, 0xba, 0x77, 0x9e, 0xab, 0xfb, 0x5f, 0x7b, 0xfb, 0xd6};

  OpenSSLCryptoProvider provider;
  const auto digest = provider.SHA256(std::span<const uint8_t>(kShaMessage.data(), kShaMessage.size()));
  if (!ct::CompareEqual(digest, kShaExpected)) {
    ThrowCryptoError("SHA-256 KAT mismatch", errors::crypto::kSelfTestFailed);
  }

  const auto cipher = provider.EncryptAES256CBC(
      std::span<const uint8_t>(kPlaintext.data(), kPlaintext.size()),
      std::span<const uint8_t, AES256_CBC::IV_SIZE>(kIv),
      std::span<const uint8_t, AES256_CBC::KEY_SIZE>(kKey));
  // PKCS#7 appends one full padding block to a block-aligned input.
  std::array<uint8_t, 16> first_block{};
  const size_t copy = std::min(cipher.size(), first_block.size());
  std::copy_n(cipher.begin(), copy, first_block.begin());
  uint32_t mask = 0;
  mask |= cipher.size() == 2 * AES256_CBC::BLOCK_SIZE ? 0u : 1u;
  mask |= ct::CompareEqual(first_block, kExpectedBlock) ? 0u : 2u;
  if (mask != 0u) {
    ThrowCryptoError("AES-256-CBC KAT ciphertext mismatch", errors::crypto::kSelfTestFailed);
  }

  const auto plain = provider.DecryptAES256CBC(
      std::span<const uint8_t>(cipher.data(), cipher.size()),
      std::span<const uint8_t, AES256_CBC::IV_SIZE>(kIv),
      std::span<const uint8_t, AES256_CBC::KEY_SIZE>(kKey));
  std::array<uint8_t, 16> plain_buf{};
  std::copy_n(plain.begin(), std::min(plain.size(), plain_buf.size()), plain_buf.begin());
  mask = 0;
  mask |= plain.size() == kPlaintext.size() ? 0u : 1u;
  mask |= ct::CompareEqual(plain_buf, kPlaintext) ? 0u : 2u;
  if (mask != 0u) {
    ThrowCryptoError("AES-256-CBC KAT decrypt mismatch", errors::crypto::kSelfTestFailed);
  }
}

void EnsureCryptoRuntimeConfigured() {
  auto& state = MutableRuntimeState();
  std::call_once(state.once, [&state]() {
    state.caps = DetectHardwareCapabilities();
    RunKnownAnswerTests();
    state.kat_passed = true;
    // Public fields only: a hashed field would re-enter this call_once.
    orchestrator::Event event;
    event.category = orchestrator::EventCategory::kDiagnostics;
    event.severity = orchestrator::EventSeverity::kDebug;
    event.event_id = "crypto_self_test_passed";
    event.message = "SHA-256 and AES-256-CBC known-answer tests passed";
    event.fields.emplace_back("aes_ni", state.caps.aesni ? "yes" : "no");
    event.fields.emplace_back("sha_extensions", state.caps.sha ? "yes" : "no");
    orchestrator::EventBus::Instance().Publish(event);
  });
}

}  // namespace

void EnsureCryptoProviderInitialized() {
  EnsureCryptoRuntimeConfigured();
}

std::vector<uint8_t> OpenSSLCryptoProvider::EncryptAES256CBC(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t, AES256_CBC::IV_SIZE> iv,
    std::span<const uint8_t, AES256_CBC::KEY_SIZE> key) {
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    ThrowCryptoError("Failed to allocate AES-CBC context");
  }

  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptInit_ex"));
  }

  std::vector<uint8_t> ciphertext(plaintext.size() + AES256_CBC::BLOCK_SIZE);
  int len = 0;
  int total = 0;
  if (!plaintext.empty()) {
    if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len, plaintext.data(),
                          static_cast<int>(plaintext.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptUpdate"));
    }
    total = len;
  }

  if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + total, &len) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptFinal_ex"));
  }
  total += len;
  ciphertext.resize(static_cast<size_t>(total));
  return ciphertext;
}

std::vector<uint8_t> OpenSSLCryptoProvider::DecryptAES256CBC(
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t, AES256_CBC::IV_SIZE> iv,
    std::span<const uint8_t, AES256_CBC::KEY_SIZE> key) {
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    ThrowCryptoError("Failed to allocate AES-CBC context");
  }

  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptInit_ex"));
  }

  std::vector<uint8_t> plaintext(ciphertext.size() + AES256_CBC::BLOCK_SIZE);
  int len = 0;
  int total = 0;
  if (!ciphertext.empty()) {
    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext.data(),
                          static_cast<int>(ciphertext.size())) != 1) {
      throw DecryptionError(BuildOpenSSLErrorMessage("EVP_DecryptUpdate"));
    }
    total = len;
  }

  if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &len) <= 0) {
    throw DecryptionError(BuildOpenSSLErrorMessage("EVP_DecryptFinal_ex (bad padding)"));
  }
  total += len;
  plaintext.resize(static_cast<size_t>(total));
  return plaintext;
}

std::array<uint8_t, 32> OpenSSLCryptoProvider::HMACSHA256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> message) {
  std::array<uint8_t, 32> out{};
  unsigned int len = 0;
  if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), message.data(),
           message.size(), out.data(), &len) == nullptr) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("HMAC(EVP_sha256)"));
  }
  if (len != out.size()) {
    ThrowCryptoError("Unexpected HMAC-SHA256 length");
  }
  return out;
}

std::array<uint8_t, 32> OpenSSLCryptoProvider::SHA256(
    std::span<const uint8_t> data) {
  std::array<uint8_t, 32> out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_Digest(EVP_sha256)"));
  }
  if (len != out.size()) {
    ThrowCryptoError("Unexpected SHA-256 length");
  }
  return out;
}

std::shared_ptr<CryptoProvider> GetCryptoProviderShared() {
  EnsureCryptoRuntimeConfigured();
  std::lock_guard<std::mutex> lock(ProviderMutex());
  auto& provider = ProviderInstance();
  if (!provider) {
    provider = std::make_shared<OpenSSLCryptoProvider>();
  }
  return provider;
}

CryptoProvider& GetCryptoProvider() {
  return *GetCryptoProviderShared();
}

void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider) {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  ProviderInstance() = std::move(provider);
}

void ResetCryptoProviderForTesting() {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  ProviderInstance().reset();
}

}  // namespace seb::crypto
