#include "seb/core/config_key.h"
#include "seb/core/container.h"
#include "seb/crypto/provider.h"
#include "seb/error.h"
#include "seb/security/zeroizer.h"

#include <array>
#include <cassert>
#include <iostream>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace {

// Delegates to OpenSSL and fails the operations selected by the test.
class FaultyProvider : public seb::crypto::CryptoProvider {
public:
  bool fail_digest{false};
  bool fail_decrypt{false};

  std::vector<uint8_t> EncryptAES256CBC(
      std::span<const uint8_t> plaintext,
      std::span<const uint8_t, seb::crypto::AES256_CBC::IV_SIZE> iv,
      std::span<const uint8_t, seb::crypto::AES256_CBC::KEY_SIZE> key) override {
    return real_.EncryptAES256CBC(plaintext, iv, key);
  }

  std::vector<uint8_t> DecryptAES256CBC(
      std::span<const uint8_t> ciphertext,
      std::span<const uint8_t, seb::crypto::AES256_CBC::IV_SIZE> iv,
      std::span<const uint8_t, seb::crypto::AES256_CBC::KEY_SIZE> key) override {
    if (fail_decrypt) {
      throw seb::Error(seb::ErrorDomain::Crypto, seb::errors::crypto::kProviderFailure,
                       "cipher context unavailable");
    }
    return real_.DecryptAES256CBC(ciphertext, iv, key);
  }

  std::array<uint8_t, 32> HMACSHA256(std::span<const uint8_t> key,
                                     std::span<const uint8_t> message) override {
    return real_.HMACSHA256(key, message);
  }

  std::array<uint8_t, 32> SHA256(std::span<const uint8_t> data) override {
    if (fail_digest) {
      throw seb::Error(seb::ErrorDomain::Crypto, seb::errors::crypto::kProviderFailure,
                       "digest unavailable");
    }
    return real_.SHA256(data);
  }

private:
  seb::crypto::OpenSSLCryptoProvider real_;
};

void TestProviderFailuresPropagate() {
  auto provider = std::make_shared<FaultyProvider>();
  seb::crypto::SetCryptoProvider(provider);

  const auto container = seb::core::EncodeEncrypted("<plist/>", "pw");
  assert(seb::core::Decode(container, std::string_view("pw")) == "<plist/>");

  // Provider faults are not mistaken for a wrong password.
  provider->fail_decrypt = true;
  bool provider_error = false;
  try {
    (void)seb::core::Decode(container, std::string_view("pw"));
  } catch (const seb::DecryptionError&) {
    provider_error = false;
  } catch (const seb::Error& err) {
    provider_error = err.code == seb::errors::crypto::kProviderFailure;
  }
  assert(provider_error);
  provider->fail_decrypt = false;

  provider->fail_digest = true;
  bool digest_error = false;
  try {
    (void)seb::core::ComputeConfigKey(seb::core::Dictionary{{"a", 1}});
  } catch (const seb::Error& err) {
    digest_error = err.domain == seb::ErrorDomain::Crypto;
  }
  assert(digest_error);

  seb::crypto::ResetCryptoProviderForTesting();
  assert(seb::core::ComputeConfigKey(seb::core::Dictionary{}) ==
         "44136fa355b3678a1146ad16f7e8649e94fb4fc21fe77e8310c060f61caaff8a");
}

void TestZeroizer() {
  std::vector<uint8_t> secret{1, 2, 3, 4};
  seb::security::Zeroizer::WipeVector(secret);
  for (auto byte : secret) {
    assert(byte == 0);
  }

  std::string password = "hunter2";
  seb::security::Zeroizer::WipeString(password);
  assert(password == std::string(7, '\0'));

  std::array<uint8_t, 4> buffer{9, 9, 9, 9};
  {
    seb::security::Zeroizer::ScopeWiper<uint8_t> guard(buffer.data(), buffer.size());
  }
  assert(buffer == (std::array<uint8_t, 4>{0, 0, 0, 0}));

  buffer = {7, 7, 7, 7};
  {
    seb::security::Zeroizer::ScopeWiper<uint8_t> guard(buffer.data(), buffer.size());
    guard.Release();
  }
  assert(buffer[0] == 7);
}

void TestErrorDomainsStayInRange() {
  assert(seb::IsFrameworkErrorCode(seb::ErrorDomain::Format,
                                   seb::errors::format::kUnknownContainerTag));
  assert(seb::IsFrameworkErrorCode(seb::ErrorDomain::Crypto,
                                   seb::errors::crypto::kDecryptionFailed));
  assert(!seb::IsFrameworkErrorCode(seb::ErrorDomain::IO,
                                    seb::errors::format::kContainerTruncated));
  seb::PasswordError password("x");
  assert(password.domain == seb::ErrorDomain::Security);
}

}  // namespace

int main() {
  TestProviderFailuresPropagate();
  TestZeroizer();
  TestErrorDomainsStayInRange();
  std::cout << "error handling tests ok\n";
  return 0;
}
