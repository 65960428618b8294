#pragma once

#include <array>
#include <memory>
#include <span>
#include <vector>

#include "seb/crypto/aes_cbc.h"

namespace seb::crypto {

class CryptoProvider {
public:
  virtual ~CryptoProvider() = default;

  virtual std::vector<uint8_t> EncryptAES256CBC(
      std::span<const uint8_t> plaintext,
      std::span<const uint8_t, AES256_CBC::IV_SIZE> iv,
      std::span<const uint8_t, AES256_CBC::KEY_SIZE> key) = 0;

  // Throws DecryptionError when the final block does not unpad.
  virtual std::vector<uint8_t> DecryptAES256CBC(
      std::span<const uint8_t> ciphertext,
      std::span<const uint8_t, AES256_CBC::IV_SIZE> iv,
      std::span<const uint8_t, AES256_CBC::KEY_SIZE> key) = 0;

  virtual std::array<uint8_t, 32> HMACSHA256(
      std::span<const uint8_t> key,
      std::span<const uint8_t> message) = 0;

  virtual std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) = 0;
};

class OpenSSLCryptoProvider : public CryptoProvider {
public:
  std::vector<uint8_t> EncryptAES256CBC(
      std::span<const uint8_t> plaintext,
      std::span<const uint8_t, AES256_CBC::IV_SIZE> iv,
      std::span<const uint8_t, AES256_CBC::KEY_SIZE> key) override;

  std::vector<uint8_t> DecryptAES256CBC(
      std::span<const uint8_t> ciphertext,
      std::span<const uint8_t, AES256_CBC::IV_SIZE> iv,
      std::span<const uint8_t, AES256_CBC::KEY_SIZE> key) override;

  std::array<uint8_t, 32> HMACSHA256(
      std::span<const uint8_t> key,
      std::span<const uint8_t> message) override;

  std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) override;
};

std::shared_ptr<CryptoProvider> GetCryptoProviderShared();
CryptoProvider& GetCryptoProvider();
void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider);
void EnsureCryptoProviderInitialized();
void ResetCryptoProviderForTesting();

}  // namespace seb::crypto
