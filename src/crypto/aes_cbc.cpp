#include "seb/crypto/aes_cbc.h"

#include "seb/crypto/provider.h"

namespace seb::crypto {

std::vector<uint8_t> AES256_CBC_Encrypt(std::span<const uint8_t> plaintext,
                                        std::span<const uint8_t, AES256_CBC::IV_SIZE> iv,
                                        std::span<const uint8_t, AES256_CBC::KEY_SIZE> key) {
  auto provider = GetCryptoProviderShared();
  return provider->EncryptAES256CBC(plaintext, iv, key);
}

std::vector<uint8_t> AES256_CBC_Decrypt(std::span<const uint8_t> ciphertext,
                                        std::span<const uint8_t, AES256_CBC::IV_SIZE> iv,
                                        std::span<const uint8_t, AES256_CBC::KEY_SIZE> key) {
  auto provider = GetCryptoProviderShared();
  return provider->DecryptAES256CBC(ciphertext, iv, key);
}

}  // namespace seb::crypto
