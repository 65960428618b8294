#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace seb::crypto {

struct AES256_CBC {
  static constexpr size_t KEY_SIZE = 32;
  static constexpr size_t IV_SIZE = 16;
  static constexpr size_t BLOCK_SIZE = 16;
};

// Encrypts |plaintext| using AES-256-CBC with PKCS#7 padding. Throws seb::Error
// on provider failures.
std::vector<uint8_t> AES256_CBC_Encrypt(std::span<const uint8_t> plaintext,
                                        std::span<const uint8_t, AES256_CBC::IV_SIZE> iv,
                                        std::span<const uint8_t, AES256_CBC::KEY_SIZE> key);

// Decrypts |ciphertext| and strips the padding. Throws DecryptionError when the
// padding does not verify, which is how a wrong key shows up.
std::vector<uint8_t> AES256_CBC_Decrypt(std::span<const uint8_t> ciphertext,
                                        std::span<const uint8_t, AES256_CBC::IV_SIZE> iv,
                                        std::span<const uint8_t, AES256_CBC::KEY_SIZE> key);

} // namespace seb::crypto
