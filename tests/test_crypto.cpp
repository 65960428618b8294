#include "seb/common.h"
#include "seb/crypto/aes_cbc.h"
#include "seb/crypto/ct.h"
#include "seb/crypto/provider.h"
#include "seb/crypto/hmac_sha256.h"
#include "seb/crypto/pbkdf2.h"
#include "seb/crypto/random.h"
#include "seb/crypto/sha256.h"
#include "seb/error.h"
#include "seb/orchestrator/event_bus.h"

#include <array>
#include <cassert>
#include <iostream>
#include <span>
#include <string>
#include <vector>

namespace {

// Must run before anything else in this process touches the provider.
void TestSelfTestReportedAsDebugEvent() {
  using seb::orchestrator::Event;
  std::vector<Event> seen;
  seb::orchestrator::EventBus::Instance().Subscribe([&seen](const Event& event) {
    seen.push_back(event);
  });
  seb::crypto::EnsureCryptoProviderInitialized();
  seb::crypto::EnsureCryptoProviderInitialized();
  seb::orchestrator::ResetEventBusForTesting();

  assert(seen.size() == 1);
  assert(seen.front().event_id == "crypto_self_test_passed");
  assert(seen.front().severity == seb::orchestrator::EventSeverity::kDebug);
  assert(seen.front().category == seb::orchestrator::EventCategory::kDiagnostics);
}

std::string Hex(std::span<const uint8_t> bytes) {
  return seb::HexEncode(bytes);
}

void TestDigests() {
  assert(seb::crypto::SHA256_Hex("") ==
         "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  assert(seb::crypto::SHA256_Hex("abc") ==
         "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

  const auto mac = seb::crypto::HMAC_SHA256::Compute(
      seb::AsBytes("key"), seb::AsBytes("The quick brown fox jumps over the lazy dog"));
  assert(Hex(mac) == "f7bc83f430538424b13298e6aa6fb143ef4d59a14946175997479dbc2d1a3cd8");
}

void TestPbkdf2() {
  // Published PBKDF2-HMAC-SHA256 vectors.
  auto key = seb::crypto::PBKDF2_HMAC_SHA256(seb::AsBytes("password"), seb::AsBytes("salt"), 1);
  assert(Hex(key) == "120fb6cffcf8b32c43e7225256c4f837a86548c92ccc35480805987cb70be17b");
  key = seb::crypto::PBKDF2_HMAC_SHA256(seb::AsBytes("password"), seb::AsBytes("salt"), 4096);
  assert(Hex(key) == "c5e478d59288c841aa530db6845c4c8d962893a001ce4e11a4963873aa98134a");
}

void TestAesCbc() {
  const auto key = seb::crypto::RandomArray<seb::crypto::AES256_CBC::KEY_SIZE>();
  const auto iv = seb::crypto::RandomArray<seb::crypto::AES256_CBC::IV_SIZE>();
  const std::string message = "sixteen byte msg";
  const auto ciphertext = seb::crypto::AES256_CBC_Encrypt(
      seb::AsBytes(message), std::span<const uint8_t, 16>(iv), std::span<const uint8_t, 32>(key));
  // A full block of padding follows a block-aligned message.
  assert(ciphertext.size() == 32);
  const auto plaintext = seb::crypto::AES256_CBC_Decrypt(
      ciphertext, std::span<const uint8_t, 16>(iv), std::span<const uint8_t, 32>(key));
  assert(seb::BytesToString(plaintext) == message);

  int padding_failures = 0;
  // A wrong key unpads by chance about once in 256 tries; eight tries keep
  // the check deterministic enough.
  for (int i = 0; i < 8; ++i) {
    auto wrong = seb::crypto::RandomArray<seb::crypto::AES256_CBC::KEY_SIZE>();
    try {
      (void)seb::crypto::AES256_CBC_Decrypt(ciphertext, std::span<const uint8_t, 16>(iv),
                                            std::span<const uint8_t, 32>(wrong));
    } catch (const seb::DecryptionError&) {
      ++padding_failures;
    }
  }
  assert(padding_failures >= 6);
}

void TestRandomAndCompare() {
  const auto a = seb::crypto::RandomArray<32>();
  const auto b = seb::crypto::RandomArray<32>();
  assert(!seb::crypto::ct::CompareEqual(a, b));
  assert(seb::crypto::ct::CompareEqual(a, a));
  assert(seb::crypto::ct::StringCompare("abc", "abc"));
  assert(!seb::crypto::ct::StringCompare("abc", "abcd"));
  assert(!seb::crypto::ct::StringCompare("abd", "abc"));
}

}  // namespace

int main() {
  TestSelfTestReportedAsDebugEvent();
  TestDigests();
  TestPbkdf2();
  TestAesCbc();
  TestRandomAndCompare();
  std::cout << "crypto tests ok\n";
  return 0;
}
