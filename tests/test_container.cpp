#include "seb/codec/gzip.h"
#include "seb/common.h"
#include "seb/core/container.h"
#include "seb/error.h"
#include "seb/orchestrator/event_bus.h"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

using seb::core::ContainerKind;
using seb::core::Decode;
using seb::core::EncodeEncrypted;
using seb::core::EncodePlain;
using seb::core::Inspect;

namespace {

constexpr std::string_view kXml =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<plist version=\"1.0\">\n<dict/>\n</plist>";

std::vector<uint8_t> Frame(std::string_view tag, std::vector<uint8_t> payload) {
  std::vector<uint8_t> framed(tag.begin(), tag.end());
  framed.insert(framed.end(), payload.begin(), payload.end());
  return seb::codec::GzipCompress(framed);
}

std::vector<uint8_t> Unframe(const std::vector<uint8_t>& container) {
  return seb::codec::GzipDecompress(container);
}

template <typename Fn>
std::optional<int> FormatCode(Fn&& fn) {
  try {
    fn();
  } catch (const seb::FormatError& err) {
    return err.code;
  }
  return std::nullopt;
}

void TestPlainRoundTrip() {
  const auto container = EncodePlain(kXml);
  const auto framed = Unframe(container);
  assert(seb::BytesToString(std::span<const uint8_t>(framed.data(), 4)) == "plnd");
  assert(Decode(container) == kXml);
  // A password is ignored for plain containers.
  assert(Decode(container, std::string_view("unused")) == kXml);
  assert(Inspect(container) == ContainerKind::kPlain);
}

void TestEncryptedRoundTrip() {
  const auto container = EncodeEncrypted(kXml, "s3cret");
  const auto framed = Unframe(container);
  assert(seb::BytesToString(std::span<const uint8_t>(framed.data(), 4)) == "pwcc");
  // tag + salt + iv + at least one cipher block
  assert(framed.size() >= 4 + 16 + 16 + 16);
  assert((framed.size() - 36) % 16 == 0);
  assert(Decode(container, std::string_view("s3cret")) == kXml);
  assert(Inspect(container) == ContainerKind::kEncrypted);

  // Salt and IV are fresh per call.
  const auto again = Unframe(EncodeEncrypted(kXml, "s3cret"));
  assert(!std::equal(framed.begin() + 4, framed.begin() + 36, again.begin() + 4));
}

void TestEmptyPasswordStillEncrypts() {
  const auto container = EncodeEncrypted(kXml, "");
  assert(Inspect(container) == ContainerKind::kEncrypted);
  assert(Decode(container, std::string_view("")) == kXml);

  bool threw = false;
  try {
    (void)Decode(container);
  } catch (const seb::PasswordError&) {
    threw = true;
  }
  assert(threw && "absent password is not the empty password");
}

void TestPasswordRequired() {
  const auto container = EncodeEncrypted(kXml, "s3cret");
  bool threw = false;
  try {
    (void)Decode(container);
  } catch (const seb::PasswordError& err) {
    threw = std::string(err.what()) == "Password required for encrypted SEB file";
  }
  assert(threw);
}

void TestWrongPassword() {
  int failures = 0;
  seb::orchestrator::EventBus::Instance().Subscribe([&failures](const seb::orchestrator::Event& ev) {
    if (ev.event_id == "container_decrypt_failed") {
      ++failures;
    }
  });

  const auto container = EncodeEncrypted(kXml, "s3cret");
  bool threw = false;
  try {
    (void)Decode(container, std::string_view("S3cret"));
  } catch (const seb::DecryptionError& err) {
    threw = err.domain == seb::ErrorDomain::Crypto;
  }
  assert(threw);
  assert(failures == 1);
  seb::orchestrator::ResetEventBusForTesting();
}

void TestUnknownTag() {
  const auto container = Frame("zzzz", {1, 2, 3});
  bool named = false;
  try {
    (void)Decode(container);
  } catch (const seb::FormatError& err) {
    named = std::string(err.what()).find("'zzzz'") != std::string::npos &&
            err.code == seb::errors::format::kUnknownContainerTag;
  }
  assert(named);
  assert(FormatCode([&] { (void)Inspect(container); }) == seb::errors::format::kUnknownContainerTag);
}

void TestTruncatedAndCorrupt() {
  using namespace seb::errors::format;
  assert(FormatCode([] { (void)Decode(Frame("pl", {})); }) == kContainerTruncated);
  assert(FormatCode([] { (void)Decode(Frame("pwcc", std::vector<uint8_t>(40, 0)), std::string_view("x")); }) ==
         kContainerTruncated);

  const std::vector<uint8_t> garbage{'n', 'o', 't', ' ', 'g', 'z', 'i', 'p'};
  assert(FormatCode([&] { (void)Decode(garbage); }) == kCompressedDataCorrupt);
  assert(FormatCode([] { (void)Decode(std::vector<uint8_t>{}); }) == kCompressedDataCorrupt);

  auto container = EncodePlain(kXml);
  container.resize(container.size() / 2);
  assert(FormatCode([&] { (void)Decode(container); }) == kCompressedDataCorrupt);

  // Tag is fine but the inner stream is not gzip.
  assert(FormatCode([] { (void)Decode(Frame("plnd", {1, 2, 3, 4})); }) == kCompressedDataCorrupt);
}

void TestDecompressionBombRejected() {
  // 64 MiB of zeros deflate to roughly 64 KiB.
  const std::vector<uint8_t> zeros(seb::codec::kMaxDecompressedSize + 1, 0);
  const auto bomb = Frame("plnd", seb::codec::GzipCompress(zeros));
  assert(bomb.size() < 1024 * 1024);
  assert(FormatCode([&] { (void)Decode(bomb); }) == seb::errors::format::kDecompressedTooLarge);

  // Behind a correct password the limit is still a format error, not a
  // wrong-password report.
  const std::string oversized(seb::codec::kMaxDecompressedSize + 1, '\0');
  const auto encrypted = EncodeEncrypted(oversized, "pw");
  assert(FormatCode([&] { (void)Decode(encrypted, std::string_view("pw")); }) ==
         seb::errors::format::kDecompressedTooLarge);
}

}  // namespace

int main() {
  TestPlainRoundTrip();
  TestEncryptedRoundTrip();
  TestEmptyPasswordStillEncrypts();
  TestPasswordRequired();
  TestWrongPassword();
  TestUnknownTag();
  TestTruncatedAndCorrupt();
  TestDecompressionBombRejected();
  assert(std::string(seb::core::ContainerKindName(ContainerKind::kEncrypted)) == "encrypted");
  std::cout << "container tests ok\n";
  return 0;
}
