#include "seb/crypto/base64.h"
#include "seb/common.h"
#include "seb/error.h"

#include <cassert>
#include <iostream>
#include <string>

namespace {

bool Rejects(std::string_view text) {
  try {
    (void)seb::crypto::Base64Decode(text);
  } catch (const seb::FormatError& err) {
    return err.code == seb::errors::format::kBase64Malformed;
  }
  return false;
}

}  // namespace

int main() {
  using seb::crypto::Base64Decode;
  using seb::crypto::Base64Encode;

  assert(Base64Encode(seb::AsBytes("")) == "");
  assert(Base64Encode(seb::AsBytes("f")) == "Zg==");
  assert(Base64Encode(seb::AsBytes("fo")) == "Zm8=");
  assert(Base64Encode(seb::AsBytes("foo")) == "Zm9v");
  assert(Base64Encode(seb::AsBytes("foobar")) == "Zm9vYmFy");

  assert(seb::BytesToString(Base64Decode("Zg==")) == "f");
  assert(seb::BytesToString(Base64Decode("Zm8=")) == "fo");
  assert(seb::BytesToString(Base64Decode("Zm9vYmFy")) == "foobar");
  assert(Base64Decode("").empty());

  const seb::Bytes binary{0x00, 0xFF, 0x10, 0x80};
  assert(Base64Decode(Base64Encode(binary)) == binary);

  assert(Rejects("Zg="));
  assert(Rejects("Z!=="));
  // Padding only at the end, at most two characters.
  assert(Rejects("===="));
  assert(Rejects("A==="));
  assert(Rejects("=AAA"));
  assert(Rejects("AB=C"));
  assert(Rejects("Zg==Zg=="));

  std::cout << "base64 tests ok\n";
  return 0;
}
