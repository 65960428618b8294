#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "seb/core/container.h"
#include "seb/error.h"

// Decode must either return or throw seb::Error for arbitrary bytes.
extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  if (data == nullptr) {
    return 0;
  }
  std::span<const uint8_t> bytes(data, size);
  try {
    (void)seb::core::Inspect(bytes);
    (void)seb::core::Decode(bytes, std::string_view("fuzz"));
  } catch (const seb::Error&) {
  }
  return 0;
}
