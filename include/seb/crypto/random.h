#pragma once

#include <array>
#include <cstdint>
#include <span>

#include "seb/common.h"

namespace seb::crypto {

// Fills |out| from the operating system CSPRNG. Throws seb::Error
// (errors::crypto::kRandomUnavailable) when no entropy source answers.
void SystemRandomBytes(std::span<uint8_t> out);

template <size_t N>
std::array<uint8_t, N> RandomArray() {
  std::array<uint8_t, N> out{};
  SystemRandomBytes(out);
  return out;
}

}  // namespace seb::crypto
