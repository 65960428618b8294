#pragma once
#include <algorithm>
#include <array>
#include <atomic>
#include <cstdint>
#include <span>
#include <string_view>

namespace seb::crypto::ct {

template <size_t N>
inline bool CompareEqual(const std::array<uint8_t, N>& a,
                         const std::array<uint8_t, N>& b) noexcept {
  volatile uint8_t diff = 0;
  for (size_t i = 0; i < N; ++i)
    diff |= (a[i] ^ b[i]);
  return diff == 0;
}

inline bool CompareEqual(std::span<const uint8_t> a, std::span<const uint8_t> b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  volatile uint8_t diff = 0;
  for (size_t i = 0; i < a.size(); ++i)
    diff |= (a[i] ^ b[i]);
  std::atomic_signal_fence(std::memory_order_seq_cst);
  return diff == 0;
}

// Length mismatch is reported without early exit on content; both inputs are
// walked to the longer length.
inline bool StringCompare(std::string_view a, std::string_view b) noexcept {
  const size_t longest = std::max(a.size(), b.size());
  volatile uint8_t diff = static_cast<uint8_t>(a.size() != b.size());
  for (size_t i = 0; i < longest; ++i) {
    const uint8_t ca = i < a.size() ? static_cast<uint8_t>(a[i]) : 0;
    const uint8_t cb = i < b.size() ? static_cast<uint8_t>(b[i]) : 0;
    diff |= static_cast<uint8_t>(ca ^ cb);
  }
  std::atomic_signal_fence(std::memory_order_seq_cst);
  return diff == 0;
}

} // namespace seb::crypto::ct
