#include "seb/core/key_order.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>

namespace seb::core {

namespace {

// Primary collation order of printable ASCII after lowercasing.
constexpr std::string_view kAsciiOrder =
    "\t\n\v\f\r _-,;:!?.'\"()[]{}@*/\\&#%`^+<=>|~$0123456789abcdefghijklmnopqrstuvwxyz";

constexpr std::array<std::uint16_t, 256> BuildWeights() {
  std::array<std::uint16_t, 256> weights{};
  for (std::size_t i = 0; i < kAsciiOrder.size(); ++i) {
    weights[static_cast<unsigned char>(kAsciiOrder[i])] = static_cast<std::uint16_t>(i + 1);
  }
  for (std::size_t c = 'A'; c <= 'Z'; ++c) {
    weights[c] = weights[c - 'A' + 'a'];
  }
  // UTF-8 lead and continuation bytes keep code point order after ASCII.
  for (std::size_t c = 0x80; c < 256; ++c) {
    weights[c] = static_cast<std::uint16_t>(kAsciiOrder.size() + 1 + (c - 0x80));
  }
  return weights;
}

constexpr auto kWeights = BuildWeights();

// Remaining control characters carry weight zero and are ignorable.
std::size_t NextWeighted(std::string_view text, std::size_t pos) noexcept {
  while (pos < text.size() && kWeights[static_cast<unsigned char>(text[pos])] == 0) {
    ++pos;
  }
  return pos;
}

}  // namespace

int CompareKeys(std::string_view a, std::string_view b) noexcept {
  std::size_t i = NextWeighted(a, 0);
  std::size_t j = NextWeighted(b, 0);
  while (i < a.size() && j < b.size()) {
    const auto wa = kWeights[static_cast<unsigned char>(a[i])];
    const auto wb = kWeights[static_cast<unsigned char>(b[j])];
    if (wa != wb) {
      return wa < wb ? -1 : 1;
    }
    i = NextWeighted(a, i + 1);
    j = NextWeighted(b, j + 1);
  }
  const bool a_done = i >= a.size();
  const bool b_done = j >= b.size();
  if (a_done != b_done) {
    return a_done ? -1 : 1;
  }
  const int ordinal = a.compare(b);
  return ordinal < 0 ? -1 : (ordinal > 0 ? 1 : 0);
}

std::vector<const Dictionary::Entry*> SortedEntries(const Dictionary& dict) {
  std::vector<const Dictionary::Entry*> sorted;
  sorted.reserve(dict.size());
  for (const auto& entry : dict) {
    sorted.push_back(&entry);
  }
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const Dictionary::Entry* lhs, const Dictionary::Entry* rhs) {
                     return KeyLess(lhs->first, rhs->first);
                   });
  return sorted;
}

}  // namespace seb::core
