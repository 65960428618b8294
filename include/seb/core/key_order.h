#pragma once

#include <string_view>
#include <vector>

#include "seb/core/value.h"

namespace seb::core {

// Case-insensitive, locale-aware ordering of dictionary keys shared by the
// canonical serializer and the plist writer. Letters compare without regard
// to ASCII case; whitespace and punctuation order before digits, digits
// before letters, following the root collation order. Keys that collate
// equal fall back to a byte-wise comparison so the order is total.
int CompareKeys(std::string_view a, std::string_view b) noexcept;

inline bool KeyLess(std::string_view a, std::string_view b) noexcept {
  return CompareKeys(a, b) < 0;
}

// Entries of |dict| in key order. Pointers stay valid while |dict| is alive
// and unmodified.
std::vector<const Dictionary::Entry*> SortedEntries(const Dictionary& dict);

}  // namespace seb::core
