#include "seb/core/key_order.h"
#include "seb/core/value.h"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

std::vector<std::string> OrderedKeys(const seb::core::Dictionary& dict) {
  std::vector<std::string> keys;
  for (const auto* entry : seb::core::SortedEntries(dict)) {
    keys.push_back(entry->first);
  }
  return keys;
}

}  // namespace

int main() {
  using seb::core::CompareKeys;
  using seb::core::KeyLess;

  // Case folds before anything else.
  assert(KeyLess("allowQuit", "Browser"));
  assert(KeyLess("browserViewMode", "startURL"));
  assert(KeyLess("startURL", "URLFilterRules"));
  assert(CompareKeys("abc", "abc") == 0);

  // Punctuation and digits sort ahead of letters.
  assert(KeyLess("_hidden", "alpha"));
  assert(KeyLess("9lives", "alpha"));
  assert(KeyLess("a-b", "a1"));
  assert(KeyLess("a1", "aa"));

  // A prefix sorts first.
  assert(KeyLess("zoom", "zoomMode"));
  assert(!KeyLess("zoomMode", "zoom"));

  // Keys equal under folding still order deterministically.
  assert(CompareKeys("ABC", "abc") != 0);
  assert(CompareKeys("ABC", "abc") == -CompareKeys("abc", "ABC"));

  // Non-ASCII after ASCII letters.
  assert(KeyLess("zebra", "\xC3\xA9t\xC3\xA9"));

  seb::core::Dictionary dict{
      {"startURL", "https://exam.example.com"},
      {"allowQuit", false},
      {"Zoom", 1},
      {"browserViewMode", 0},
      {"URLFilterRules", seb::core::List{}},
  };
  const std::vector<std::string> expected{"allowQuit", "browserViewMode", "startURL",
                                          "URLFilterRules", "Zoom"};
  assert(OrderedKeys(dict) == expected);

  std::cout << "key order tests ok\n";
  return 0;
}
