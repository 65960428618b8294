#include "seb/core/canonical_json.h"
#include "seb/core/value.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>

using seb::core::CanonicalValue;
using seb::core::Dictionary;
using seb::core::FormatNumber;
using seb::core::List;
using seb::core::SerializeCanonical;
using seb::core::Timestamp;
using seb::core::Value;

namespace {

void TestDocumentExample() {
  Dictionary doc{
      {"startURL", "https://exam.example.com"},
      {"allowQuit", false},
      {"originatorVersion", "3.7.0"},
  };
  assert(SerializeCanonical(doc) == R"({"allowQuit":false,"startURL":"https://exam.example.com"})");
}

void TestEmptyDictionaryElision() {
  Dictionary with_empty{
      {"valid", Dictionary{{"k", "v"}}},
      {"empty", Dictionary{}},
  };
  Dictionary without{{"valid", Dictionary{{"k", "v"}}}};
  assert(SerializeCanonical(with_empty) == SerializeCanonical(without));

  // Dictionaries holding only empty dictionaries vanish too.
  Dictionary nested{
      {"valid", Dictionary{{"k", "v"}, {"deep", Dictionary{{"deeper", Dictionary{}}}}}},
      {"outer", Dictionary{{"inner", Dictionary{}}}},
  };
  assert(SerializeCanonical(nested) == R"({"valid":{"k":"v"}})");

  // Empty lists and empty strings are real values and stay.
  Dictionary kept{{"list", List{}}, {"text", ""}};
  assert(SerializeCanonical(kept) == R"({"list":[],"text":""})");

  assert(SerializeCanonical(Dictionary{}) == "{}");
  assert(SerializeCanonical(Dictionary{{"e", Dictionary{}}}) == "{}");
}

void TestOriginatorVersionOnlyAtRoot() {
  Dictionary doc{
      {"originatorVersion", "3.7.0"},
      {"nested", Dictionary{{"originatorVersion", "1"}}},
  };
  assert(SerializeCanonical(doc) == R"({"nested":{"originatorVersion":"1"}})");
}

void TestScalars() {
  assert(CanonicalValue(Value(nullptr)) == "null");
  assert(CanonicalValue(Value(true)) == "true");
  assert(CanonicalValue(Value(-42)) == "-42");
  assert(CanonicalValue(Value(1.5)) == "1.5");
  assert(CanonicalValue(Value("a\"b\\c\n")) == R"("a\"b\\c\n")");
  assert(CanonicalValue(Value(std::string("\x01", 1))) == R"("\u0001")");
  assert(CanonicalValue(Value(seb::Bytes{0x00, 0x01, 0x02})) == R"("AAEC")");
  assert(CanonicalValue(Value(Timestamp::FromUnixMillis(1706702400123))) ==
         R"("2024-01-31T12:00:00.123Z")");

  List items{3, "two", Dictionary{{"b", 1}, {"A", 2}}};
  assert(CanonicalValue(Value(items)) == R"([3,"two",{"A":2,"b":1}])");
}

void TestNumberFormatting() {
  assert(FormatNumber(2.0) == "2");
  assert(FormatNumber(0.1) == "0.1");
  assert(FormatNumber(-0.0) == "0");
  assert(FormatNumber(100.0) == "100");
  assert(FormatNumber(123.456) == "123.456");
  assert(FormatNumber(1e21) == "1e+21");
  assert(FormatNumber(1e20) == "100000000000000000000");
  assert(FormatNumber(1e-7) == "1e-7");
  assert(FormatNumber(0.000001) == "0.000001");
  assert(FormatNumber(-2.5e-8) == "-2.5e-8");
  assert(FormatNumber(std::numeric_limits<double>::quiet_NaN()) == "null");
  assert(FormatNumber(std::numeric_limits<double>::infinity()) == "null");
}

void TestKeyOrdering() {
  Dictionary doc{{"b", 1}, {"A", 2}, {"_c", 3}, {"1d", 4}};
  assert(SerializeCanonical(doc) == R"({"_c":3,"1d":4,"A":2,"b":1})");
}

}  // namespace

int main() {
  TestDocumentExample();
  TestEmptyDictionaryElision();
  TestOriginatorVersionOnlyAtRoot();
  TestScalars();
  TestNumberFormatting();
  TestKeyOrdering();
  std::cout << "canonical json tests ok\n";
  return 0;
}
