#include "seb/core/plist_writer.h"
#include "seb/core/value.h"

#include <cassert>
#include <iostream>
#include <limits>
#include <string>

using seb::core::Dictionary;
using seb::core::List;
using seb::core::RenderPlist;
using seb::core::Value;

namespace {

const std::string kHeader =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<!DOCTYPE plist PUBLIC \"-//Apple//DTD PLIST 1.0//EN\" "
    "\"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">\n"
    "<plist version=\"1.0\">\n";

void TestEmptyDocument() {
  assert(RenderPlist(Dictionary{}) == kHeader + "<dict>\n</dict>\n</plist>");
}

void TestNestedDocument() {
  Dictionary doc{
      {"startURL", "https://exam.example.com/?a=1&b=<2>"},
      {"allowQuit", false},
      {"list", List{1, Dictionary{{"x", nullptr}}}},
      {"empty", Dictionary{}},
      {"none", List{}},
      {"ratio", 1.5},
      {"whole", 2.0},
  };
  const std::string expected = kHeader +
                               "<dict>\n"
                               "\t<key>allowQuit</key>\n"
                               "\t<false/>\n"
                               "\t<key>empty</key>\n"
                               "\t<dict>\n"
                               "\t</dict>\n"
                               "\t<key>list</key>\n"
                               "\t<array>\n"
                               "\t\t<integer>1</integer>\n"
                               "\t\t<dict>\n"
                               "\t\t\t<key>x</key>\n"
                               "\t\t\t<string></string>\n"
                               "\t\t</dict>\n"
                               "\t</array>\n"
                               "\t<key>none</key>\n"
                               "\t<array/>\n"
                               "\t<key>ratio</key>\n"
                               "\t<real>1.5</real>\n"
                               "\t<key>startURL</key>\n"
                               "\t<string>https://exam.example.com/?a=1&amp;b=&lt;2&gt;</string>\n"
                               "\t<key>whole</key>\n"
                               "\t<real>2</real>\n"
                               "</dict>\n"
                               "</plist>";
  assert(RenderPlist(doc) == expected);
}

void TestScalarElements() {
  Dictionary doc{
      {"data", seb::Bytes{'h', 'i'}},
      {"date", seb::core::Timestamp::FromUnixMillis(1706702400123)},
      {"yes", true},
      {"nan", std::numeric_limits<double>::quiet_NaN()},
      {"neg", -std::numeric_limits<double>::infinity()},
  };
  const auto xml = RenderPlist(doc);
  assert(xml.find("\t<data>aGk=</data>\n") != std::string::npos);
  assert(xml.find("\t<date>2024-01-31T12:00:00Z</date>\n") != std::string::npos);
  assert(xml.find("\t<true/>\n") != std::string::npos);
  assert(xml.find("\t<real>nan</real>\n") != std::string::npos);
  assert(xml.find("\t<real>-infinity</real>\n") != std::string::npos);
}

void TestKeysAreEscapedAndSorted() {
  Dictionary doc{{"b'", 1}, {"A&", 2}};
  const auto xml = RenderPlist(doc);
  const auto first = xml.find("<key>A&amp;</key>");
  const auto second = xml.find("<key>b&apos;</key>");
  assert(first != std::string::npos && second != std::string::npos);
  assert(first < second);
  assert(seb::core::EscapeXml("\"'<>&") == "&quot;&apos;&lt;&gt;&amp;");
}

}  // namespace

int main() {
  TestEmptyDocument();
  TestNestedDocument();
  TestScalarElements();
  TestKeysAreEscapedAndSorted();
  std::cout << "plist writer tests ok\n";
  return 0;
}
