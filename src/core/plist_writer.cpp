#include "seb/core/plist_writer.h"

#include <cmath>

#include "seb/core/canonical_json.h"
#include "seb/core/key_order.h"
#include "seb/crypto/base64.h"

namespace seb::core {
namespace {

constexpr std::string_view kPlistHeader =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<!DOCTYPE plist PUBLIC \"-//Apple//DTD PLIST 1.0//EN\" "
    "\"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">\n"
    "<plist version=\"1.0\">\n";

void Indent(std::string& out, int depth) {
  out.append(static_cast<size_t>(depth), '\t');
}

std::string FormatReal(double value) {
  if (std::isnan(value)) {
    return "nan";
  }
  if (std::isinf(value)) {
    return value > 0 ? "+infinity" : "-infinity";
  }
  return FormatNumber(value);
}

void WriteElement(std::string& out, std::string_view tag, std::string_view body) {
  out.push_back('<');
  out += tag;
  out.push_back('>');
  out += body;
  out += "</";
  out += tag;
  out.push_back('>');
}

// Writes |value| starting at the current position (the caller has already
// indented the opening line). Multi-line containers indent their children at
// depth + 1 and close at |depth|.
void WriteValue(std::string& out, const Value& value, int depth);

void WriteDictionary(std::string& out, const Dictionary& dict, int depth) {
  out += "<dict>";
  for (const auto* entry : SortedEntries(dict)) {
    out.push_back('\n');
    Indent(out, depth + 1);
    WriteElement(out, "key", EscapeXml(entry->first));
    out.push_back('\n');
    Indent(out, depth + 1);
    WriteValue(out, entry->second, depth + 1);
  }
  out.push_back('\n');
  Indent(out, depth);
  out += "</dict>";
}

void WriteValue(std::string& out, const Value& value, int depth) {
  switch (value.kind()) {
  case Value::Kind::kNull:
    out += "<string></string>";
    break;
  case Value::Kind::kBool:
    out += value.AsBool() ? "<true/>" : "<false/>";
    break;
  case Value::Kind::kInt:
    WriteElement(out, "integer", std::to_string(value.AsInt()));
    break;
  case Value::Kind::kReal:
    WriteElement(out, "real", FormatReal(value.AsReal()));
    break;
  case Value::Kind::kString:
    WriteElement(out, "string", EscapeXml(value.AsString()));
    break;
  case Value::Kind::kBytes: {
    const auto& bytes = value.AsBytes();
    WriteElement(out, "data", crypto::Base64Encode(std::span<const uint8_t>(bytes.data(), bytes.size())));
    break;
  }
  case Value::Kind::kTimestamp:
    WriteElement(out, "date", FormatTimestampSeconds(value.AsTimestamp()));
    break;
  case Value::Kind::kList: {
    const auto& items = value.AsList();
    if (items.empty()) {
      out += "<array/>";
      break;
    }
    out += "<array>";
    for (const auto& item : items) {
      out.push_back('\n');
      Indent(out, depth + 1);
      WriteValue(out, item, depth + 1);
    }
    out.push_back('\n');
    Indent(out, depth);
    out += "</array>";
    break;
  }
  case Value::Kind::kDictionary:
    WriteDictionary(out, value.AsDictionary(), depth);
    break;
  }
}

}  // namespace

std::string EscapeXml(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char ch : text) {
    switch (ch) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\'':
      out += "&apos;";
      break;
    default:
      out.push_back(ch);
      break;
    }
  }
  return out;
}

std::string RenderPlist(const Dictionary& doc) {
  std::string out(kPlistHeader);
  WriteDictionary(out, doc, 0);
  out += "\n</plist>";
  return out;
}

}  // namespace seb::core
