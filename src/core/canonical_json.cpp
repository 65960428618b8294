#include "seb/core/canonical_json.h"

#include <array>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string>

#include "seb/core/json_escape.h"
#include "seb/core/key_order.h"
#include "seb/crypto/base64.h"

namespace seb::core {
namespace {

void AppendQuoted(std::string& out, std::string_view text) {
  out.push_back('"');
  out += EscapeJson(text);
  out.push_back('"');
}

// A dictionary "renders empty" once every entry has been elided, which can
// only happen through nested empty dictionaries.
bool RendersEmpty(const Dictionary& dict) {
  for (const auto& [key, value] : dict) {
    if (!value.IsDictionary() || !RendersEmpty(value.AsDictionary())) {
      return false;
    }
  }
  return true;
}

void AppendValue(std::string& out, const Value& value);

void AppendDictionary(std::string& out, const Dictionary& dict, bool is_root) {
  out.push_back('{');
  bool first = true;
  for (const auto* entry : SortedEntries(dict)) {
    const auto& [key, value] = *entry;
    if (is_root && key == kOriginatorVersionKey) {
      continue;
    }
    if (value.IsDictionary() && RendersEmpty(value.AsDictionary())) {
      continue;
    }
    if (!first) {
      out.push_back(',');
    }
    first = false;
    AppendQuoted(out, key);
    out.push_back(':');
    AppendValue(out, value);
  }
  out.push_back('}');
}

void AppendValue(std::string& out, const Value& value) {
  switch (value.kind()) {
  case Value::Kind::kNull:
    out += "null";
    break;
  case Value::Kind::kBool:
    out += value.AsBool() ? "true" : "false";
    break;
  case Value::Kind::kInt:
    out += std::to_string(value.AsInt());
    break;
  case Value::Kind::kReal:
    out += FormatNumber(value.AsReal());
    break;
  case Value::Kind::kString:
    AppendQuoted(out, value.AsString());
    break;
  case Value::Kind::kBytes: {
    const auto& bytes = value.AsBytes();
    AppendQuoted(out, crypto::Base64Encode(std::span<const uint8_t>(bytes.data(), bytes.size())));
    break;
  }
  case Value::Kind::kTimestamp:
    AppendQuoted(out, FormatTimestampMillis(value.AsTimestamp()));
    break;
  case Value::Kind::kList: {
    out.push_back('[');
    bool first = true;
    for (const auto& item : value.AsList()) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      AppendValue(out, item);
    }
    out.push_back(']');
    break;
  }
  case Value::Kind::kDictionary:
    AppendDictionary(out, value.AsDictionary(), false);
    break;
  }
}

}  // namespace

std::string FormatNumber(double value) {
  if (!std::isfinite(value)) {
    return "null";
  }
  if (value == 0.0) {
    return "0";  // also -0
  }

  // Shortest round-trip digits in scientific form: "d[.ddd]e[+-]XX".
  std::array<char, 64> buffer{};
  auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), std::fabs(value),
                                 std::chars_format::scientific);
  if (ec != std::errc()) {
    return "null";
  }
  const std::string_view sci(buffer.data(), static_cast<size_t>(ptr - buffer.data()));
  const auto e_pos = sci.find('e');
  std::string digits;
  for (char ch : sci.substr(0, e_pos)) {
    if (ch != '.') {
      digits.push_back(ch);
    }
  }
  int exponent = 0;
  const auto exp_text = sci.substr(e_pos + 1);
  const char* exp_begin = exp_text.data() + (exp_text.front() == '+' ? 1 : 0);
  std::from_chars(exp_begin, exp_text.data() + exp_text.size(), exponent);

  const int k = static_cast<int>(digits.size());
  const int n = exponent + 1;  // position of the decimal point
  std::string out;
  if (value < 0) {
    out.push_back('-');
  }
  if (k <= n && n <= 21) {
    out += digits;
    out.append(static_cast<size_t>(n - k), '0');
  } else if (0 < n && n <= 21) {
    out += digits.substr(0, static_cast<size_t>(n));
    out.push_back('.');
    out += digits.substr(static_cast<size_t>(n));
  } else if (-6 < n && n <= 0) {
    out += "0.";
    out.append(static_cast<size_t>(-n), '0');
    out += digits;
  } else {
    out.push_back(digits.front());
    if (k > 1) {
      out.push_back('.');
      out += digits.substr(1);
    }
    out.push_back('e');
    out.push_back(n - 1 >= 0 ? '+' : '-');
    out += std::to_string(std::abs(n - 1));
  }
  return out;
}

std::string SerializeCanonical(const Dictionary& doc) {
  std::string out;
  out.reserve(256);
  AppendDictionary(out, doc, true);
  return out;
}

std::string CanonicalValue(const Value& value) {
  std::string out;
  AppendValue(out, value);
  return out;
}

}  // namespace seb::core
