#include "seb/core/validator.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

#include "seb/common.h"
#include "seb/errors.h"

namespace seb::core {
namespace {

struct IntRange {
  std::int64_t min;
  std::optional<std::int64_t> max;
};

struct KeyRule {
  std::string_view key;
  Value::Kind kind;
  std::optional<IntRange> range;
};

constexpr std::array<std::string_view, 4> kStartUrlSchemes = {"http", "https", "seb", "sebs"};

// Booleans and strings are listed only where a wrong kind would silently
// change client behaviour; the remaining documented keys are enumerations.
const std::vector<KeyRule>& TopLevelRules() {
  static const std::vector<KeyRule> rules = {
      {"startURL", Value::Kind::kString, std::nullopt},
      {"quitURL", Value::Kind::kString, std::nullopt},
      {"restartExamURL", Value::Kind::kString, std::nullopt},
      {"hashedQuitPassword", Value::Kind::kString, std::nullopt},
      {"hashedAdminPassword", Value::Kind::kString, std::nullopt},
      {"originatorVersion", Value::Kind::kString, std::nullopt},
      {"allowQuit", Value::Kind::kBool, std::nullopt},
      {"ignoreExitKeys", Value::Kind::kBool, std::nullopt},
      {"enableURLFilter", Value::Kind::kBool, std::nullopt},
      {"enableURLContentFilter", Value::Kind::kBool, std::nullopt},
      {"sendBrowserExamKey", Value::Kind::kBool, std::nullopt},
      {"allowVirtualMachine", Value::Kind::kBool, std::nullopt},
      {"allowScreenSharing", Value::Kind::kBool, std::nullopt},
      {"browserViewMode", Value::Kind::kInt, IntRange{0, 1}},
      {"newBrowserWindowByLinkPolicy", Value::Kind::kInt, IntRange{0, 3}},
      {"newBrowserWindowByScriptPolicy", Value::Kind::kInt, IntRange{0, 3}},
      {"browserWindowWebView", Value::Kind::kInt, IntRange{0, 4}},
      {"audioVolumeLevel", Value::Kind::kInt, IntRange{0, 100}},
      {"allowedDisplaysMaxNumber", Value::Kind::kInt, IntRange{1, std::nullopt}},
      {"zoomMode", Value::Kind::kInt, IntRange{0, 2}},
      {"proxySettingsPolicy", Value::Kind::kInt, IntRange{0, 1}},
      {"sebConfigPurpose", Value::Kind::kInt, IntRange{0, 1}},
      {"sebMode", Value::Kind::kInt, IntRange{0, 2}},
      {"sebServicePolicy", Value::Kind::kInt, IntRange{0, 2}},
      {"browserUserAgentMac", Value::Kind::kInt, std::nullopt},
      {"browserUserAgentWin", Value::Kind::kInt, std::nullopt},
      {"examKeySalt", Value::Kind::kBytes, std::nullopt},
      {"configKeySalt", Value::Kind::kBytes, std::nullopt},
      {"urlFilterRules", Value::Kind::kList, std::nullopt},
      {"additionalResources", Value::Kind::kList, std::nullopt},
      {"prohibitedProcesses", Value::Kind::kList, std::nullopt},
      {"permittedProcesses", Value::Kind::kList, std::nullopt},
  };
  return rules;
}

struct MemberRule {
  std::string_view key;
  Value::Kind kind;
  bool required;
  std::optional<IntRange> range;
};

struct ListRule {
  std::string_view key;
  std::vector<MemberRule> members;
};

const std::vector<ListRule>& ListRules() {
  static const std::vector<ListRule> rules = {
      {"urlFilterRules",
       {{"expression", Value::Kind::kString, true, std::nullopt},
        {"action", Value::Kind::kInt, false, IntRange{0, 2}},
        {"active", Value::Kind::kBool, false, std::nullopt},
        {"regex", Value::Kind::kBool, false, std::nullopt}}},
      {"additionalResources",
       {{"URL", Value::Kind::kString, true, std::nullopt},
        {"title", Value::Kind::kString, true, std::nullopt},
        {"active", Value::Kind::kBool, false, std::nullopt},
        {"autoOpen", Value::Kind::kBool, false, std::nullopt}}},
      {"prohibitedProcesses",
       {{"executable", Value::Kind::kString, true, std::nullopt},
        {"os", Value::Kind::kInt, false, IntRange{0, 2}},
        {"active", Value::Kind::kBool, false, std::nullopt}}},
      {"permittedProcesses",
       {{"executable", Value::Kind::kString, true, std::nullopt},
        {"os", Value::Kind::kInt, false, IntRange{0, 2}},
        {"active", Value::Kind::kBool, false, std::nullopt},
        {"autostart", Value::Kind::kBool, false, std::nullopt}}},
  };
  return rules;
}

std::string DescribeRange(const IntRange& range) {
  if (range.max) {
    return "between " + std::to_string(range.min) + " and " + std::to_string(*range.max);
  }
  return "at least " + std::to_string(range.min);
}

// Returns false after recording a kind or range violation for |path|.
bool CheckValue(const Value& value, Value::Kind kind, const std::optional<IntRange>& range,
                const std::string& path, std::vector<ValidationIssue>& issues) {
  if (value.kind() != kind) {
    issues.push_back({path, std::string("expected ") + KindName(kind) + ", found " +
                                KindName(value.kind())});
    return false;
  }
  if (range && kind == Value::Kind::kInt) {
    const auto v = value.AsInt();
    if (v < range->min || (range->max && v > *range->max)) {
      issues.push_back({path, "must be " + DescribeRange(*range)});
      return false;
    }
  }
  return true;
}

void CheckListEntries(const ListRule& rule, const List& items, std::vector<ValidationIssue>& issues) {
  for (size_t i = 0; i < items.size(); ++i) {
    const std::string item_path = std::string(rule.key) + "[" + std::to_string(i) + "]";
    if (!items[i].IsDictionary()) {
      issues.push_back({item_path, std::string("expected dictionary, found ") +
                                       KindName(items[i].kind())});
      continue;
    }
    const auto& entry = items[i].AsDictionary();
    for (const auto& member : rule.members) {
      const std::string member_path = item_path + "." + std::string(member.key);
      const Value* value = entry.Find(member.key);
      if (value == nullptr) {
        if (member.required) {
          issues.push_back({member_path, "is required"});
        }
        continue;
      }
      CheckValue(*value, member.kind, member.range, member_path, issues);
    }
  }
}

}  // namespace

bool IsAcceptableUrl(std::string_view url, std::span<const std::string_view> schemes) {
  const auto colon = url.find("://");
  if (colon == std::string_view::npos || colon == 0) {
    return false;
  }
  const std::string scheme = seb::AsciiLowercase(url.substr(0, colon));
  if (std::none_of(schemes.begin(), schemes.end(),
                   [&scheme](std::string_view s) { return scheme == s; })) {
    return false;
  }
  auto authority = url.substr(colon + 3);
  authority = authority.substr(0, authority.find_first_of("/?#"));
  if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
    authority = authority.substr(at + 1);
  }
  std::string_view host = authority;
  if (!host.empty() && host.front() == '[') {
    const auto close = host.find(']');
    if (close == std::string_view::npos) {
      return false;
    }
    host = host.substr(1, close - 1);
  } else {
    host = host.substr(0, host.find(':'));
  }
  if (host.empty()) {
    return false;
  }
  return std::none_of(host.begin(), host.end(), [](char ch) {
    return ch == ' ' || static_cast<unsigned char>(ch) < 0x20;
  });
}

std::vector<ValidationIssue> DefaultDocumentValidator::Collect(const Dictionary& doc) const {
  std::vector<ValidationIssue> issues;
  for (const auto& rule : TopLevelRules()) {
    const Value* value = doc.Find(rule.key);
    if (value == nullptr) {
      continue;
    }
    CheckValue(*value, rule.kind, rule.range, std::string(rule.key), issues);
  }

  if (const Value* start = doc.Find("startURL"); start && start->kind() == Value::Kind::kString) {
    if (!IsAcceptableUrl(start->AsString(), kStartUrlSchemes)) {
      issues.push_back({"startURL", "must be an absolute http, https, seb or sebs URL"});
    }
  }

  for (const auto& rule : ListRules()) {
    const Value* value = doc.Find(rule.key);
    if (value == nullptr || value->kind() != Value::Kind::kList) {
      continue;
    }
    CheckListEntries(rule, value->AsList(), issues);
  }
  return issues;
}

void DefaultDocumentValidator::Validate(const Dictionary& doc) const {
  auto issues = Collect(doc);
  if (issues.empty()) {
    return;
  }
  std::string message(errors::msg::kDocumentRejected);
  for (const auto& issue : issues) {
    message += "; " + issue.path + ": " + issue.message;
  }
  throw ValidationError(std::move(message), std::move(issues));
}

std::shared_ptr<const DocumentValidator> DefaultValidator() {
  static const std::shared_ptr<const DocumentValidator> validator =
      std::make_shared<DefaultDocumentValidator>();
  return validator;
}

}  // namespace seb::core
