#include "seb/core/value.h"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include "seb/error.h"

namespace seb::core {

namespace {

[[noreturn]] void ThrowKindMismatch(Value::Kind expected, Value::Kind actual) {
  throw Error(ErrorDomain::State, errors::state::kValueKindMismatch,
              std::string("Value kind mismatch: expected ") + KindName(expected) + ", found " +
                  KindName(actual));
}

std::tm ToUtc(const Timestamp& ts) {
  auto tt = std::chrono::system_clock::to_time_t(
      std::chrono::floor<std::chrono::seconds>(ts.instant));
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  return tm;
}

}  // namespace

Timestamp Timestamp::FromUnixMillis(std::int64_t millis) {
  return Timestamp(std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::milliseconds(millis))));
}

std::int64_t Timestamp::UnixMillis() const {
  return std::chrono::floor<std::chrono::milliseconds>(instant.time_since_epoch()).count();
}

Dictionary::Dictionary() = default;
Dictionary::Dictionary(const Dictionary&) = default;
Dictionary::Dictionary(Dictionary&&) noexcept = default;
Dictionary& Dictionary::operator=(const Dictionary&) = default;
Dictionary& Dictionary::operator=(Dictionary&&) noexcept = default;
Dictionary::~Dictionary() = default;

Dictionary::Dictionary(std::initializer_list<Entry> entries) {
  for (const auto& entry : entries) {
    Set(entry.first, entry.second);
  }
}

std::size_t Dictionary::size() const noexcept { return entries_.size(); }
bool Dictionary::empty() const noexcept { return entries_.empty(); }
Dictionary::const_iterator Dictionary::begin() const noexcept { return entries_.begin(); }
Dictionary::const_iterator Dictionary::end() const noexcept { return entries_.end(); }

void Dictionary::Set(std::string key, Value value) {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&key](const Entry& entry) { return entry.first == key; });
  if (it != entries_.end()) {
    it->second = std::move(value);
    return;
  }
  entries_.emplace_back(std::move(key), std::move(value));
}

const Value* Dictionary::Find(std::string_view key) const {
  for (const auto& entry : entries_) {
    if (entry.first == key) {
      return &entry.second;
    }
  }
  return nullptr;
}

bool Dictionary::Erase(std::string_view key) {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [key](const Entry& entry) { return entry.first == key; });
  if (it == entries_.end()) {
    return false;
  }
  entries_.erase(it);
  return true;
}

bool operator==(const Dictionary& a, const Dictionary& b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (const auto& entry : a) {
    const Value* other = b.Find(entry.first);
    if (other == nullptr || !(*other == entry.second)) {
      return false;
    }
  }
  return true;
}

bool operator==(const Value& a, const Value& b) {
  return a.data_ == b.data_;
}

bool Value::AsBool() const {
  if (kind() != Kind::kBool) {
    ThrowKindMismatch(Kind::kBool, kind());
  }
  return std::get<bool>(data_);
}

std::int64_t Value::AsInt() const {
  if (kind() != Kind::kInt) {
    ThrowKindMismatch(Kind::kInt, kind());
  }
  return std::get<std::int64_t>(data_);
}

double Value::AsReal() const {
  if (kind() != Kind::kReal) {
    ThrowKindMismatch(Kind::kReal, kind());
  }
  return std::get<double>(data_);
}

const std::string& Value::AsString() const {
  if (kind() != Kind::kString) {
    ThrowKindMismatch(Kind::kString, kind());
  }
  return std::get<std::string>(data_);
}

const Bytes& Value::AsBytes() const {
  if (kind() != Kind::kBytes) {
    ThrowKindMismatch(Kind::kBytes, kind());
  }
  return std::get<Bytes>(data_);
}

const Timestamp& Value::AsTimestamp() const {
  if (kind() != Kind::kTimestamp) {
    ThrowKindMismatch(Kind::kTimestamp, kind());
  }
  return std::get<Timestamp>(data_);
}

const List& Value::AsList() const {
  if (kind() != Kind::kList) {
    ThrowKindMismatch(Kind::kList, kind());
  }
  return std::get<List>(data_);
}

const Dictionary& Value::AsDictionary() const {
  if (kind() != Kind::kDictionary) {
    ThrowKindMismatch(Kind::kDictionary, kind());
  }
  return std::get<Dictionary>(data_);
}

Dictionary& Value::AsDictionary() {
  if (kind() != Kind::kDictionary) {
    ThrowKindMismatch(Kind::kDictionary, kind());
  }
  return std::get<Dictionary>(data_);
}

const char* KindName(Value::Kind kind) noexcept {
  switch (kind) {
  case Value::Kind::kNull:
    return "null";
  case Value::Kind::kBool:
    return "bool";
  case Value::Kind::kInt:
    return "integer";
  case Value::Kind::kReal:
    return "real";
  case Value::Kind::kString:
    return "string";
  case Value::Kind::kBytes:
    return "data";
  case Value::Kind::kTimestamp:
    return "date";
  case Value::Kind::kList:
    return "array";
  case Value::Kind::kDictionary:
    return "dictionary";
  }
  return "unknown";
}

std::string FormatTimestampMillis(const Timestamp& ts) {
  const auto tm = ToUtc(ts);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(ts.instant.time_since_epoch()) %
                std::chrono::seconds(1);
  if (millis.count() < 0) {
    millis += std::chrono::seconds(1);
  }
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(3) << std::setfill('0') << millis.count() << 'Z';
  return oss.str();
}

std::string FormatTimestampSeconds(const Timestamp& ts) {
  const auto tm = ToUtc(ts);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << 'Z';
  return oss.str();
}

}  // namespace seb::core
