#pragma once

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "seb/common.h"

namespace seb::core {

class Value;

using List = std::vector<Value>;

struct Timestamp {
  std::chrono::system_clock::time_point instant{};

  Timestamp() = default;
  explicit Timestamp(std::chrono::system_clock::time_point tp) : instant(tp) {}

  static Timestamp FromUnixMillis(std::int64_t millis);
  [[nodiscard]] std::int64_t UnixMillis() const;

  friend bool operator==(const Timestamp& a, const Timestamp& b) { return a.instant == b.instant; }
};

// String-keyed mapping with unique keys. Iteration follows insertion order;
// serializers never depend on it and sort on demand.
class Dictionary {
public:
  using Entry = std::pair<std::string, Value>;
  using const_iterator = std::vector<Entry>::const_iterator;

  Dictionary();
  Dictionary(std::initializer_list<Entry> entries);
  Dictionary(const Dictionary&);
  Dictionary(Dictionary&&) noexcept;
  Dictionary& operator=(const Dictionary&);
  Dictionary& operator=(Dictionary&&) noexcept;
  ~Dictionary();

  // Inserts or replaces |key|.
  void Set(std::string key, Value value);
  [[nodiscard]] const Value* Find(std::string_view key) const;
  [[nodiscard]] bool Contains(std::string_view key) const { return Find(key) != nullptr; }
  bool Erase(std::string_view key);

  // Defined out of line: Value is incomplete here.
  [[nodiscard]] std::size_t size() const noexcept;
  [[nodiscard]] bool empty() const noexcept;
  const_iterator begin() const noexcept;
  const_iterator end() const noexcept;

  friend bool operator==(const Dictionary& a, const Dictionary& b);

private:
  std::vector<Entry> entries_;
};

class Value {
public:
  enum class Kind { kNull, kBool, kInt, kReal, kString, kBytes, kTimestamp, kList, kDictionary };

  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool v) : data_(v) {}
  template <class T>
    requires(std::is_integral_v<T> && !std::is_same_v<T, bool>)
  Value(T v) : data_(static_cast<std::int64_t>(v)) {}
  Value(double v) : data_(v) {}
  Value(const char* v) : data_(std::string(v)) {}
  Value(std::string_view v) : data_(std::string(v)) {}
  Value(std::string v) : data_(std::move(v)) {}
  Value(Bytes v) : data_(std::move(v)) {}
  Value(Timestamp v) : data_(v) {}
  Value(List v) : data_(std::move(v)) {}
  Value(Dictionary v) : data_(std::move(v)) {}

  [[nodiscard]] Kind kind() const noexcept { return static_cast<Kind>(data_.index()); }
  [[nodiscard]] bool IsNull() const noexcept { return kind() == Kind::kNull; }
  [[nodiscard]] bool IsDictionary() const noexcept { return kind() == Kind::kDictionary; }

  // Typed accessors throw seb::Error (State domain) on a kind mismatch.
  [[nodiscard]] bool AsBool() const;
  [[nodiscard]] std::int64_t AsInt() const;
  [[nodiscard]] double AsReal() const;
  [[nodiscard]] const std::string& AsString() const;
  [[nodiscard]] const Bytes& AsBytes() const;
  [[nodiscard]] const Timestamp& AsTimestamp() const;
  [[nodiscard]] const List& AsList() const;
  [[nodiscard]] const Dictionary& AsDictionary() const;
  [[nodiscard]] Dictionary& AsDictionary();

  friend bool operator==(const Value& a, const Value& b);

private:
  // Alternative order must match Kind.
  std::variant<std::monostate, bool, std::int64_t, double, std::string, Bytes, Timestamp, List,
               Dictionary>
      data_;
};

const char* KindName(Value::Kind kind) noexcept;

// ISO-8601 UTC with millisecond precision: 2024-01-31T12:00:00.000Z
std::string FormatTimestampMillis(const Timestamp& ts);
// ISO-8601 UTC with second precision as used by the plist <date> element.
std::string FormatTimestampSeconds(const Timestamp& ts);

}  // namespace seb::core
