#pragma once

#include <string>
#include <string_view>

#include "seb/core/value.h"

namespace seb::core {

// Root-level key excluded from the canonical form. Nested keys with the same
// name are kept.
inline constexpr std::string_view kOriginatorVersionKey = "originatorVersion";

// Deterministic, whitespace-free JSON text of |doc| used as the Config Key
// preimage:
//  - the root "originatorVersion" entry is dropped,
//  - entries whose value is a dictionary with nothing left to render are
//    dropped at every depth,
//  - keys are ordered with CompareKeys, lists keep their order,
//  - data renders as quoted Base64, dates as quoted ISO-8601 with
//    milliseconds.
std::string SerializeCanonical(const Dictionary& doc);

// Canonical text of a single value, without the root-key special case.
std::string CanonicalValue(const Value& value);

// Shortest decimal text that round-trips |value|, in the notation a
// JavaScript Number prints (2, 0.1, 1e+21, 1e-7). NaN and infinities yield
// "null".
std::string FormatNumber(double value);

}  // namespace seb::core
