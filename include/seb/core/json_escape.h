#pragma once

#include <string>
#include <string_view>

namespace seb::core {

// Escapes '"', '\\' and C0 control characters for embedding in a JSON string
// literal. Everything else, including non-ASCII UTF-8, passes through.
std::string EscapeJson(std::string_view text);

}  // namespace seb::core
