#pragma once

#include <string>
#include <string_view>

#include "seb/core/value.h"

namespace seb::core {

// Renders |doc| as an XML property list (plist 1.0). Dictionaries at every
// depth list their keys in CompareKeys order; integers and reals keep their
// distinct elements; null renders as an empty <string>. Nested elements are
// indented one tab per level and lines end in '\n', with no newline after the
// closing </plist>.
std::string RenderPlist(const Dictionary& doc);

// Escapes the five predefined XML entities.
std::string EscapeXml(std::string_view text);

}  // namespace seb::core
