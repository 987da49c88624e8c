#pragma once

#include <string>
#include <string_view>

namespace upgrader::util {

// Strips leading/trailing spaces, tabs, CR, LF, FF and VT.
std::string Trim(std::string_view value);

std::string ToLower(std::string_view value);

bool IsBlank(std::string_view value);

std::string ReplaceAll(std::string_view text, std::string_view from, std::string_view to);

// Double-quoted SQL identifier with embedded quotes doubled.
std::string QuoteIdentifier(std::string_view name);

} // namespace upgrader::util
