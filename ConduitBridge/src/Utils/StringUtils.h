#pragma once

#include <string>
#include <string_view>

namespace Conduit::Utils {

std::string ToLowerCopy(std::string_view s);
std::string TrimCopy(std::string_view s);
bool EqualsIgnoreCase(std::string_view a, std::string_view b);

// True for names matching [A-Za-z_][A-Za-z0-9_]*
bool IsIdentifier(std::string_view name);

// True when the name is usable as a single file name (non-empty, no path
// separators or reserved characters, not "." or "..")
bool IsFileSafeName(std::string_view name);

} // namespace Conduit::Utils
