#include "StringUtils.h"
#include <algorithm>
#include <cctype>

namespace Conduit::Utils {

std::string ToLowerCopy(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string TrimCopy(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return std::string(s.substr(start, end - start));
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool IsIdentifier(std::string_view name) {
    if (name.empty()) {
        return false;
    }
    auto isHead = [](unsigned char c) { return std::isalpha(c) || c == '_'; };
    auto isTail = [](unsigned char c) { return std::isalnum(c) || c == '_'; };
    if (!isHead(static_cast<unsigned char>(name[0]))) {
        return false;
    }
    return std::all_of(name.begin() + 1, name.end(),
                       [&](char c) { return isTail(static_cast<unsigned char>(c)); });
}

bool IsFileSafeName(std::string_view name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    constexpr std::string_view kReserved = "/\\:*?\"<>|";
    for (char c : name) {
        if (static_cast<unsigned char>(c) < 0x20 || kReserved.find(c) != std::string_view::npos) {
            return false;
        }
    }
    return true;
}

} // namespace Conduit::Utils
