#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace DK::Text {

inline auto trim(std::string_view value) -> std::string {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())) != 0) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())) != 0) {
        value.remove_suffix(1);
    }
    return std::string{value};
}

inline auto toLower(std::string_view value) -> std::string {
    std::string out{value};
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return out;
}

inline auto toUpper(std::string_view value) -> std::string {
    std::string out{value};
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return out;
}

inline auto iequals(std::string_view lhs, std::string_view rhs) -> bool {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

inline auto icontains(std::string_view haystack, std::string_view needle) -> bool {
    if (needle.empty()) {
        return false;
    }
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

// Collapses runs of whitespace (including non-breaking spaces left by HTML) to one space.
inline auto collapseWhitespace(std::string_view value) -> std::string {
    std::string out;
    out.reserve(value.size());
    bool pending_space = false;
    for (std::size_t i = 0; i < value.size(); ++i) {
        auto ch = static_cast<unsigned char>(value[i]);
        if (ch == 0xC2 && i + 1 < value.size() && static_cast<unsigned char>(value[i + 1]) == 0xA0) {
            pending_space = true;
            ++i;
            continue;
        }
        if (std::isspace(ch) != 0) {
            pending_space = true;
            continue;
        }
        if (pending_space && !out.empty()) {
            out.push_back(' ');
        }
        pending_space = false;
        out.push_back(static_cast<char>(ch));
    }
    return out;
}

} // namespace DK::Text
