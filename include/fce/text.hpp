#pragma once

/// @file include/fce/text.hpp
/// @brief Small ASCII string helpers shared by the unit, ordering and
///        normalizer modules.
///
/// Nutrient and unit names arrive from heterogeneous sources with stray
/// whitespace and arbitrary case; every comparison in the engine goes through
/// these helpers. Case folding is ASCII-only: non-ASCII bytes (µ, μ, æ) are
/// left as-is and matched explicitly where it matters.

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace fce::text {

/// Strip leading and trailing whitespace.
[[nodiscard]] inline std::string trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n\f\v");
    return std::string(s.substr(first, last - first + 1));
}

/// ASCII lower-case copy.
[[nodiscard]] inline std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

/// `to_lower(trim(s))`, the form every lookup table is keyed by.
[[nodiscard]] inline std::string fold(std::string_view s) {
    return to_lower(trim(s));
}

[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b) {
    return fold(a) == fold(b);
}

[[nodiscard]] inline bool is_blank(std::string_view s) {
    return s.find_first_not_of(" \t\r\n\f\v") == std::string_view::npos;
}

[[nodiscard]] inline bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

/// Split one CSV line on commas. A field wrapped in double quotes may hold
/// commas, and `""` inside it is a literal quote. An unterminated quote runs
/// to the end of the line.
[[nodiscard]] inline std::vector<std::string> split_csv_line(std::string_view s) {
    std::vector<std::string> out;
    std::string field;
    bool quoted = false;
    for (std::size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (quoted) {
            if (c == '"' && i + 1 < s.size() && s[i + 1] == '"') {
                field += '"';
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                field += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            out.push_back(std::move(field));
            field.clear();
        } else {
            field += c;
        }
    }
    out.push_back(std::move(field));
    return out;
}

}  // namespace fce::text
