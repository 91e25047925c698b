#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace logfetch {

inline std::string ToLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

inline bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

// `needle_lower` must already be lower case.
inline bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle_lower) {
    if (needle_lower.empty()) return true;
    if (haystack.size() < needle_lower.size()) return false;
    for (size_t i = 0; i + needle_lower.size() <= haystack.size(); ++i) {
        size_t j = 0;
        while (j < needle_lower.size() &&
               std::tolower(static_cast<unsigned char>(haystack[i + j])) == needle_lower[j]) {
            ++j;
        }
        if (j == needle_lower.size()) return true;
    }
    return false;
}

inline std::string_view Trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

// Split on '\n', dropping a trailing '\r' from each line. A trailing newline
// does not produce an empty last element.
inline std::vector<std::string> SplitLines(std::string_view text) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        out.emplace_back(line);
        start = end + 1;
    }
    return out;
}

inline std::vector<std::string_view> SplitPath(std::string_view s) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (start <= s.size()) {
        size_t end = s.find('/', start);
        if (end == std::string_view::npos) end = s.size();
        if (end > start) parts.push_back(s.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

} // namespace logfetch
