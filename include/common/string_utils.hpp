// common/string_utils.hpp
#ifndef SCHEMA_MIGRATOR_STRING_UTILS_HPP
#define SCHEMA_MIGRATOR_STRING_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>
#include <sstream>

namespace common::utils {

// Splits a string by delimiter, optionally skipping empty parts
inline std::vector<std::string> split_string(
    const std::string& str,
    char delimiter,
    bool skip_empty = false) {

    std::vector<std::string> parts;
    std::stringstream ss(str);
    std::string part;

    while (std::getline(ss, part, delimiter)) {
        if (!skip_empty || !part.empty()) {
            parts.push_back(std::move(part));
        }
    }

    return parts;
}

// Splits on any run of whitespace
inline std::vector<std::string> split_whitespace(const std::string& str) {
    std::vector<std::string> tokens;
    std::istringstream ss(str);
    std::string token;
    while (ss >> token) {
        tokens.push_back(std::move(token));
    }
    return tokens;
}

inline std::string join(const std::vector<std::string>& parts,
                        const std::string& delimiter) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += delimiter;
        out += parts[i];
    }
    return out;
}

inline std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

inline std::string to_upper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

inline std::string trim(const std::string& str) {
    const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(str.begin(), str.end(), is_space);
    auto end = std::find_if_not(str.rbegin(), str.rend(), is_space).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

// Removes trailing occurrences of ch
inline std::string trim_right(std::string str, char ch) {
    while (!str.empty() && str.back() == ch) {
        str.pop_back();
    }
    return str;
}

inline std::string remove_whitespace(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    for (unsigned char c : str) {
        if (!std::isspace(c)) out += static_cast<char>(c);
    }
    return out;
}

inline bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() && to_lower(a) == to_lower(b);
}

inline bool contains_ci(const std::string& haystack, const std::string& needle) {
    return to_upper(haystack).find(to_upper(needle)) != std::string::npos;
}

inline size_t count_char(const std::string& str, char ch) {
    return static_cast<size_t>(std::count(str.begin(), str.end(), ch));
}

inline bool ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace common::utils

#endif // SCHEMA_MIGRATOR_STRING_UTILS_HPP
