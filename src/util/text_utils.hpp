#pragma once

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace hhrkit {

inline bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline bool is_blank(std::string_view s) {
    for (char c : s) {
        if (!is_space(c)) return false;
    }
    return true;
}

inline std::string_view rtrim(std::string_view s) {
    size_t end = s.size();
    while (end > 0 && is_space(s[end - 1])) end--;
    return s.substr(0, end);
}

inline std::string_view trim(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && is_space(s[start])) start++;
    return rtrim(s.substr(start));
}

inline bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Split on runs of whitespace; leading/trailing whitespace yields no
// empty fields.
inline std::vector<std::string> split_ws(std::string_view s) {
    std::vector<std::string> fields;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && is_space(s[i])) i++;
        size_t start = i;
        while (i < s.size() && !is_space(s[i])) i++;
        if (i > start) fields.emplace_back(s.substr(start, i - start));
    }
    return fields;
}

// Split off the first whitespace-delimited word. rest receives the
// remainder with surrounding whitespace removed.
inline bool split_first_word(std::string_view s, std::string& word, std::string& rest) {
    s = trim(s);
    if (s.empty()) return false;
    size_t i = 0;
    while (i < s.size() && !is_space(s[i])) i++;
    word.assign(s.substr(0, i));
    rest.assign(trim(s.substr(i)));
    return true;
}

// Remove every occurrence of c.
inline std::string strip_char(std::string_view s, char c) {
    std::string out;
    out.reserve(s.size());
    for (char x : s) {
        if (x != c) out += x;
    }
    return out;
}

} // namespace hhrkit
