#pragma once

#include <cstdint>
#include <limits>
#include <string>

#include "hhr/parse_error.hpp"

namespace hhrkit {

// Numeric field conversions for hhr text. Each throws a structural
// ParseError naming the field if the whole text is not a valid number.

inline long parse_long_field(const std::string& text, const char* what,
                             size_t line_number) {
    size_t pos = 0;
    long v = 0;
    try {
        v = std::stol(text, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos == 0 || pos != text.size()) {
        throw ParseError(ParseError::kStructural,
                         std::string("invalid ") + what + " '" + text + "'",
                         line_number);
    }
    return v;
}

// Throws a structural ParseError naming the field if v lies outside [lo, hi].
inline void check_field_range(long v, long lo, long hi, const char* what,
                              size_t line_number) {
    if (v < lo || v > hi) {
        throw ParseError(ParseError::kStructural,
                         std::string(what) + " " + std::to_string(v) + " out of range",
                         line_number);
    }
}

inline int parse_int_field(const std::string& text, const char* what,
                           size_t line_number) {
    long v = parse_long_field(text, what, line_number);
    check_field_range(v, std::numeric_limits<int>::min(),
                      std::numeric_limits<int>::max(), what, line_number);
    return static_cast<int>(v);
}

// Non-negative value that fits a sequence offset or length.
inline uint32_t to_position(long v, const char* what, size_t line_number) {
    check_field_range(v, 0, static_cast<long>(std::numeric_limits<uint32_t>::max()),
                      what, line_number);
    return static_cast<uint32_t>(v);
}

inline double parse_double_field(const std::string& text, const char* what,
                                 size_t line_number) {
    size_t pos = 0;
    double v = 0.0;
    try {
        v = std::stod(text, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos == 0 || pos != text.size()) {
        throw ParseError(ParseError::kStructural,
                         std::string("invalid ") + what + " '" + text + "'",
                         line_number);
    }
    return v;
}

// Parse a parenthesized total such as "(171)".
inline long parse_total_field(const std::string& text, size_t line_number) {
    if (text.size() < 3 || text.front() != '(' || text.back() != ')') {
        throw ParseError(ParseError::kStructural,
                         "expected parenthesized length, found '" + text + "'",
                         line_number);
    }
    return parse_long_field(text.substr(1, text.size() - 2), "sequence length",
                            line_number);
}

} // namespace hhrkit
