#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace hhrkit {

// Fatal error raised while reading an hhr report. The reader that threw
// it yields no further records.
class ParseError : public std::runtime_error {
public:
    enum Kind {
        kStructural = 0,   // unexpected line shape, unknown tag or key
        kConsistency = 1,  // values that contradict each other
        kTruncation = 2,   // stream ended inside a required section
    };

    // line_number is 1-based; 0 when the error is detected at end of stream.
    ParseError(Kind kind, const std::string& message, size_t line_number = 0)
        : std::runtime_error(format(message, line_number)),
          kind_(kind), line_number_(line_number) {}

    Kind kind() const { return kind_; }
    size_t line_number() const { return line_number_; }

    static const char* kind_name(Kind kind) {
        switch (kind) {
            case kStructural:  return "structural";
            case kConsistency: return "consistency";
            case kTruncation:  return "truncation";
        }
        return "unknown";
    }

private:
    Kind kind_;
    size_t line_number_;

    static std::string format(const std::string& message, size_t line_number) {
        if (line_number == 0) return message;
        return "line " + std::to_string(line_number) + ": " + message;
    }
};

} // namespace hhrkit
