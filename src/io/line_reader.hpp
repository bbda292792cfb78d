#pragma once

#include <cstddef>
#include <istream>
#include <string>

namespace hhrkit {

// Forward-only line cursor over an input stream.
// The stream is owned by the caller and must outlive the reader.
class LineReader {
public:
    explicit LineReader(std::istream& in) : in_(in) {}

    // Read the next line into line, with a trailing '\r' removed.
    // Returns false at end of stream.
    bool next(std::string& line);

    // 1-based number of the line most recently returned by next().
    size_t line_number() const { return line_number_; }

private:
    std::istream& in_;
    size_t line_number_ = 0;
};

} // namespace hhrkit
