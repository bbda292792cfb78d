#pragma once

#include <string>
#include <vector>

#include "io/line_reader.hpp"

namespace hhrkit {

// Consume the hit table that follows the run metadata: its column header
// line, then one row per hit up to a blank line or end of stream.
// Returns the raw rows; the hit count is their number.
// Throws ParseError if the column header is wrong, the stream ends before
// it, or a row's leading index is not the next number in sequence.
std::vector<std::string> read_summary_table(LineReader& lines);

} // namespace hhrkit
