#pragma once

#include <optional>
#include <string>
#include <utility>

#include "io/line_reader.hpp"

namespace hhrkit {

// Run metadata from the key/value preamble of an hhr report.
struct RunMetadata {
    std::string query_name;                          // Query
    std::optional<int> match_columns;                // Match_columns
    std::optional<std::pair<int, int>> no_of_seqs;   // No_of_seqs A out of B
    std::optional<double> neff;                      // Neff
    std::optional<double> template_neff;             // Template_Neff
    std::optional<int> searched_hmms;                // Searched_HMMs
    std::optional<std::string> rundate;              // Date
    std::optional<std::string> command_line;         // Command
};

// Consume header lines up to and including the first blank line.
// Throws ParseError on an unknown key, a malformed value, a missing
// Query line, or end of stream before the blank line.
RunMetadata read_header(LineReader& lines);

} // namespace hhrkit
