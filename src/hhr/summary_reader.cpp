#include "hhr/summary_reader.hpp"
#include "hhr/field_parser.hpp"
#include "hhr/parse_error.hpp"
#include "util/text_utils.hpp"

namespace hhrkit {

static const std::vector<std::string> kTableColumns = {
    "No", "Hit", "Prob", "E-value", "P-value", "Score",
    "SS", "Cols", "Query", "HMM", "Template", "HMM",
};

std::vector<std::string> read_summary_table(LineReader& lines) {
    std::string line;
    if (!lines.next(line)) {
        throw ParseError(ParseError::kTruncation,
                         "truncated file: end of input before the hit table");
    }
    if (split_ws(line) != kTableColumns) {
        throw ParseError(ParseError::kStructural,
                         "malformed hit table header '" +
                         std::string(trim(line)) + "'",
                         lines.line_number());
    }

    std::vector<std::string> rows;
    while (lines.next(line)) {
        if (is_blank(line)) break;

        size_t lno = lines.line_number();
        std::string word;
        std::string rest;
        split_first_word(line, word, rest);
        long index = parse_long_field(word, "hit table index", lno);
        long expected = static_cast<long>(rows.size()) + 1;
        if (index != expected) {
            throw ParseError(ParseError::kConsistency,
                             "hit table row numbered " + std::to_string(index) +
                             ", expected " + std::to_string(expected),
                             lno);
        }
        rows.emplace_back(trim(line));
    }
    return rows;
}

} // namespace hhrkit
