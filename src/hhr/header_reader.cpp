#include "hhr/header_reader.hpp"
#include "hhr/field_parser.hpp"
#include "hhr/parse_error.hpp"
#include "util/text_utils.hpp"

namespace hhrkit {

static std::pair<int, int> parse_no_of_seqs(const std::string& value,
                                            size_t line_number) {
    static const std::string kSep = " out of ";
    auto pos = value.find(kSep);
    if (pos == std::string::npos) {
        throw ParseError(ParseError::kStructural,
                         "expected 'A out of B' for No_of_seqs, found '" + value + "'",
                         line_number);
    }
    int shown = parse_int_field(std::string(trim(value.substr(0, pos))),
                                "No_of_seqs", line_number);
    int searched = parse_int_field(std::string(trim(value.substr(pos + kSep.size()))),
                                   "No_of_seqs", line_number);
    return {shown, searched};
}

RunMetadata read_header(LineReader& lines) {
    RunMetadata meta;
    bool have_query = false;
    std::string line;

    while (true) {
        if (!lines.next(line)) {
            throw ParseError(ParseError::kTruncation,
                             "truncated file: end of input inside run metadata");
        }
        if (is_blank(line)) break;

        size_t lno = lines.line_number();
        std::string key;
        std::string value;
        split_first_word(line, key, value);
        if (value.empty()) {
            throw ParseError(ParseError::kStructural,
                             "metadata key '" + key + "' has no value", lno);
        }

        if (key == "Query") {
            meta.query_name = value;
            have_query = true;
        } else if (key == "Match_columns") {
            meta.match_columns = parse_int_field(value, "Match_columns", lno);
        } else if (key == "No_of_seqs") {
            meta.no_of_seqs = parse_no_of_seqs(value, lno);
        } else if (key == "Neff") {
            meta.neff = parse_double_field(value, "Neff", lno);
        } else if (key == "Template_Neff") {
            meta.template_neff = parse_double_field(value, "Template_Neff", lno);
        } else if (key == "Searched_HMMs") {
            meta.searched_hmms = parse_int_field(value, "Searched_HMMs", lno);
        } else if (key == "Date") {
            meta.rundate = value;
        } else if (key == "Command") {
            meta.command_line = value;
        } else {
            throw ParseError(ParseError::kStructural,
                             "unknown metadata key '" + key + "'", lno);
        }
    }

    if (!have_query) {
        throw ParseError(ParseError::kStructural,
                         "run metadata has no Query line", lines.line_number());
    }
    return meta;
}

} // namespace hhrkit
