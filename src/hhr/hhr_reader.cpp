#include "hhr/hhr_reader.hpp"
#include "hhr/field_parser.hpp"
#include "hhr/parse_error.hpp"
#include "hhr/summary_reader.hpp"
#include "core/config.hpp"
#include "util/text_utils.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace hhrkit {

HhrReader::HhrReader(std::istream& in) : lines_(in) {
    read_preamble();
}

HhrReader::HhrReader(std::istream& in, const Logger& logger)
    : lines_(in), logger_(&logger) {
    read_preamble();
}

void HhrReader::read_preamble() {
    metadata_ = read_header(lines_);
    rows_ = read_summary_table(lines_);
    if (logger_) {
        logger_->debug("hhr query '%s': %zu hit(s) in table",
                       metadata_.query_name.c_str(), rows_.size());
    }
}

std::optional<PairwiseAlignment> HhrReader::next() {
    if (finished_) return std::nullopt;
    if (rows_.empty()) {
        finished_ = true;
        return std::nullopt;
    }

    try {
        std::string line;
        while (lines_.next(line)) {
            auto rec = dispatch(line);
            if (rec) {
                emitted_++;
                return rec;
            }
        }

        // End of input closes the last hit.
        finished_ = true;
        if (counter_ != rows_.size()) {
            throw ParseError(ParseError::kConsistency,
                             "expected " + std::to_string(rows_.size()) +
                             " alignments, found " + std::to_string(counter_));
        }
        auto rec = finalize(0);
        emitted_++;
        return rec;
    } catch (const ParseError&) {
        finished_ = true;
        hit_.reset();
        throw;
    }
}

std::optional<PairwiseAlignment> HhrReader::dispatch(const std::string& raw) {
    std::string line(rtrim(raw));
    size_t lno = lines_.line_number();

    if (line.empty()) {
        return std::nullopt;
    }
    if (line[0] == '>') {
        start_hit(line, lno);
    } else if (line == "Done!") {
        read_trailer();
    } else if (line[0] == ' ') {
        current(lno).column_score += trim(line);
    } else if (starts_with(line, "No ")) {
        return separate(line, lno);
    } else if (starts_with(line, "Confidence")) {
        std::string key;
        std::string value;
        split_first_word(line, key, value);
        current(lno).confidence += value;
    } else if (starts_with(line, "Q ss_pred ")) {
        current(lno).query_ss_pred += split_ws(line).back();
    } else if (starts_with(line, "T ss_pred ")) {
        current(lno).target_ss_pred += split_ws(line).back();
    } else if (starts_with(line, "T ss_dssp ")) {
        current(lno).target_ss_dssp += split_ws(line).back();
    } else if (starts_with(line, "Q ") || starts_with(line, "T ")) {
        add_sequence_line(line, lno);
    } else {
        throw ParseError(ParseError::kStructural,
                         "failed to parse line '" + line.substr(0, MAX_QUOTED_CHARS) + "...'",
                         lno);
    }
    return std::nullopt;
}

std::optional<PairwiseAlignment> HhrReader::separate(const std::string& line, size_t lno) {
    auto fields = split_ws(line);
    if (fields.size() != 2) {
        throw ParseError(ParseError::kStructural,
                         "failed to parse hit separator '" + line + "'", lno);
    }
    long number = parse_long_field(fields[1], "hit number", lno);

    std::optional<PairwiseAlignment> rec;
    if (counter_ > 0) {
        rec = finalize(lno);
    }
    counter_++;
    if (number != static_cast<long>(counter_)) {
        throw ParseError(ParseError::kConsistency,
                         "hit block numbered " + std::to_string(number) +
                         ", expected " + std::to_string(counter_),
                         lno);
    }
    if (counter_ > rows_.size()) {
        throw ParseError(ParseError::kConsistency,
                         "hit block " + std::to_string(counter_) +
                         " exceeds the " + std::to_string(rows_.size()) +
                         " hits in the hit table",
                         lno);
    }
    return rec;
}

void HhrReader::start_hit(const std::string& line, size_t lno) {
    HitAccumulator acc;
    if (!split_first_word(std::string_view(line).substr(1), acc.hmm_name,
                          acc.hmm_description)) {
        throw ParseError(ParseError::kStructural, "hit header has no name", lno);
    }

    std::string scores;
    if (!lines_.next(scores)) {
        throw ParseError(ParseError::kTruncation,
                         "truncated file: end of input after hit header '" +
                         acc.hmm_name + "'");
    }
    size_t score_lno = lines_.line_number();
    for (const auto& word : split_ws(scores)) {
        auto eq = word.find('=');
        if (eq == std::string::npos || word.find('=', eq + 1) != std::string::npos) {
            throw ParseError(ParseError::kStructural,
                             "expected key=value, found '" + word + "'", score_lno);
        }
        std::string key = word.substr(0, eq);
        std::string value = word.substr(eq + 1);
        // Derivable from the coordinates
        if (key == "Aligned_cols") continue;
        if (key == "Identities") {
            while (!value.empty() && value.back() == '%') value.pop_back();
        }
        acc.annotations[key] = parse_double_field(value, key.c_str(), score_lno);
    }

    hit_ = std::move(acc);
}

void HhrReader::read_trailer() {
    std::string line;
    while (lines_.next(line)) {
        if (!is_blank(line)) {
            throw ParseError(ParseError::kStructural,
                             "found additional data after 'Done!'; corrupt file?",
                             lines_.line_number());
        }
    }
}

// Handles the six-field lines:
//   Q|T <name> <start> <seq> <end> (<total>)
// where name is "Consensus" or a sequence identifier.
void HhrReader::add_sequence_line(const std::string& line, size_t lno) {
    auto fields = split_ws(line);
    if (fields.size() != 6) {
        throw ParseError(ParseError::kStructural,
                         "failed to parse line '" + line.substr(0, MAX_QUOTED_CHARS) + "...'",
                         lno);
    }
    HitAccumulator& acc = current(lno);
    bool is_query = fields[0] == "Q";
    const std::string& name = fields[1];
    long first = parse_long_field(fields[2], "start position", lno);
    parse_long_field(fields[4], "end position", lno);
    long total = parse_total_field(fields[5], lno);
    if (first < 1) {
        throw ParseError(ParseError::kStructural,
                         "start position must be at least 1", lno);
    }
    // 1-based in the report, 0-based offsets in the record
    uint32_t start = to_position(first, "start position", lno) - 1;
    const std::string& text = fields[3];

    if (name == "Consensus") {
        if (is_query) {
            acc.set_query_length(total, lno);
            acc.query_consensus += text;
        } else {
            acc.set_target_length(total, lno);
            acc.target_consensus += text;
        }
        return;
    }

    if (is_query) {
        if (!starts_with(metadata_.query_name, name)) {
            throw ParseError(ParseError::kConsistency,
                             "query line names '" + name + "', which does not match query '" +
                             metadata_.query_name + "'",
                             lno);
        }
        acc.set_query_length(total, lno);
        if (!acc.query_start) acc.query_start = start;
        acc.query_sequence += text;
    } else {
        acc.target_name = name;
        acc.set_target_length(total, lno);
        if (!acc.target_start) acc.target_start = start;
        acc.target_sequence += text;
    }
}

HitAccumulator& HhrReader::current(size_t lno) {
    if (!hit_) {
        throw ParseError(ParseError::kStructural,
                         "alignment line outside of a hit block", lno);
    }
    return *hit_;
}

PairwiseAlignment HhrReader::finalize(size_t lno) {
    if (!hit_) {
        throw ParseError(ParseError::kStructural,
                         "hit " + std::to_string(counter_) + " has no '>' header line",
                         lno);
    }
    PairwiseAlignment aln = assemble_alignment(*hit_, metadata_, counter_, lno);
    hit_.reset();
    if (logger_) {
        logger_->debug("hit %zu: %s, %zu breakpoint(s)",
                       counter_, aln.target.id.c_str(), aln.coordinates.size());
    }
    return aln;
}

HhrFile read_hhr(std::istream& in) {
    HhrReader reader(in);
    HhrFile file;
    file.metadata = reader.metadata();
    file.summary_rows = reader.summary_rows();
    file.alignments.reserve(reader.hit_count());
    while (auto aln = reader.next()) {
        file.alignments.push_back(std::move(*aln));
    }
    return file;
}

HhrFile read_hhr(const std::string& path) {
    if (path == "-") {
        return read_hhr(std::cin);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open " + path);
    }
    return read_hhr(file);
}

} // namespace hhrkit
