#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "core/pairwise_alignment.hpp"
#include "hhr/header_reader.hpp"
#include "hhr/hit_accumulator.hpp"
#include "io/line_reader.hpp"
#include "util/logger.hpp"

namespace hhrkit {

// Pull-based reader for hhr reports written by HHsearch / HHblits.
//
// The constructor consumes the run metadata and the hit table. Each call
// to next() then reads just far enough to complete one hit and returns
// its alignment; after the last hit it returns nullopt. Any malformed
// input throws ParseError, after which the reader is finished.
//
// The stream and the optional logger are owned by the caller and must
// outlive the reader; a temporary logger is rejected at compile time.
class HhrReader {
public:
    explicit HhrReader(std::istream& in);
    HhrReader(std::istream& in, const Logger& logger);
    HhrReader(std::istream& in, const Logger&& logger) = delete;

    HhrReader(const HhrReader&) = delete;
    HhrReader& operator=(const HhrReader&) = delete;

    const RunMetadata& metadata() const { return metadata_; }

    // Number of hits listed in the hit table.
    size_t hit_count() const { return rows_.size(); }
    const std::vector<std::string>& summary_rows() const { return rows_; }

    size_t hits_emitted() const { return emitted_; }
    bool finished() const { return finished_; }

    std::optional<PairwiseAlignment> next();

private:
    void read_preamble();
    std::optional<PairwiseAlignment> dispatch(const std::string& raw);
    std::optional<PairwiseAlignment> separate(const std::string& line, size_t lno);
    void start_hit(const std::string& line, size_t lno);
    void read_trailer();
    void add_sequence_line(const std::string& line, size_t lno);
    HitAccumulator& current(size_t lno);
    PairwiseAlignment finalize(size_t lno);

    LineReader lines_;
    const Logger* logger_ = nullptr;
    RunMetadata metadata_;
    std::vector<std::string> rows_;

    std::optional<HitAccumulator> hit_;  // empty while awaiting a hit
    size_t counter_ = 0;                 // "No" separators seen
    size_t emitted_ = 0;
    bool finished_ = false;
};

struct HhrFile {
    RunMetadata metadata;
    std::vector<std::string> summary_rows;
    std::vector<PairwiseAlignment> alignments;
};

// Read a whole report. Throws ParseError on malformed input.
HhrFile read_hhr(std::istream& in);

// Read a whole report from a file, "-" for stdin.
// Throws std::runtime_error if the file cannot be opened.
HhrFile read_hhr(const std::string& path);

} // namespace hhrkit
