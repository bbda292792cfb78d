#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "core/pairwise_alignment.hpp"
#include "hhr/header_reader.hpp"

namespace hhrkit {

// Text of one hit collected across all of its alignment blocks.
// Tracks grow block by block; start offsets come from the first block.
struct HitAccumulator {
    std::string hmm_name;
    std::string hmm_description;
    std::map<std::string, double> annotations;

    std::string query_sequence;     // gapped
    std::string query_consensus;    // gapped
    std::string query_ss_pred;

    std::string target_name;
    std::string target_sequence;    // gapped
    std::string target_consensus;   // gapped
    std::string target_ss_pred;
    std::string target_ss_dssp;

    std::string confidence;
    std::string column_score;

    std::optional<uint32_t> query_start;
    std::optional<uint32_t> target_start;
    std::optional<uint32_t> query_length;
    std::optional<uint32_t> target_length;

    // Record the declared total length of a query or target line.
    // Throws a consistency ParseError if it differs from an earlier block.
    void set_query_length(long total, size_t line_number);
    void set_target_length(long total, size_t line_number);
};

// Build the alignment record for a completed hit.
// hit_number is 1-based and line_number locates the line that closed the
// hit (0 at end of stream); both only feed error messages.
// Throws ParseError if the gapped tracks disagree in length, a sequence
// line is missing, residues or annotations overrun the declared length,
// or the query length contradicts Match_columns.
PairwiseAlignment assemble_alignment(const HitAccumulator& acc,
                                     const RunMetadata& meta,
                                     size_t hit_number,
                                     size_t line_number);

// Pad an annotation track to length: remove every drop character, left-pad with
// filler up to start and right-pad up to length. Returns false if the
// stripped track does not fit.
bool pad_letter_annotation(const std::string& track, char drop,
                           uint32_t start, uint32_t length, std::string& out);

} // namespace hhrkit
