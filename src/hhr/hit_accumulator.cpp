#include "hhr/hit_accumulator.hpp"
#include "hhr/field_parser.hpp"
#include "hhr/parse_error.hpp"
#include "core/config.hpp"
#include "util/text_utils.hpp"

namespace hhrkit {

static void set_length(std::optional<uint32_t>& slot, long total,
                       const char* side, size_t line_number) {
    uint32_t len = to_position(total, (std::string(side) + " length").c_str(),
                               line_number);
    if (slot && *slot != len) {
        throw ParseError(ParseError::kConsistency,
                         std::string(side) + " length " + std::to_string(len) +
                         " disagrees with earlier block (" + std::to_string(*slot) + ")",
                         line_number);
    }
    slot = len;
}

void HitAccumulator::set_query_length(long total, size_t line_number) {
    set_length(query_length, total, "query", line_number);
}

void HitAccumulator::set_target_length(long total, size_t line_number) {
    set_length(target_length, total, "target", line_number);
}

bool pad_letter_annotation(const std::string& track, char drop,
                           uint32_t start, uint32_t length, std::string& out) {
    std::string stripped = strip_char(track, drop);
    if (static_cast<uint64_t>(start) + stripped.size() > length) return false;
    out.assign(start, FILLER_CHAR);
    out += stripped;
    out.resize(length, FILLER_CHAR);
    return true;
}

static std::string hit_label(size_t hit_number) {
    return "hit " + std::to_string(hit_number);
}

static void attach(LabeledSequence& seq, const char* name,
                   const std::string& track, char strip,
                   size_t hit_number, size_t line_number) {
    std::string padded;
    if (!pad_letter_annotation(track, strip, seq.start, seq.length, padded) ||
        !seq.set_letter_annotation(name, std::move(padded))) {
        throw ParseError(ParseError::kConsistency,
                         hit_label(hit_number) + ": " + name + " annotation of '" +
                         seq.id + "' does not fit sequence length " +
                         std::to_string(seq.length),
                         line_number);
    }
}

static LabeledSequence make_sequence(const std::string& id,
                                     const std::string& gapped,
                                     uint32_t start, uint32_t length,
                                     size_t hit_number, size_t line_number) {
    LabeledSequence seq;
    seq.id = id;
    seq.length = length;
    seq.start = start;
    seq.residues = strip_char(gapped, GAP_CHAR);
    if (static_cast<uint64_t>(start) + seq.residues.size() > length) {
        throw ParseError(ParseError::kConsistency,
                         hit_label(hit_number) + ": " +
                         std::to_string(seq.residues.size()) + " residues of '" + id +
                         "' starting at " + std::to_string(start + 1) +
                         " exceed its length " + std::to_string(length),
                         line_number);
    }
    return seq;
}

PairwiseAlignment assemble_alignment(const HitAccumulator& acc,
                                     const RunMetadata& meta,
                                     size_t hit_number,
                                     size_t line_number) {
    if (!acc.query_start || !acc.query_length) {
        throw ParseError(ParseError::kStructural,
                         hit_label(hit_number) + " has no query sequence line",
                         line_number);
    }
    if (!acc.target_start || !acc.target_length) {
        throw ParseError(ParseError::kStructural,
                         hit_label(hit_number) + " has no target sequence line",
                         line_number);
    }
    if (acc.target_sequence.size() != acc.query_sequence.size()) {
        throw ParseError(ParseError::kConsistency,
                         hit_label(hit_number) + ": aligned target length " +
                         std::to_string(acc.target_sequence.size()) +
                         " differs from aligned query length " +
                         std::to_string(acc.query_sequence.size()),
                         line_number);
    }
    if (meta.match_columns &&
        static_cast<long>(*acc.query_length) != *meta.match_columns) {
        throw ParseError(ParseError::kConsistency,
                         hit_label(hit_number) + ": query length " +
                         std::to_string(*acc.query_length) +
                         " differs from Match_columns " +
                         std::to_string(*meta.match_columns),
                         line_number);
    }

    PairwiseAlignment aln;

    aln.coordinates = infer_coordinates(acc.target_sequence, acc.query_sequence);
    for (auto& bp : aln.coordinates) {
        bp.target += *acc.target_start;
        bp.query += *acc.query_start;
    }

    aln.target = make_sequence(acc.target_name, acc.target_sequence,
                               *acc.target_start, *acc.target_length,
                               hit_number, line_number);
    aln.target.annotations["hmm_name"] = acc.hmm_name;
    aln.target.annotations["hmm_description"] = acc.hmm_description;
    attach(aln.target, ANN_CONSENSUS, acc.target_consensus, GAP_CHAR, hit_number, line_number);
    attach(aln.target, ANN_SS_DSSP, acc.target_ss_dssp, GAP_CHAR, hit_number, line_number);
    attach(aln.target, ANN_SS_PRED, acc.target_ss_pred, GAP_CHAR, hit_number, line_number);
    // Confidence has blanks, not gap characters, at unscored columns
    attach(aln.target, ANN_CONFIDENCE, acc.confidence, ' ', hit_number, line_number);

    aln.query = make_sequence(meta.query_name, acc.query_sequence,
                              *acc.query_start, *acc.query_length,
                              hit_number, line_number);
    attach(aln.query, ANN_CONSENSUS, acc.query_consensus, GAP_CHAR, hit_number, line_number);
    attach(aln.query, ANN_SS_PRED, acc.query_ss_pred, GAP_CHAR, hit_number, line_number);

    aln.annotations = acc.annotations;
    aln.column_annotations[ANN_COLUMN_SCORE] = acc.column_score;
    return aln;
}

} // namespace hhrkit
