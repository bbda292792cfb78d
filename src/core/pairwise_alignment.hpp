#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "core/labeled_sequence.hpp"

namespace hhrkit {

// One corner of the alignment path: offsets into the target and query.
struct Breakpoint {
    uint32_t target;
    uint32_t query;

    bool operator==(const Breakpoint& o) const {
        return target == o.target && query == o.query;
    }
    bool operator!=(const Breakpoint& o) const { return !(*this == o); }
};

// Pairwise alignment of a target against a query.
// Consecutive breakpoints delimit runs that advance both sequences
// (aligned columns), only the target, or only the query.
struct PairwiseAlignment {
    LabeledSequence target;
    LabeledSequence query;
    std::vector<Breakpoint> coordinates;
    std::map<std::string, double> annotations;
    std::map<std::string, std::string> column_annotations;
};

struct CigarElement {
    char op;      // 'M', 'I' (query only) or 'D' (target only)
    uint32_t len;

    bool operator==(const CigarElement& o) const {
        return op == o.op && len == o.len;
    }
};

struct ColumnCounts {
    uint32_t aligned = 0;       // columns with residues on both sides
    uint32_t identities = 0;    // aligned columns with equal residues
    uint32_t mismatches = 0;
    uint32_t insertions = 0;    // query-only columns
    uint32_t deletions = 0;     // target-only columns
};

// Infer breakpoints from two equal-length gapped strings, with offsets
// starting at 0. Returns an empty vector if the lengths differ.
// Columns that are gaps on both sides are skipped.
std::vector<Breakpoint> infer_coordinates(std::string_view gapped_target,
                                          std::string_view gapped_query);

// Rebuild the gapped target and query text from the coordinates.
// Returns false if the coordinates are not monotonic or reach outside
// the defined residues.
bool gapped_strings(const PairwiseAlignment& aln,
                    std::string& target_out, std::string& query_out);

// CIGAR with the target as reference; adjacent runs of the same
// operation are merged.
std::vector<CigarElement> cigar_ops(const PairwiseAlignment& aln);
std::string cigar_string(const PairwiseAlignment& aln);

// Identity/mismatch/gap column counts (residue comparison ignores case).
ColumnCounts count_columns(const PairwiseAlignment& aln);

} // namespace hhrkit
