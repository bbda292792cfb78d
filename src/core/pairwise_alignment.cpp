#include "core/pairwise_alignment.hpp"
#include "core/config.hpp"

#include <cctype>

namespace hhrkit {

std::vector<Breakpoint> infer_coordinates(std::string_view gapped_target,
                                          std::string_view gapped_query) {
    std::vector<Breakpoint> coords;
    if (gapped_target.size() != gapped_query.size()) return coords;

    uint32_t t = 0;
    uint32_t q = 0;
    int prev_state = -1;
    coords.push_back({0, 0});

    for (size_t i = 0; i < gapped_target.size(); i++) {
        bool has_t = gapped_target[i] != GAP_CHAR;
        bool has_q = gapped_query[i] != GAP_CHAR;
        if (!has_t && !has_q) continue;

        // bit 0: target advances, bit 1: query advances
        int state = (has_t ? 1 : 0) | (has_q ? 2 : 0);
        if (prev_state != -1 && state != prev_state) {
            coords.push_back({t, q});
        }
        prev_state = state;
        if (has_t) t++;
        if (has_q) q++;
    }

    coords.push_back({t, q});
    return coords;
}

bool gapped_strings(const PairwiseAlignment& aln,
                    std::string& target_out, std::string& query_out) {
    target_out.clear();
    query_out.clear();

    const auto& coords = aln.coordinates;
    std::string t_part;
    std::string q_part;
    for (size_t i = 1; i < coords.size(); i++) {
        const Breakpoint& a = coords[i - 1];
        const Breakpoint& b = coords[i];
        if (b.target < a.target || b.query < a.query) return false;

        uint32_t dt = b.target - a.target;
        uint32_t dq = b.query - a.query;
        if (dt > 0 && dq > 0 && dt != dq) return false;

        if (!aln.target.slice(a.target, b.target, t_part)) return false;
        if (!aln.query.slice(a.query, b.query, q_part)) return false;

        if (dt > 0 && dq == 0) q_part.assign(dt, GAP_CHAR);
        if (dq > 0 && dt == 0) t_part.assign(dq, GAP_CHAR);

        target_out += t_part;
        query_out += q_part;
    }
    return true;
}

std::vector<CigarElement> cigar_ops(const PairwiseAlignment& aln) {
    std::vector<CigarElement> ops;
    const auto& coords = aln.coordinates;
    for (size_t i = 1; i < coords.size(); i++) {
        uint32_t dt = coords[i].target - coords[i - 1].target;
        uint32_t dq = coords[i].query - coords[i - 1].query;

        char op;
        uint32_t len;
        if (dt > 0 && dq > 0) {
            op = 'M';
            len = dt;
        } else if (dq > 0) {
            op = 'I';
            len = dq;
        } else if (dt > 0) {
            op = 'D';
            len = dt;
        } else {
            continue;
        }

        if (!ops.empty() && ops.back().op == op) {
            ops.back().len += len;
        } else {
            ops.push_back({op, len});
        }
    }
    return ops;
}

std::string cigar_string(const PairwiseAlignment& aln) {
    std::string s;
    for (const auto& e : cigar_ops(aln)) {
        s += std::to_string(e.len);
        s += e.op;
    }
    return s;
}

ColumnCounts count_columns(const PairwiseAlignment& aln) {
    ColumnCounts counts;
    const auto& coords = aln.coordinates;
    for (size_t i = 1; i < coords.size(); i++) {
        const Breakpoint& a = coords[i - 1];
        const Breakpoint& b = coords[i];
        uint32_t dt = b.target - a.target;
        uint32_t dq = b.query - a.query;

        if (dt > 0 && dq > 0) {
            for (uint32_t k = 0; k < dt; k++) {
                auto tc = aln.target.at(a.target + k);
                auto qc = aln.query.at(a.query + k);
                counts.aligned++;
                if (tc && qc &&
                    std::toupper(static_cast<unsigned char>(*tc)) ==
                    std::toupper(static_cast<unsigned char>(*qc))) {
                    counts.identities++;
                } else {
                    counts.mismatches++;
                }
            }
        } else if (dq > 0) {
            counts.insertions += dq;
        } else {
            counts.deletions += dt;
        }
    }
    return counts;
}

} // namespace hhrkit
