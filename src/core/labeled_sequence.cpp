#include "core/labeled_sequence.hpp"

namespace hhrkit {

std::optional<char> LabeledSequence::at(uint32_t pos) const {
    if (!is_defined(pos)) return std::nullopt;
    return residues[pos - start];
}

bool LabeledSequence::slice(uint32_t from, uint32_t to, std::string& out) const {
    if (from > to) return false;
    if (from == to) {
        out.clear();
        return true;
    }
    if (from < start || to > end()) return false;
    out = residues.substr(from - start, to - from);
    return true;
}

bool LabeledSequence::set_letter_annotation(const std::string& name, std::string track) {
    if (track.size() != length) return false;
    letter_annotations[name] = std::move(track);
    return true;
}

} // namespace hhrkit
