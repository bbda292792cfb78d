#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace hhrkit {

// A sequence of known total length of which only the region
// [start, start + residues.size()) is defined. Letter annotations
// always span the full declared length.
struct LabeledSequence {
    std::string id;
    uint32_t length = 0;
    uint32_t start = 0;
    std::string residues;

    std::map<std::string, std::string> letter_annotations;
    std::map<std::string, std::string> annotations;

    uint32_t end() const { return start + static_cast<uint32_t>(residues.size()); }

    bool is_defined(uint32_t pos) const { return pos >= start && pos < end(); }

    // Residue at pos, or nullopt outside the defined region.
    std::optional<char> at(uint32_t pos) const;

    // Defined residues in [from, to). Returns false if any offset in the
    // range is undefined.
    bool slice(uint32_t from, uint32_t to, std::string& out) const;

    // Attach a per-letter track. Returns false and leaves the sequence
    // unchanged if the track length differs from length.
    bool set_letter_annotation(const std::string& name, std::string track);
};

} // namespace hhrkit
