#pragma once

#include <ostream>
#include <string>
#include <vector>

#include <json/json.h>

#include "core/pairwise_alignment.hpp"
#include "hhr/hhr_reader.hpp"

namespace hhrkit {

enum class OutputFormat { kTab, kJson, kSam, kBam };

// Parse an output format string ("tab", "json", "sam", "bam").
// Returns true on success. On failure, out is unchanged and error_msg is set.
bool parse_output_format(const std::string& str, OutputFormat& out,
                         std::string& error_msg);

// Tab-delimited output: a "# " column header line, then one row per
// alignment of every report, in order.
void write_alignments_tab(std::ostream& out, const std::vector<HhrFile>& reports);

// One tab-delimited row (no header, with trailing newline).
void write_alignment_row(std::ostream& out, const PairwiseAlignment& aln);

// JSON renderings.
Json::Value metadata_to_json(const RunMetadata& meta);
Json::Value alignment_to_json(const PairwiseAlignment& aln);

// {"reports": [{"metadata": ..., "hit_count": N, "alignments": [...]}, ...]}
void write_alignments_json(std::ostream& out, const std::vector<HhrFile>& reports);

} // namespace hhrkit
