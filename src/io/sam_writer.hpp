#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "hhr/hhr_reader.hpp"
#include "io/alignment_writer.hpp"

namespace hhrkit {

// Write alignments in SAM format with the target as reference and the
// query as read. output_path: file path, or "-" for stdout.
// Returns false if the file cannot be written.
bool write_alignments_sam(const std::string& output_path,
                          const std::vector<HhrFile>& reports);

// Write alignments in BAM format.
// output_path: file path (must not be empty or "-").
bool write_alignments_bam(const std::string& output_path,
                          const std::vector<HhrFile>& reports);

// htslib CIGAR for one alignment: hard clips for the query flanks outside
// the aligned region, then M/I/D runs from the coordinates.
std::vector<uint32_t> alignment_to_htslib_cigar(const PairwiseAlignment& aln);

// SAM QNAME/RNAME form of an identifier: its first whitespace-delimited word.
std::string sam_name(const std::string& id);

// Write alignments in the requested format, dispatching to the matching
// writer. An empty output_path means stdout. Returns true on success.
bool write_all_alignments(const std::string& output_path,
                          const std::vector<HhrFile>& reports,
                          OutputFormat fmt);

} // namespace hhrkit
