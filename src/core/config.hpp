#pragma once

#include <cstddef>

namespace hhrkit {

// Gap placeholder in gapped sequence and annotation text.
inline constexpr char GAP_CHAR = '-';

// Filler used to pad letter annotations outside the aligned region.
inline constexpr char FILLER_CHAR = ' ';

// Number of characters of an unparsable line quoted in error messages.
inline constexpr size_t MAX_QUOTED_CHARS = 30;

// Letter annotation names attached to parsed sequences.
inline constexpr const char* ANN_CONSENSUS = "Consensus";
inline constexpr const char* ANN_SS_PRED = "ss_pred";
inline constexpr const char* ANN_SS_DSSP = "ss_dssp";
inline constexpr const char* ANN_CONFIDENCE = "Confidence";

// Column annotation name for the per-column score track.
inline constexpr const char* ANN_COLUMN_SCORE = "column score";

} // namespace hhrkit
