#pragma once

#include "rescore/score_table.hpp"

#include <cstddef>
#include <string>

namespace rescore {

struct SequenceScore {
    size_t length = 0;     // residues scored (trailing stops excluded)
    size_t matched = 0;    // residues present in the table
    size_t unmatched = 0;  // residues scored with FALLBACK_SCORE
    double sum = 0.0;
    double mean = 0.0;     // 0 for an empty sequence
};

// Score every residue of a protein. Trailing '*' stops are ignored.
SequenceScore score_sequence(const std::string& protein,
                             const ScoreTable& table,
                             bool uppercase = true);

}  // namespace rescore
