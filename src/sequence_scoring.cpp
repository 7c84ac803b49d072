#include "rescore/sequence_scoring.hpp"

namespace rescore {

SequenceScore score_sequence(const std::string& protein,
                             const ScoreTable& table,
                             bool uppercase) {
    SequenceScore result;

    size_t end = protein.size();
    while (end > 0 && protein[end - 1] == '*') --end;

    const ResidueScorer& scorer = table.scorer();
    for (size_t i = 0; i < end; ++i) {
        char c = protein[i];
        if (uppercase && c >= 'a' && c <= 'z') c -= 32;

        int idx = scorer.index_of(c);
        if (idx >= 0) {
            result.sum += scorer.scores()[static_cast<size_t>(idx)];
            ++result.matched;
        } else {
            result.sum += FALLBACK_SCORE;
            ++result.unmatched;
        }
    }

    result.length = end;
    if (result.length > 0) {
        result.mean = result.sum / static_cast<double>(result.length);
    }
    return result;
}

}  // namespace rescore
