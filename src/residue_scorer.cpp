#include "rescore/residue_scorer.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

#if defined(USE_AVX2) || defined(__SSE2__)
#include <immintrin.h>
#endif

namespace rescore {

namespace {

// Valid lanes in a block holding `lanes` real residues (lanes <= BLOCK_WIDTH)
inline uint32_t lane_mask(size_t lanes) {
    if (lanes >= 32) return 0xFFFFFFFFu;
    return (1u << lanes) - 1u;
}

#ifdef USE_AVX2
inline uint32_t block_match_mask(const char* block, char query) {
    const __m256i needle = _mm256_set1_epi8(query);
    __m256i chunk = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(block));
    return static_cast<uint32_t>(_mm256_movemask_epi8(_mm256_cmpeq_epi8(chunk, needle)));
}

inline uint32_t aligned_block_match_mask(const char* block, char query) {
    const __m256i needle = _mm256_set1_epi8(query);
    __m256i chunk = _mm256_load_si256(reinterpret_cast<const __m256i*>(block));
    return static_cast<uint32_t>(_mm256_movemask_epi8(_mm256_cmpeq_epi8(chunk, needle)));
}
#elif defined(__SSE2__)
inline uint32_t block_match_mask(const char* block, char query) {
    const __m128i needle = _mm_set1_epi8(query);
    __m128i chunk = _mm_loadu_si128(reinterpret_cast<const __m128i*>(block));
    return static_cast<uint32_t>(_mm_movemask_epi8(_mm_cmpeq_epi8(chunk, needle)));
}

inline uint32_t aligned_block_match_mask(const char* block, char query) {
    const __m128i needle = _mm_set1_epi8(query);
    __m128i chunk = _mm_load_si128(reinterpret_cast<const __m128i*>(block));
    return static_cast<uint32_t>(_mm_movemask_epi8(_mm_cmpeq_epi8(chunk, needle)));
}
#endif

}  // namespace

int find_residue(char query, const char* alphabet, size_t n) {
    size_t offset = 0;

#if defined(USE_AVX2) || defined(__SSE2__)
    // Full blocks only; the remainder is scanned below
    while (offset + BLOCK_WIDTH <= n) {
        uint32_t mask = block_match_mask(alphabet + offset, query);
        if (mask != 0) {
            return static_cast<int>(offset + __builtin_ctz(mask));
        }
        offset += BLOCK_WIDTH;
    }
#endif

    for (; offset < n; ++offset) {
        if (alphabet[offset] == query) return static_cast<int>(offset);
    }
    return -1;
}

double score_for_residue(char query,
                         const std::vector<double>& scores,
                         const std::string& alphabet) {
    if (scores.size() != alphabet.size()) {
        throw InvalidArgument("score table has " + std::to_string(scores.size()) +
                              " entries but alphabet has " +
                              std::to_string(alphabet.size()) + " residues");
    }
    int idx = find_residue(query, alphabet.data(), alphabet.size());
    return idx < 0 ? FALLBACK_SCORE : scores[static_cast<size_t>(idx)];
}

// ============================================================================
// PaddedAlphabet
// ============================================================================

PaddedAlphabet::PaddedAlphabet(const std::string& residues)
    : blocks_(std::max<size_t>(1, (residues.size() + BLOCK_WIDTH - 1) / BLOCK_WIDTH)),
      size_(residues.size()) {
    // value-initialised blocks: pad bytes are zero
    if (!residues.empty()) {
        std::memcpy(blocks_.data(), residues.data(), residues.size());
    }

    size_t tail_lanes = size_ - (blocks_.size() - 1) * BLOCK_WIDTH;
    if (size_ == 0) tail_lanes = 0;
    tail_mask_ = lane_mask(tail_lanes);
}

int PaddedAlphabet::find(char query) const {
#if defined(USE_AVX2) || defined(__SSE2__)
    const char* base = data();
    const size_t last = blocks_.size() - 1;
    for (size_t b = 0; b < blocks_.size(); ++b) {
        uint32_t mask = aligned_block_match_mask(base + b * BLOCK_WIDTH, query);
        if (b == last) mask &= tail_mask_;
        if (mask != 0) {
            return static_cast<int>(b * BLOCK_WIDTH + __builtin_ctz(mask));
        }
    }
    return -1;
#else
    return find_residue_scalar(query, data(), size_);
#endif
}

// ============================================================================
// ResidueScorer
// ============================================================================

ResidueScorer::ResidueScorer(std::string alphabet, std::vector<double> scores)
    : alphabet_(std::move(alphabet)), scores_(std::move(scores)) {
    if (scores_.size() != alphabet_.size()) {
        throw InvalidArgument("score table has " + std::to_string(scores_.size()) +
                              " entries but alphabet has " +
                              std::to_string(alphabet_.size()) + " residues");
    }
    padded_ = PaddedAlphabet(alphabet_);
}

}  // namespace rescore
