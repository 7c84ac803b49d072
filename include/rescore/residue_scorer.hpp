#pragma once
/**
 * @file residue_scorer.hpp
 * @brief Residue -> score lookup over a small ordered alphabet
 *
 * The alphabet is scanned in fixed-width blocks: each block is compared
 * against a broadcast of the query byte and the resulting bitmask gives the
 * matching lane. The lowest set bit wins, so duplicate residues resolve to
 * their first occurrence.
 *
 * Two entry points:
 * - score_for_residue(): caller-owned alphabet, never reads past its end
 *   (full blocks only, scalar tail).
 * - ResidueScorer: owns a PaddedAlphabet, so every block is a full aligned
 *   load and the lanes past the real length are masked off.
 *
 * Block width: 16 bytes (SSE2), 32 bytes with USE_AVX2. Without SSE2 both
 * fall back to a linear scan.
 */

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace rescore {

// Score returned for residues absent from the alphabet ("average residue
// score" for a 20-letter alphabet). Fixed policy value, not derived from
// the table.
constexpr double FALLBACK_SCORE = 0.05;

#ifdef USE_AVX2
constexpr size_t BLOCK_WIDTH = 32;
#else
constexpr size_t BLOCK_WIDTH = 16;
#endif

// Caller contract violation (alphabet/score length mismatch, empty table)
class InvalidArgument : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * First index of query in alphabet[0, n), or -1.
 * Reads only alphabet[0, n).
 */
int find_residue(char query, const char* alphabet, size_t n);

// Reference linear scan, used by the benchmark and tests
inline int find_residue_scalar(char query, const char* alphabet, size_t n) {
    for (size_t i = 0; i < n; ++i) {
        if (alphabet[i] == query) return static_cast<int>(i);
    }
    return -1;
}

/**
 * Score of query under (alphabet, scores), or FALLBACK_SCORE if absent.
 * Throws InvalidArgument if scores.size() != alphabet.size().
 */
double score_for_residue(char query,
                         const std::vector<double>& scores,
                         const std::string& alphabet);

/**
 * Alphabet storage rounded up to a whole number of aligned blocks.
 * Pad bytes are zero and never reported as matches.
 */
class PaddedAlphabet {
public:
    PaddedAlphabet() : PaddedAlphabet(std::string()) {}
    explicit PaddedAlphabet(const std::string& residues);

    int find(char query) const;

    size_t size() const { return size_; }
    size_t block_count() const { return blocks_.size(); }
    size_t capacity() const { return blocks_.size() * BLOCK_WIDTH; }
    const char* data() const { return reinterpret_cast<const char*>(blocks_.data()); }

private:
    struct alignas(BLOCK_WIDTH) Block {
        char bytes[BLOCK_WIDTH];
    };
    static_assert(sizeof(Block) == BLOCK_WIDTH, "Blocks must be contiguous");

    std::vector<Block> blocks_;
    size_t size_ = 0;
    uint32_t tail_mask_ = 0;  // valid lanes of the last block
};

/**
 * Immutable alphabet + score table with a padded, block-scanned lookup.
 * Safe to share between threads.
 */
class ResidueScorer {
public:
    ResidueScorer(std::string alphabet, std::vector<double> scores);

    double score(char query) const {
        int idx = padded_.find(query);
        return idx < 0 ? FALLBACK_SCORE : scores_[static_cast<size_t>(idx)];
    }

    int index_of(char query) const { return padded_.find(query); }
    bool contains(char query) const { return padded_.find(query) >= 0; }

    size_t size() const { return alphabet_.size(); }
    const std::string& alphabet() const { return alphabet_; }
    const std::vector<double>& scores() const { return scores_; }

private:
    std::string alphabet_;
    std::vector<double> scores_;
    PaddedAlphabet padded_;
};

}  // namespace rescore
