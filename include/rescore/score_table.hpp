#pragma once
/**
 * @file score_table.hpp
 * @brief Named residue score tables: built-ins and TSV loader
 *
 * TSV format (one residue per line):
 *   # comment
 *   A<TAB>0.0825
 *   C<TAB>0.0137
 */

#include "rescore/residue_scorer.hpp"

#include <string>
#include <vector>

namespace rescore {

// The 20 standard amino acids, alphabetical by one-letter code
constexpr char STANDARD_RESIDUES[] = "ACDEFGHIKLMNPQRSTVWY";
constexpr size_t NUM_STANDARD_RESIDUES = sizeof(STANDARD_RESIDUES) - 1;

class ScoreTable {
public:
    // Throws InvalidArgument on length mismatch or an empty alphabet
    ScoreTable(std::string name, std::string alphabet, std::vector<double> scores);

    double score(char residue) const { return scorer_.score(residue); }
    bool contains(char residue) const { return scorer_.contains(residue); }

    const std::string& name() const { return name_; }
    const std::string& alphabet() const { return scorer_.alphabet(); }
    const std::vector<double>& scores() const { return scorer_.scores(); }
    size_t size() const { return scorer_.size(); }
    double sum() const;

    const ResidueScorer& scorer() const { return scorer_; }

private:
    std::string name_;
    ResidueScorer scorer_;
};

// "uniform" or "background"; throws InvalidArgument for anything else
ScoreTable builtin_table(const std::string& name);

std::vector<std::string> builtin_table_names();

// Throws std::runtime_error on I/O or parse errors (message has file:line)
ScoreTable load_score_table(const std::string& path);

}  // namespace rescore
