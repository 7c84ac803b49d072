#include "rescore/score_table.hpp"

#include <array>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace rescore {

namespace {

// Amino acid composition of UniProtKB/Swiss-Prot, in STANDARD_RESIDUES order
constexpr std::array<double, NUM_STANDARD_RESIDUES> BACKGROUND_FREQS = {
    0.0825,  // A
    0.0137,  // C
    0.0545,  // D
    0.0675,  // E
    0.0386,  // F
    0.0707,  // G
    0.0227,  // H
    0.0596,  // I
    0.0584,  // K
    0.0966,  // L
    0.0242,  // M
    0.0406,  // N
    0.0470,  // P
    0.0393,  // Q
    0.0553,  // R
    0.0656,  // S
    0.0534,  // T
    0.0687,  // V
    0.0108,  // W
    0.0292,  // Y
};

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) return std::string();
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

[[noreturn]] void parse_error(const std::string& path, size_t line_no, const std::string& what) {
    throw std::runtime_error(path + ":" + std::to_string(line_no) + ": " + what);
}

}  // namespace

ScoreTable::ScoreTable(std::string name, std::string alphabet, std::vector<double> scores)
    : name_(std::move(name)), scorer_(std::move(alphabet), std::move(scores)) {
    if (scorer_.size() == 0) {
        throw InvalidArgument("score table '" + name_ + "' has no residues");
    }
}

double ScoreTable::sum() const {
    const auto& s = scorer_.scores();
    return std::accumulate(s.begin(), s.end(), 0.0);
}

ScoreTable builtin_table(const std::string& name) {
    if (name == "uniform") {
        return ScoreTable(name, STANDARD_RESIDUES,
                          std::vector<double>(NUM_STANDARD_RESIDUES, FALLBACK_SCORE));
    }
    if (name == "background") {
        return ScoreTable(name, STANDARD_RESIDUES,
                          std::vector<double>(BACKGROUND_FREQS.begin(), BACKGROUND_FREQS.end()));
    }
    throw InvalidArgument("unknown score table '" + name + "' (expected uniform or background)");
}

std::vector<std::string> builtin_table_names() {
    return {"uniform", "background"};
}

ScoreTable load_score_table(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Failed to open file: " + path);
    }

    std::string alphabet;
    std::vector<double> scores;
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;

        size_t tab = line.find('\t');
        if (tab == std::string::npos) {
            parse_error(path, line_no, "expected <residue><TAB><score>");
        }

        const std::string residue = line.substr(0, tab);
        if (residue.size() != 1) {
            parse_error(path, line_no, "residue must be a single character, got '" + residue + "'");
        }

        const std::string field = trim(line.substr(tab + 1));
        if (field.empty()) {
            parse_error(path, line_no, "missing score");
        }

        errno = 0;
        char* end = nullptr;
        double value = std::strtod(field.c_str(), &end);
        if (end != field.c_str() + field.size() || errno == ERANGE || !std::isfinite(value)) {
            parse_error(path, line_no, "invalid score '" + field + "'");
        }

        alphabet.push_back(residue[0]);
        scores.push_back(value);
    }

    if (alphabet.empty()) {
        throw std::runtime_error(path + ": score table has no residues");
    }
    return ScoreTable(path, std::move(alphabet), std::move(scores));
}

}  // namespace rescore
