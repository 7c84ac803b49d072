// tests/test_score_table.cpp
//
// Built-in tables, TSV table loading and per-protein scoring.

#include "rescore/score_table.hpp"
#include "rescore/sequence_scoring.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

std::string write_temp(const std::string& content) {
    char path[] = "/tmp/rescore_table_XXXXXX";
    int fd = mkstemp(path);
    if (fd < 0) throw std::runtime_error("mkstemp failed");
    close(fd);
    std::ofstream out(path);
    out << content;
    return path;
}

// Expect load_score_table to throw a runtime_error mentioning `needle`
void expect_load_error(const std::string& content, const std::string& needle,
                       const std::string& label, int& failed) {
    const std::string path = write_temp(content);
    bool threw = false;
    try {
        (void)rescore::load_score_table(path);
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()).find(needle) != std::string::npos;
        if (!threw) std::cerr << "  (message was: " << e.what() << ")\n";
    }
    std::remove(path.c_str());
    expect(threw, label, failed);
}

int test_builtin_tables() {
    std::cout << "built-in tables\n";
    int failed = 0;

    auto uniform = rescore::builtin_table("uniform");
    expect(uniform.size() == 20, "uniform: 20 residues", failed);
    expect(uniform.alphabet() == "ACDEFGHIKLMNPQRSTVWY", "uniform: alphabet order", failed);
    expect(near(uniform.sum(), 1.0), "uniform: sums to 1", failed);
    expect(uniform.score('A') == 0.05, "uniform: A", failed);
    expect(uniform.score('X') == 0.05, "uniform: X fallback", failed);
    expect(uniform.contains('A') && !uniform.contains('X'),
           "uniform: found and not found are distinct even with equal scores", failed);

    auto bg = rescore::builtin_table("background");
    expect(bg.size() == 20, "background: 20 residues", failed);
    expect(std::abs(bg.sum() - 1.0) < 2e-3, "background: sums to ~1", failed);
    expect(bg.score('L') > bg.score('W'), "background: L more common than W", failed);
    expect(bg.score('B') == rescore::FALLBACK_SCORE, "background: B falls back", failed);

    bool threw = false;
    try {
        (void)rescore::builtin_table("pam250");
    } catch (const rescore::InvalidArgument&) {
        threw = true;
    }
    expect(threw, "unknown built-in throws InvalidArgument", failed);

    expect(rescore::builtin_table_names().size() == 2, "two built-in names", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_table_construction() {
    std::cout << "table construction\n";
    int failed = 0;

    bool threw = false;
    try {
        rescore::ScoreTable t("empty", "", {});
    } catch (const rescore::InvalidArgument&) {
        threw = true;
    }
    expect(threw, "empty table throws", failed);

    threw = false;
    try {
        rescore::ScoreTable t("short", "ACD", {0.1, 0.2});
    } catch (const rescore::InvalidArgument&) {
        threw = true;
    }
    expect(threw, "mismatched table throws", failed);

    rescore::ScoreTable t("ac", "AC", {0.9, 0.1});
    expect(t.score('C') == 0.1, "AC: C -> 0.1", failed);
    expect(t.score('Z') == 0.05, "AC: Z -> fallback", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_load_table() {
    std::cout << "TSV table loader\n";
    int failed = 0;

    const std::string path = write_temp(
        "# hydrophobicity-like weights\n"
        "\n"
        "A\t1.8\n"
        "C\t2.5\r\n"
        "D\t-3.5\n"
        "K\t -3.9 \n"
        "A\t99\n");
    auto table = rescore::load_score_table(path);
    std::remove(path.c_str());

    expect(table.size() == 5, "5 rows loaded (comment/blank skipped)", failed);
    expect(table.alphabet() == "ACDKA", "alphabet in file order", failed);
    expect(table.score('A') == 1.8, "A -> first occurrence 1.8", failed);
    expect(table.score('C') == 2.5, "CRLF line", failed);
    expect(table.score('D') == -3.5, "negative score", failed);
    expect(table.score('K') == -3.9, "whitespace around score", failed);
    expect(table.score('G') == rescore::FALLBACK_SCORE, "G absent", failed);
    expect(table.name() == path, "table named after file", failed);

    expect_load_error("A 1.0\n", ":1:", "missing tab reports line 1", failed);
    expect_load_error("A\t1.0\nAB\t2.0\n", ":2:", "two-char residue reports line 2", failed);
    expect_load_error("A\tabc\n", "invalid score", "non-numeric score", failed);
    expect_load_error("A\t1.0x\n", "invalid score", "trailing garbage", failed);
    expect_load_error("A\tnan\n", "invalid score", "nan rejected", failed);
    expect_load_error("A\t\n", "missing score", "empty score", failed);
    expect_load_error("# nothing\n", "no residues", "comment-only file", failed);

    bool threw = false;
    try {
        (void)rescore::load_score_table("/nonexistent/rescore/table.tsv");
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()).find("Failed to open file") != std::string::npos;
    }
    expect(threw, "missing file", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_sequence_scoring() {
    std::cout << "sequence scoring\n";
    int failed = 0;

    rescore::ScoreTable t("ac", "AC", {0.9, 0.1});

    auto s = rescore::score_sequence("AACZ", t);
    expect(s.length == 4, "AACZ: length", failed);
    expect(s.matched == 3 && s.unmatched == 1, "AACZ: matched/unmatched", failed);
    expect(near(s.sum, 0.9 + 0.9 + 0.1 + 0.05), "AACZ: sum", failed);
    expect(near(s.mean, s.sum / 4.0), "AACZ: mean", failed);

    auto stop = rescore::score_sequence("AC**", t);
    expect(stop.length == 2, "trailing stops ignored", failed);
    expect(near(stop.sum, 1.0), "trailing stops add nothing", failed);

    auto internal = rescore::score_sequence("A*C", t);
    expect(internal.length == 3 && internal.unmatched == 1, "internal stop scored as fallback", failed);

    auto lower = rescore::score_sequence("ac", t);
    expect(lower.matched == 2, "lowercase upcased by default", failed);
    auto exact = rescore::score_sequence("ac", t, false);
    expect(exact.matched == 0 && exact.unmatched == 2, "case-sensitive when asked", failed);

    auto empty = rescore::score_sequence("", t);
    expect(empty.length == 0 && empty.mean == 0.0, "empty sequence", failed);
    auto only_stop = rescore::score_sequence("*", t);
    expect(only_stop.length == 0 && only_stop.sum == 0.0, "stop-only sequence", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

} // anonymous namespace

int main() {
    int total = 0;
    total += test_builtin_tables();
    total += test_table_construction();
    total += test_load_table();
    total += test_sequence_scoring();

    if (total == 0) {
        std::cout << "\nAll score table tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
