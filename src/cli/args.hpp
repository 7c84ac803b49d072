#ifndef RESCORE_CLI_ARGS_HPP
#define RESCORE_CLI_ARGS_HPP

#include "rescore/score_table.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace rescore {
namespace cli {

// Thrown by the parsers instead of calling exit(); code 0 for --help
class ParseArgsExit : public std::runtime_error {
public:
    explicit ParseArgsExit(int code, const std::string& message = std::string())
        : std::runtime_error(message), exit_code_(code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

// --table / --table-file, shared by every subcommand
struct TableOptions {
    std::string table_name = "uniform";
    std::string table_file;  // overrides table_name when set
};

struct LookupOptions {
    TableOptions table;
    std::string residues;
};

struct ScoreOptions {
    TableOptions table;
    std::string input_file;
    std::string output_file;  // empty = stdout
    bool uppercase = true;
    int num_threads = 0;      // 0 = RESCORE_THREADS or OpenMP default
    size_t batch_size = 10000;
    bool verbose = false;
};

struct TableCmdOptions {
    TableOptions table;
};

struct BenchOptions {
    size_t iterations = 10000000;
    size_t alphabet_size = 20;  // residues, cycled from the standard 20
    bool verbose = false;
};

LookupOptions parse_lookup_args(int argc, char* argv[]);
ScoreOptions parse_score_args(int argc, char* argv[]);
TableCmdOptions parse_table_args(int argc, char* argv[]);
BenchOptions parse_bench_args(int argc, char* argv[]);

// Thread count from RESCORE_THREADS, 0 if unset or invalid
int threads_from_env();

// Built-in or file table named by the options
ScoreTable resolve_table(const TableOptions& opts);

}  // namespace cli
}  // namespace rescore

#endif  // RESCORE_CLI_ARGS_HPP
