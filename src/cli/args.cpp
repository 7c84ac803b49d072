#include "args.hpp"
#include "rescore/version.h"

#include <cstdlib>
#include <iostream>
#include <string>

namespace rescore {
namespace cli {

namespace {

void print_table_options() {
    std::cout << "Table options:\n";
    std::cout << "  --table <name>           Built-in table: uniform, background (default: uniform)\n";
    std::cout << "  --table-file <file>      TSV table, one <residue><TAB><score> per line\n";
}

void print_lookup_usage(const char* prog) {
    std::cout << "Usage: " << prog << " lookup <residues> [options]\n\n";
    std::cout << "Print the score of each residue in <residues>.\n\n";
    print_table_options();
    std::cout << "  -h, --help               Show this help message\n";
}

void print_score_usage(const char* prog) {
    std::cout << "Usage: " << prog << " score -i <proteins.faa[.gz]> [options]\n\n";
    std::cout << "Score every protein in a FASTA/FASTQ file.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -i, --input <file>       Input protein FASTA (or .gz)\n";
    std::cout << "  -o, --output <file>      Output TSV (default: stdout)\n";
    std::cout << "  --no-uppercase           Score residues case-sensitively\n";
    std::cout << "  --batch-size <int>       Records per parallel batch (default: 10000)\n";
    std::cout << "  -t, --threads <int>      Number of threads (default: $RESCORE_THREADS or auto)\n";
    std::cout << "  -v, --verbose            Verbose output\n";
    print_table_options();
    std::cout << "  -h, --help               Show this help message\n";
}

void print_table_usage(const char* prog) {
    std::cout << "Usage: " << prog << " table [options]\n\n";
    std::cout << "Print a score table as TSV.\n\n";
    print_table_options();
    std::cout << "  -h, --help               Show this help message\n";
}

void print_bench_usage(const char* prog) {
    std::cout << "Usage: " << prog << " bench [options]\n\n";
    std::cout << "Time the block-compare lookup against a linear scan.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --iterations <int>       Lookups per variant (default: 10000000)\n";
    std::cout << "  --alphabet-size <int>    Alphabet length, 1-255 (default: 20)\n";
    std::cout << "  -v, --verbose            Verbose output\n";
    std::cout << "  -h, --help               Show this help message\n";
}

size_t parse_size(const std::string& flag, const std::string& value) {
    try {
        size_t idx = 0;
        if (!value.empty() && value[0] == '-') throw std::invalid_argument(value);
        size_t parsed = std::stoull(value, &idx);
        if (idx != value.size()) {
            throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
        }
        return parsed;
    } catch (const ParseArgsExit&) {
        throw;
    } catch (const std::exception&) {
        throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
    }
}

int parse_int(const std::string& flag, const std::string& value) {
    try {
        size_t idx = 0;
        int parsed = std::stoi(value, &idx);
        if (idx != value.size()) {
            throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
        }
        return parsed;
    } catch (const ParseArgsExit&) {
        throw;
    } catch (const std::exception&) {
        throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
    }
}

// Consumes --table/--table-file; returns false if arg is not a table option
bool parse_table_option(const std::string& arg, int& i, int argc, char* argv[],
                        TableOptions& table) {
    auto require_value = [&]() -> std::string {
        if (i + 1 >= argc) {
            throw ParseArgsExit(1, "Error: Missing value for " + arg);
        }
        return argv[++i];
    };

    if (arg == "--table") {
        table.table_name = require_value();
        return true;
    }
    if (arg == "--table-file") {
        table.table_file = require_value();
        return true;
    }
    return false;
}

}  // namespace

int threads_from_env() {
    const char* env = std::getenv("RESCORE_THREADS");
    if (!env) return 0;
    char* end = nullptr;
    long n = std::strtol(env, &end, 10);
    if (end == env || *end != '\0' || n < 1 || n > 4096) return 0;
    return static_cast<int>(n);
}

ScoreTable resolve_table(const TableOptions& opts) {
    if (!opts.table_file.empty()) {
        return load_score_table(opts.table_file);
    }
    return builtin_table(opts.table_name);
}

LookupOptions parse_lookup_args(int argc, char* argv[]) {
    LookupOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_lookup_usage("rescore");
            throw ParseArgsExit(0);
        } else if (parse_table_option(arg, i, argc, argv, opts.table)) {
            continue;
        } else if (!arg.empty() && arg[0] == '-' && arg.size() > 1) {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        } else if (opts.residues.empty()) {
            opts.residues = arg;
        } else {
            throw ParseArgsExit(1, "Error: Unexpected argument: " + arg);
        }
    }

    if (opts.residues.empty()) {
        throw ParseArgsExit(1, "Error: No residues specified");
    }
    return opts;
}

ScoreOptions parse_score_args(int argc, char* argv[]) {
    ScoreOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ParseArgsExit(1, "Error: Missing value for " + flag);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            print_score_usage("rescore");
            throw ParseArgsExit(0);
        } else if (parse_table_option(arg, i, argc, argv, opts.table)) {
            continue;
        } else if (arg == "-i" || arg == "--input") {
            opts.input_file = require_value(arg);
        } else if (arg == "-o" || arg == "--output") {
            opts.output_file = require_value(arg);
        } else if (arg == "--no-uppercase") {
            opts.uppercase = false;
        } else if (arg == "--batch-size") {
            opts.batch_size = parse_size(arg, require_value(arg));
            if (opts.batch_size < 1) {
                throw ParseArgsExit(1, "Error: --batch-size must be >= 1");
            }
        } else if (arg == "-t" || arg == "--threads") {
            opts.num_threads = parse_int(arg, require_value(arg));
            if (opts.num_threads < 1) {
                throw ParseArgsExit(1, "Error: --threads must be >= 1");
            }
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        }
    }

    if (opts.input_file.empty()) {
        throw ParseArgsExit(1, "Error: No input file specified");
    }
    if (opts.num_threads == 0) {
        opts.num_threads = threads_from_env();
    }
    return opts;
}

TableCmdOptions parse_table_args(int argc, char* argv[]) {
    TableCmdOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_table_usage("rescore");
            throw ParseArgsExit(0);
        } else if (parse_table_option(arg, i, argc, argv, opts.table)) {
            continue;
        } else {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        }
    }
    return opts;
}

BenchOptions parse_bench_args(int argc, char* argv[]) {
    BenchOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ParseArgsExit(1, "Error: Missing value for " + flag);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            print_bench_usage("rescore");
            throw ParseArgsExit(0);
        } else if (arg == "--iterations") {
            opts.iterations = parse_size(arg, require_value(arg));
            if (opts.iterations < 1) {
                throw ParseArgsExit(1, "Error: --iterations must be >= 1");
            }
        } else if (arg == "--alphabet-size") {
            opts.alphabet_size = parse_size(arg, require_value(arg));
            if (opts.alphabet_size < 1 || opts.alphabet_size > 255) {
                throw ParseArgsExit(1, "Error: --alphabet-size must be in [1, 255]");
            }
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        }
    }
    return opts;
}

}  // namespace cli
}  // namespace rescore
