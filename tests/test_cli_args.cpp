// Unit tests for CLI argument parsing
// Compile: g++ -std=c++20 -I../include -I../src -o test_cli_args test_cli_args.cpp \
//          ../src/cli/args.cpp ../src/score_table.cpp ../src/residue_scorer.cpp

#include "cli/args.hpp"

#include <cassert>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <vector>

class ArgvBuilder {
public:
    ArgvBuilder& add(const char* arg) {
        args_.push_back(strdup(arg));
        return *this;
    }

    int argc() const { return static_cast<int>(args_.size()); }
    char** argv() { return args_.data(); }

    ~ArgvBuilder() {
        for (char* arg : args_) {
            std::free(arg);
        }
    }

private:
    std::vector<char*> args_;
};

template <typename Parser>
static void expect_parse_exit(int expected_code, ArgvBuilder& builder, Parser parser) {
    bool threw = false;
    try {
        (void)parser(builder.argc(), builder.argv());
    } catch (const rescore::cli::ParseArgsExit& e) {
        threw = true;
        assert(e.exit_code() == expected_code);
    }
    assert(threw);
}

void test_score_basic_args() {
    std::cout << "Testing score basic args... ";
    ArgvBuilder builder;
    builder.add("score").add("-i").add("proteins.faa").add("-o").add("scores.tsv");
    auto opts = rescore::cli::parse_score_args(builder.argc(), builder.argv());
    assert(opts.input_file == "proteins.faa");
    assert(opts.output_file == "scores.tsv");
    std::cout << "PASSED\n";
}

void test_score_defaults() {
    std::cout << "Testing score defaults... ";
    unsetenv("RESCORE_THREADS");
    ArgvBuilder builder;
    builder.add("score").add("-i").add("proteins.faa");
    auto opts = rescore::cli::parse_score_args(builder.argc(), builder.argv());
    assert(opts.output_file.empty());
    assert(opts.uppercase == true);
    assert(opts.num_threads == 0);
    assert(opts.batch_size == 10000);
    assert(opts.verbose == false);
    assert(opts.table.table_name == "uniform");
    assert(opts.table.table_file.empty());
    std::cout << "PASSED\n";
}

void test_score_flags() {
    std::cout << "Testing score flags... ";
    ArgvBuilder builder;
    builder.add("score")
           .add("--input").add("p.faa.gz")
           .add("--no-uppercase")
           .add("--table").add("background")
           .add("--batch-size").add("256")
           .add("--threads").add("4")
           .add("--verbose");
    auto opts = rescore::cli::parse_score_args(builder.argc(), builder.argv());
    assert(opts.input_file == "p.faa.gz");
    assert(opts.uppercase == false);
    assert(opts.table.table_name == "background");
    assert(opts.batch_size == 256);
    assert(opts.num_threads == 4);
    assert(opts.verbose == true);
    std::cout << "PASSED\n";
}

void test_threads_from_env() {
    std::cout << "Testing RESCORE_THREADS... ";
    setenv("RESCORE_THREADS", "6", 1);
    {
        ArgvBuilder builder;
        builder.add("score").add("-i").add("p.faa");
        auto opts = rescore::cli::parse_score_args(builder.argc(), builder.argv());
        assert(opts.num_threads == 6);
    }
    {
        // explicit flag wins
        ArgvBuilder builder;
        builder.add("score").add("-i").add("p.faa").add("-t").add("2");
        auto opts = rescore::cli::parse_score_args(builder.argc(), builder.argv());
        assert(opts.num_threads == 2);
    }
    setenv("RESCORE_THREADS", "many", 1);
    assert(rescore::cli::threads_from_env() == 0);
    unsetenv("RESCORE_THREADS");
    assert(rescore::cli::threads_from_env() == 0);
    std::cout << "PASSED\n";
}

void test_lookup_args() {
    std::cout << "Testing lookup args... ";
    ArgvBuilder builder;
    builder.add("lookup").add("ACDX").add("--table-file").add("custom.tsv");
    auto opts = rescore::cli::parse_lookup_args(builder.argc(), builder.argv());
    assert(opts.residues == "ACDX");
    assert(opts.table.table_file == "custom.tsv");

    ArgvBuilder missing;
    missing.add("lookup");
    expect_parse_exit(1, missing, rescore::cli::parse_lookup_args);

    ArgvBuilder extra;
    extra.add("lookup").add("AC").add("DE");
    expect_parse_exit(1, extra, rescore::cli::parse_lookup_args);
    std::cout << "PASSED\n";
}

void test_bench_args() {
    std::cout << "Testing bench args... ";
    ArgvBuilder builder;
    builder.add("bench").add("--iterations").add("1000").add("--alphabet-size").add("33");
    auto opts = rescore::cli::parse_bench_args(builder.argc(), builder.argv());
    assert(opts.iterations == 1000);
    assert(opts.alphabet_size == 33);

    ArgvBuilder too_big;
    too_big.add("bench").add("--alphabet-size").add("256");
    expect_parse_exit(1, too_big, rescore::cli::parse_bench_args);

    ArgvBuilder negative;
    negative.add("bench").add("--iterations").add("-5");
    expect_parse_exit(1, negative, rescore::cli::parse_bench_args);
    std::cout << "PASSED\n";
}

void test_validation_errors() {
    std::cout << "Testing validation errors... ";
    {
        ArgvBuilder builder;
        builder.add("score").add("-i").add("p.faa").add("--threads").add("0");
        expect_parse_exit(1, builder, rescore::cli::parse_score_args);
    }
    {
        ArgvBuilder builder;
        builder.add("score").add("-i").add("p.faa").add("--batch-size").add("12x");
        expect_parse_exit(1, builder, rescore::cli::parse_score_args);
    }
    {
        ArgvBuilder builder;
        builder.add("score").add("-i");
        expect_parse_exit(1, builder, rescore::cli::parse_score_args);
    }
    {
        ArgvBuilder builder;
        builder.add("score");
        expect_parse_exit(1, builder, rescore::cli::parse_score_args);
    }
    {
        ArgvBuilder builder;
        builder.add("table").add("--bogus");
        expect_parse_exit(1, builder, rescore::cli::parse_table_args);
    }
    std::cout << "PASSED\n";
}

void test_controlled_exits() {
    std::cout << "Testing help controlled exits... ";
    {
        ArgvBuilder builder;
        builder.add("score").add("--help");
        expect_parse_exit(0, builder, rescore::cli::parse_score_args);
    }
    {
        ArgvBuilder builder;
        builder.add("table").add("-h");
        expect_parse_exit(0, builder, rescore::cli::parse_table_args);
    }
    std::cout << "PASSED\n";
}

void test_resolve_table() {
    std::cout << "Testing table resolution... ";
    rescore::cli::TableOptions opts;
    assert(rescore::cli::resolve_table(opts).name() == "uniform");

    opts.table_name = "background";
    assert(rescore::cli::resolve_table(opts).name() == "background");

    opts.table_name = "blosum";
    bool threw = false;
    try {
        (void)rescore::cli::resolve_table(opts);
    } catch (const rescore::InvalidArgument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== CLI Argument Parsing Tests ===\n\n";
    test_score_basic_args();
    test_score_defaults();
    test_score_flags();
    test_threads_from_env();
    test_lookup_args();
    test_bench_args();
    test_validation_errors();
    test_controlled_exits();
    test_resolve_table();
    std::cout << "\nAll tests passed!\n";
    return 0;
}
