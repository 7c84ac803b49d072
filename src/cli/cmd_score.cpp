/**
 * @file cmd_score.cpp
 * @brief Score every protein of a FASTA/FASTQ file.
 *
 * Records are read in batches and scored in parallel; results are written
 * in input order as TSV: id, length, matched, unmatched, sum, mean.
 */

#include "subcommand.hpp"
#include "args.hpp"
#include "rescore/log_utils.hpp"
#include "rescore/score_table.hpp"
#include "rescore/sequence_io.hpp"
#include "rescore/sequence_scoring.hpp"
#include "rescore/version.h"

#include <chrono>
#include <cstdint>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace rescore {
namespace cli {

namespace {

void write_header(std::ostream& out) {
    out << "id\tlength\tmatched\tunmatched\tsum\tmean\n";
}

void write_batch(std::ostream& out,
                 const std::vector<SequenceRecord>& batch,
                 const std::vector<SequenceScore>& scores) {
    for (size_t i = 0; i < batch.size(); ++i) {
        const SequenceScore& s = scores[i];
        out << batch[i].id << '\t'
            << s.length << '\t'
            << s.matched << '\t'
            << s.unmatched << '\t'
            << std::fixed << std::setprecision(6) << s.sum << '\t'
            << s.mean << '\n';
    }
}

}  // namespace

int cmd_score(int argc, char* argv[]) {
    ScoreOptions opts;
    try {
        opts = parse_score_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.what()[0] != '\0') {
            std::cerr << e.what() << "\n";
            std::cerr << "Run 'rescore score --help' for usage.\n";
        }
        return e.exit_code();
    }

    int num_threads = 1;
#ifdef _OPENMP
    if (opts.num_threads > 0) {
        omp_set_num_threads(opts.num_threads);
    }
    num_threads = omp_get_max_threads();
#else
    if (opts.num_threads > 1 && opts.verbose) {
        std::cerr << "Warning: built without OpenMP, running single-threaded\n";
    }
#endif

    try {
        const ScoreTable table = resolve_table(opts.table);

        if (opts.verbose) {
            std::cerr << "Residue scoring v" << RESCORE_VERSION << "\n";
            std::cerr << "Input: " << opts.input_file << "\n";
            std::cerr << "Table: " << table.name() << " (" << table.size() << " residues)\n";
            std::cerr << "Threads: " << num_threads << "\n";
            std::cerr << "Block width: " << BLOCK_WIDTH << " bytes\n\n";
        }

        // Open the input first so a bad input leaves no output file behind
        auto start = std::chrono::steady_clock::now();
        SequenceReader reader(opts.input_file);

        std::ofstream file_out;
        if (!opts.output_file.empty()) {
            file_out.open(opts.output_file);
            if (!file_out) {
                std::cerr << "Error: Cannot open output file: " << opts.output_file << "\n";
                return 1;
            }
        }
        std::ostream& out = opts.output_file.empty() ? std::cout : file_out;

        write_header(out);

        std::vector<SequenceRecord> batch;
        std::vector<SequenceScore> scores;
        uint64_t total = 0;

        while (reader.read_batch(batch, opts.batch_size) > 0) {
            scores.assign(batch.size(), SequenceScore());
            const int n = static_cast<int>(batch.size());

            #pragma omp parallel for schedule(static)
            for (int i = 0; i < n; ++i) {
                scores[i] = score_sequence(batch[i].sequence, table, opts.uppercase);
            }

            write_batch(out, batch, scores);
            total += batch.size();

            if (opts.verbose) {
                auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start).count();
                std::cerr << "Scored " << log_utils::format_rate(total, "sequences", ms)
                          << "...\r" << std::flush;
            }
        }

        out.flush();
        if (!out) {
            std::cerr << "Error: write failed\n";
            return 1;
        }

        if (opts.verbose) {
            auto end = std::chrono::steady_clock::now();
            std::cerr << "Scored " << total << " sequences.          \n";
            std::cerr << "Runtime: " << log_utils::format_elapsed(start, end) << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

namespace {
    struct ScoreRegistrar {
        ScoreRegistrar() {
            SubcommandRegistry::instance().register_command(
                "score",
                "Score every protein in a FASTA/FASTQ file",
                cmd_score, 20);
        }
    };
    static ScoreRegistrar registrar;
}

}  // namespace cli
}  // namespace rescore
