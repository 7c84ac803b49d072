/**
 * @file cmd_lookup.cpp
 * @brief Print residue scores for residues given on the command line.
 */

#include "subcommand.hpp"
#include "args.hpp"
#include "rescore/score_table.hpp"

#include <exception>
#include <iomanip>
#include <iostream>

namespace rescore {
namespace cli {

int cmd_lookup(int argc, char* argv[]) {
    LookupOptions opts;
    try {
        opts = parse_lookup_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.what()[0] != '\0') {
            std::cerr << e.what() << "\n";
            std::cerr << "Run 'rescore lookup --help' for usage.\n";
        }
        return e.exit_code();
    }

    try {
        const ScoreTable table = resolve_table(opts.table);

        std::cout << "residue\tscore\tfound\n";
        std::cout << std::setprecision(6);
        for (char c : opts.residues) {
            std::cout << c << '\t' << table.score(c) << '\t'
                      << (table.contains(c) ? "yes" : "no") << '\n';
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

namespace {
    struct LookupRegistrar {
        LookupRegistrar() {
            SubcommandRegistry::instance().register_command(
                "lookup",
                "Score individual residues",
                cmd_lookup, 10);
        }
    };
    static LookupRegistrar registrar;
}

}  // namespace cli
}  // namespace rescore
