#include "subcommand.hpp"
#include "args.hpp"
#include "rescore/score_table.hpp"

#include <exception>
#include <iomanip>
#include <iostream>

namespace rescore {
namespace cli {

int cmd_table(int argc, char* argv[]) {
    TableCmdOptions opts;
    try {
        opts = parse_table_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.what()[0] != '\0') {
            std::cerr << e.what() << "\n";
            std::cerr << "Run 'rescore table --help' for usage.\n";
        }
        return e.exit_code();
    }

    try {
        const ScoreTable table = resolve_table(opts.table);

        std::cout << "# table: " << table.name() << "\n";
        std::cout << "# residues: " << table.size() << "\n";
        std::cout << std::fixed << std::setprecision(6);
        std::cout << "# sum: " << table.sum() << "\n";
        std::cout << "# fallback: " << FALLBACK_SCORE << "\n";
        const auto& alphabet = table.alphabet();
        const auto& scores = table.scores();
        for (size_t i = 0; i < alphabet.size(); ++i) {
            std::cout << alphabet[i] << '\t' << scores[i] << '\n';
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

namespace {
    struct TableRegistrar {
        TableRegistrar() {
            SubcommandRegistry::instance().register_command(
                "table",
                "Print a residue score table as TSV",
                cmd_table, 30);
        }
    };
    static TableRegistrar registrar;
}

}  // namespace cli
}  // namespace rescore
