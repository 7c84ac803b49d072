#ifndef RESCORE_CLI_SUBCOMMAND_HPP
#define RESCORE_CLI_SUBCOMMAND_HPP

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rescore {
namespace cli {

// Subcommand handler function type
using SubcommandFn = std::function<int(int argc, char* argv[])>;

// Registry of available subcommands
class SubcommandRegistry {
public:
    struct CommandEntry {
        std::string name;
        std::string description;
        int order;
    };

    static SubcommandRegistry& instance();

    void register_command(const std::string& name,
                          const std::string& description,
                          SubcommandFn fn,
                          int order = 99);

    bool has_command(const std::string& name) const;
    int run_command(const std::string& name, int argc, char* argv[]) const;

    void print_help(const char* program_name) const;

private:
    SubcommandRegistry() = default;
    std::unordered_map<std::string, SubcommandFn> handlers_;
    std::vector<CommandEntry> command_list_;
};

// Subcommand entry points
int cmd_lookup(int argc, char* argv[]);
int cmd_score(int argc, char* argv[]);
int cmd_table(int argc, char* argv[]);
int cmd_bench(int argc, char* argv[]);

}  // namespace cli
}  // namespace rescore

#endif  // RESCORE_CLI_SUBCOMMAND_HPP
