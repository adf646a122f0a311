#ifndef MUTSEL_CLI_SUBCOMMAND_HPP
#define MUTSEL_CLI_SUBCOMMAND_HPP

#include <functional>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace mutsel {
namespace cli {

using SubcommandFn = std::function<int(int argc, char* argv[])>;

struct CommandEntry {
    std::string name;
    std::string arguments;     // synopsis shown after the name in --help
    std::string description;
    SubcommandFn handler;
    int order = 99;            // position in --help, lowest first
};

// Commands kept in help order. Registering a name twice replaces the
// earlier entry.
class SubcommandRegistry {
public:
    static SubcommandRegistry& instance();

    void register_command(CommandEntry entry);

    const CommandEntry* find(const std::string& name) const;
    int run_command(const std::string& name, int argc, char* argv[]) const;

    // Registered names sharing the longest common prefix with `name`.
    std::vector<std::string> suggestions(const std::string& name) const;

    void print_help(std::ostream& out, const char* program_name) const;

    const std::vector<CommandEntry>& commands() const { return commands_; }

private:
    SubcommandRegistry() = default;
    std::vector<CommandEntry> commands_;
};

// Static instances of this register a command before main() runs.
struct SubcommandRegistrar {
    explicit SubcommandRegistrar(CommandEntry entry) {
        SubcommandRegistry::instance().register_command(std::move(entry));
    }
};

int cmd_evolve(int argc, char* argv[]);
int cmd_equilibrium(int argc, char* argv[]);
int cmd_compare(int argc, char* argv[]);
int cmd_info(int argc, char* argv[]);

}  // namespace cli
}  // namespace mutsel

#endif  // MUTSEL_CLI_SUBCOMMAND_HPP
