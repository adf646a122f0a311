#include "subcommand.hpp"
#include "mutsel/version.h"

#include <algorithm>
#include <iostream>
#include <utility>

namespace mutsel {
namespace cli {

namespace {

size_t common_prefix(const std::string& a, const std::string& b) {
    const size_t n = std::min(a.size(), b.size());
    size_t i = 0;
    while (i < n && a[i] == b[i]) ++i;
    return i;
}

}  // namespace

SubcommandRegistry& SubcommandRegistry::instance() {
    static SubcommandRegistry registry;
    return registry;
}

void SubcommandRegistry::register_command(CommandEntry entry) {
    commands_.erase(std::remove_if(commands_.begin(), commands_.end(),
                                   [&entry](const CommandEntry& c) { return c.name == entry.name; }),
                    commands_.end());
    // Stable among equal orders: a later command goes after earlier ones.
    const auto pos = std::upper_bound(
        commands_.begin(), commands_.end(), entry.order,
        [](int order, const CommandEntry& c) { return order < c.order; });
    commands_.insert(pos, std::move(entry));
}

const CommandEntry* SubcommandRegistry::find(const std::string& name) const {
    for (const auto& c : commands_) {
        if (c.name == name) return &c;
    }
    return nullptr;
}

std::vector<std::string> SubcommandRegistry::suggestions(const std::string& name) const {
    size_t best = 0;
    for (const auto& c : commands_) best = std::max(best, common_prefix(name, c.name));
    std::vector<std::string> out;
    if (best == 0) return out;
    for (const auto& c : commands_) {
        if (common_prefix(name, c.name) == best) out.push_back(c.name);
    }
    return out;
}

int SubcommandRegistry::run_command(const std::string& name, int argc, char* argv[]) const {
    const CommandEntry* entry = find(name);
    if (entry == nullptr) {
        std::cerr << "Unknown command: " << name << "\n";
        const auto close = suggestions(name);
        if (!close.empty()) {
            std::cerr << "Did you mean";
            for (size_t i = 0; i < close.size(); ++i) {
                std::cerr << (i == 0 ? " '" : " or '") << close[i] << "'";
            }
            std::cerr << "?\n";
        }
        std::cerr << "Run 'mutsel --help' for usage information.\n";
        return 1;
    }
    return entry->handler(argc, argv);
}

void SubcommandRegistry::print_help(std::ostream& out, const char* program_name) const {
    out << "mutsel v" << MUTSEL_VERSION << " - mutation-selection dynamics and equilibria\n\n"
        << "Usage: " << program_name << " <command> [options]\n\n"
        << "Commands:\n";

    size_t width = 0;
    for (const auto& c : commands_) {
        width = std::max(width, c.name.size() + 1 + c.arguments.size());
    }
    for (const auto& c : commands_) {
        const std::string synopsis = c.arguments.empty() ? c.name : c.name + " " + c.arguments;
        out << "  " << synopsis << std::string(width + 3 - synopsis.size(), ' ')
            << c.description << "\n";
    }

    out << "\nFor help on a specific command: " << program_name << " <command> --help\n";
}

}  // namespace cli
}  // namespace mutsel
