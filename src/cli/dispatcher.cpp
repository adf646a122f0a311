// mutsel command-line entry point
//
// Usage:
//   mutsel evolve [options]                    Evolve class frequencies
//   mutsel equilibrium [options]               Dominant eigenpair of the generator
//   mutsel compare <snapshot> <reference>      Relative error against reference arrays
//   mutsel info <snapshot>                     Describe a snapshot file

#include "subcommand.hpp"
#include "mutsel/version.h"

#include <cstring>
#include <iostream>

int main(int argc, char* argv[]) {
    auto& registry = mutsel::cli::SubcommandRegistry::instance();

    if (argc < 2) {
        registry.print_help(std::cerr, argv[0]);
        return 1;
    }

    const char* first_arg = argv[1];
    if (strcmp(first_arg, "--help") == 0 || strcmp(first_arg, "-h") == 0) {
        registry.print_help(std::cout, argv[0]);
        return 0;
    }
    if (strcmp(first_arg, "--version") == 0 || strcmp(first_arg, "-V") == 0) {
        std::cout << "mutsel " << MUTSEL_VERSION << "\n";
        return 0;
    }

    return registry.run_command(first_arg, argc - 1, argv + 1);
}
