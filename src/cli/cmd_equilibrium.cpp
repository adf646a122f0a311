// mutsel equilibrium: dominant eigenpair of the generator

#include "subcommand.hpp"
#include "args.hpp"
#include "model.hpp"
#include "mutsel/equilibrium.hpp"
#include "mutsel/errors.hpp"
#include "mutsel/log_utils.hpp"
#include "mutsel/statistics.hpp"

#include <chrono>
#include <fstream>
#include <iostream>

namespace mutsel {
namespace cli {

namespace {

template <typename Real>
void write_equilibrium_table(const std::string& path, const Rates<Real>& rates,
                             const EigenPair<Real>& eq) {
    std::ofstream out(path);
    if (!out) throw InvalidArgument("Cannot open output file: " + path);
    out << "class\tgrowth\tfrequency\n";
    for (size_t i = 0; i < eq.vector.size(); ++i) {
        out << i << "\t" << to_string(rates.growth[i]) << "\t" << to_string(eq.vector[i]) << "\n";
    }
    if (!out) throw InvalidArgument("Failed writing " + path);
}

template <typename Real>
int run_equilibrium(const EquilibriumOptions& opts) {
    const auto t_start = std::chrono::steady_clock::now();
    Model<Real> model(opts.model);
    const EigenPair<Real> eq = equilibrium(model.generator(), opts.solver);
    const auto mv = mean_and_variance(eq.vector, model.rates().growth);

    std::cout << "eigenvalue\t" << to_string(eq.value) << "\n";
    std::cout << "eigen_error\t" << eq.error << "\n";
    std::cout << "converged\t" << (eq.converged ? "yes" : "no") << "\n";
    std::cout << "iterations\t" << eq.iterations << "\n";
    std::cout << "bootstrapped\t" << (eq.bootstrapped ? "yes" : "no") << "\n";
    std::cout << "refined\t" << (eq.refined ? "yes" : "no") << "\n";
    std::cout << "mean_growth\t" << to_string(mv.first) << "\n";
    std::cout << "variance_growth\t" << to_string(mv.second) << "\n";

    if (!opts.output_file.empty()) {
        write_equilibrium_table(opts.output_file, model.rates(), eq);
        if (opts.model.verbose) {
            std::cerr << "[equilibrium] Table written: " << opts.output_file << "\n";
        }
    }
    if (opts.model.verbose) {
        const auto t_end = std::chrono::steady_clock::now();
        std::cerr << "[equilibrium] Total time: " << log_utils::format_elapsed(t_start, t_end) << "\n";
    }
    return 0;
}

}  // namespace

int cmd_equilibrium(int argc, char* argv[]) {
    EquilibriumOptions opts;
    try {
        opts = parse_equilibrium_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.what()[0] != '\0') std::cerr << e.what() << "\n";
        return e.exit_code();
    }

    try {
        if (opts.model.numeric == NumericKind::ARBITRARY) {
            set_default_precision(opts.model.precision_bits);
            return run_equilibrium<mpf_class>(opts);
        }
        return run_equilibrium<double>(opts);
    } catch (const Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

namespace {
const SubcommandRegistrar registrar({"equilibrium", "[options]",
                                     "Find the equilibrium class distribution",
                                     cmd_equilibrium, 20});
}

}  // namespace cli
}  // namespace mutsel
