// mutsel evolve: frequency trajectories under mutation and selection
//
// Builds the generator from the model options, evolves the initial
// distribution epoch by epoch and writes a snapshot and/or gzip TSV.

#include "subcommand.hpp"
#include "args.hpp"
#include "model.hpp"
#include "mutsel/errors.hpp"
#include "mutsel/evolution.hpp"
#include "mutsel/log_utils.hpp"
#include "mutsel/snapshot.hpp"

#include <chrono>
#include <iostream>

namespace mutsel {
namespace cli {

namespace {

template <typename Real>
int run_evolve(const EvolveOptions& opts) {
    const auto t_start = std::chrono::steady_clock::now();
    const bool verbose = opts.model.verbose;

    Model<Real> model(opts.model);
    Population<Real> population(model.generator(), model.initial(), opts.population);
    Evolution<Real> evolution(population, opts.evolution);

    if (verbose) {
        std::cerr << "[evolve] " << opts.n_epochs << " epochs of "
                  << opts.evolution.years_per_epoch << " year(s), "
                  << opts.population.steps_per_year << " step(s) per year"
                  << (opts.evolution.use_ode_solver ? ", adaptive RK45" : "")
                  << ", threshold norm " << threshold_norm_name(opts.population.norm) << "\n";
    }
    evolution.run(opts.n_epochs);

    const auto last = evolution.last_valid_epoch();
    if (!last) {
        log_utils::warn("evolve", "initial state is already degenerate");
    } else if (*last + 1 < evolution.size()) {
        log_utils::warn("evolve", "trajectory diverged after epoch " + std::to_string(*last));
    }

    const EigenPair<Real>* eq = nullptr;
    if (opts.with_equilibrium) eq = &population.equilibrium(opts.solver);

    const MeanVarianceSeries series = evolution.mean_and_variance();
    const size_t final_epoch = last ? *last : 0;
    std::cout << "epochs\t" << (evolution.size() - 1) << "\n";
    std::cout << "years\t" << evolution.n_years() << "\n";
    std::cout << "last_valid_epoch\t" << (last ? std::to_string(*last) : std::string("none")) << "\n";
    std::cout << "log_scalar\t" << evolution.log_scalars()[final_epoch] << "\n";
    std::cout << "mean_growth\t" << to_string(series.mean[final_epoch]) << "\n";
    std::cout << "variance_growth\t" << to_string(series.variance[final_epoch]) << "\n";
    if (eq != nullptr) {
        std::cout << "eigenvalue\t" << to_string(eq->value) << "\n";
        std::cout << "eigen_error\t" << eq->error << "\n";
    }

    if (!opts.snapshot_file.empty() || !opts.tsv_file.empty()) {
        const Snapshot snapshot = make_snapshot(evolution, model.rates(), eq);
        if (!opts.snapshot_file.empty()) {
            write_snapshot(opts.snapshot_file, snapshot);
            if (verbose) std::cerr << "[evolve] Snapshot written: " << opts.snapshot_file << "\n";
        }
        if (!opts.tsv_file.empty()) {
            write_trajectory_tsv(opts.tsv_file, snapshot);
            if (verbose) std::cerr << "[evolve] Trajectory written: " << opts.tsv_file << "\n";
        }
    }

    if (verbose) {
        const auto t_end = std::chrono::steady_clock::now();
        std::cerr << "[evolve] Total time: " << log_utils::format_elapsed(t_start, t_end) << "\n";
    }
    return 0;
}

}  // namespace

int cmd_evolve(int argc, char* argv[]) {
    EvolveOptions opts;
    try {
        opts = parse_evolve_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.what()[0] != '\0') std::cerr << e.what() << "\n";
        return e.exit_code();
    }

    try {
        if (opts.model.numeric == NumericKind::ARBITRARY) {
            set_default_precision(opts.model.precision_bits);
            return run_evolve<mpf_class>(opts);
        }
        return run_evolve<double>(opts);
    } catch (const Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

namespace {
const SubcommandRegistrar registrar({"evolve", "[options]",
                                     "Evolve class frequencies over epochs",
                                     cmd_evolve, 10});
}

}  // namespace cli
}  // namespace mutsel
