#include "args.hpp"

#include <iostream>
#include <string>

namespace mutsel {
namespace cli {

namespace {

std::string require_value(int& i, int argc, char* argv[], const std::string& flag) {
    if (i + 1 >= argc) {
        throw ParseArgsExit(1, "Error: Missing value for " + flag);
    }
    return argv[++i];
}

size_t parse_size(const std::string& flag, const std::string& value) {
    try {
        size_t idx = 0;
        const unsigned long long parsed = std::stoull(value, &idx);
        if (idx != value.size() || value[0] == '-') {
            throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
        }
        return static_cast<size_t>(parsed);
    } catch (const ParseArgsExit&) {
        throw;
    } catch (const std::exception&) {
        throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
    }
}

int parse_int(const std::string& flag, const std::string& value) {
    try {
        size_t idx = 0;
        const int parsed = std::stoi(value, &idx);
        if (idx != value.size()) {
            throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
        }
        return parsed;
    } catch (const ParseArgsExit&) {
        throw;
    } catch (const std::exception&) {
        throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
    }
}

double parse_double(const std::string& flag, const std::string& value) {
    try {
        size_t idx = 0;
        const double parsed = std::stod(value, &idx);
        if (idx != value.size()) {
            throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
        }
        return parsed;
    } catch (const ParseArgsExit&) {
        throw;
    } catch (const std::exception&) {
        throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
    }
}

unsigned parse_positive(const std::string& flag, const std::string& value) {
    const size_t parsed = parse_size(flag, value);
    if (parsed < 1) throw ParseArgsExit(1, "Error: " + flag + " must be >= 1");
    return static_cast<unsigned>(parsed);
}

// Flags shared by the solver-running subcommands.
bool parse_solver_args(int& i, int argc, char* argv[], EquilibriumParams& solver) {
    const std::string arg = argv[i];
    if (arg == "--max-iters") {
        solver.max_iterations = parse_size(arg, require_value(i, argc, argv, arg));
    } else if (arg == "--block-size") {
        solver.block_size = parse_positive(arg, require_value(i, argc, argv, arg));
    } else if (arg == "--tol") {
        solver.tolerance = parse_double(arg, require_value(i, argc, argv, arg));
        if (!(solver.tolerance > 0.0)) throw ParseArgsExit(1, "Error: --tol must be > 0");
    } else if (arg == "--shift") {
        solver.shift = parse_double(arg, require_value(i, argc, argv, arg));
    } else if (arg == "--inverse-iters") {
        solver.inverse_power_iterations =
            static_cast<unsigned>(parse_size(arg, require_value(i, argc, argv, arg)));
    } else if (arg == "--no-bootstrap") {
        solver.bootstrap = false;
    } else if (arg == "--seed") {
        solver.seed = static_cast<uint64_t>(parse_size(arg, require_value(i, argc, argv, arg)));
    } else {
        return false;
    }
    return true;
}

void print_solver_usage() {
    std::cerr << "Equilibrium solver:\n";
    std::cerr << "  --max-iters <int>        Power iterations (default: 100000)\n";
    std::cerr << "  --block-size <int>       Iterations between error checks (default: 1000)\n";
    std::cerr << "  --tol <float>            Eigen error tolerance (default: 1e-14)\n";
    std::cerr << "  --shift <float>          Power iteration shift s in Wv + sv (default: 1)\n";
    std::cerr << "  --inverse-iters <int>    Inverse power refinement steps (default: 5)\n";
    std::cerr << "  --no-bootstrap           Start from a random vector\n";
    std::cerr << "  --seed <int>             Random start seed (default: 42)\n";
}

}  // namespace

bool parse_model_args(int& i, int argc, char* argv[], ModelOptions& model) {
    const std::string arg = argv[i];
    if (arg == "-n" || arg == "--classes") {
        model.n_classes = parse_size(arg, require_value(i, argc, argv, arg));
        if (model.n_classes < 2) throw ParseArgsExit(1, "Error: --classes must be >= 2");
    } else if (arg == "--bin-width") {
        model.bin_width = parse_double(arg, require_value(i, argc, argv, arg));
        if (!(model.bin_width > 0.0)) throw ParseArgsExit(1, "Error: --bin-width must be > 0");
    } else if (arg == "--death") {
        model.death = parse_double(arg, require_value(i, argc, argv, arg));
        if (model.death < 0.0) throw ParseArgsExit(1, "Error: --death must be >= 0");
    } else if (arg == "--max-growth") {
        model.max_growth = parse_double(arg, require_value(i, argc, argv, arg));
    } else if (arg == "--exclude-upper-bound") {
        model.exclude_upper_bound = true;
    } else if (arg == "--numeric") {
        const std::string value = require_value(i, argc, argv, arg);
        try {
            model.numeric = parse_numeric_kind(value);
        } catch (const InvalidArgument&) {
            throw ParseArgsExit(1, "Error: Unknown numeric kind '" + value + "'");
        }
    } else if (arg == "--precision") {
        model.precision_bits = parse_positive(arg, require_value(i, argc, argv, arg));
    } else if (arg == "--effects") {
        const std::string value = require_value(i, argc, argv, arg);
        if (value == "none") {
            model.effects = EffectsModel::NONE;
        } else if (value == "gaussian") {
            model.effects = EffectsModel::GAUSSIAN;
        } else if (value == "double-gamma" || value == "gamma") {
            model.effects = EffectsModel::DOUBLE_GAMMA;
        } else {
            throw ParseArgsExit(1, "Error: Unknown effects model '" + value + "'");
        }
    } else if (arg == "--effect-sd") {
        model.effect_sd = parse_double(arg, require_value(i, argc, argv, arg));
    } else if (arg == "--gamma-shape") {
        model.gamma_shape = parse_double(arg, require_value(i, argc, argv, arg));
    } else if (arg == "--gamma-rate") {
        model.gamma_rate = parse_double(arg, require_value(i, argc, argv, arg));
    } else if (arg == "--gamma-weight") {
        model.gamma_weight = parse_double(arg, require_value(i, argc, argv, arg));
        if (model.gamma_weight < 0.0 || model.gamma_weight > 1.0) {
            throw ParseArgsExit(1, "Error: --gamma-weight must be in [0, 1]");
        }
    } else if (arg == "-u" || arg == "--mutations") {
        model.mutations = parse_double(arg, require_value(i, argc, argv, arg));
    } else if (arg == "--log2-loci") {
        model.log2_loci = static_cast<unsigned>(parse_size(arg, require_value(i, argc, argv, arg)));
    } else if (arg == "--discard-excess") {
        model.discard_excess = true;
    } else if (arg == "--lossy") {
        model.lossy = true;
    } else if (arg == "--matrix-free") {
        model.matrix_free = true;
    } else if (arg == "--initial") {
        const std::string value = require_value(i, argc, argv, arg);
        if (value == "gaussian") {
            model.initial = InitialModel::GAUSSIAN;
        } else if (value == "point") {
            model.initial = InitialModel::POINT;
        } else {
            throw ParseArgsExit(1, "Error: Unknown initial distribution '" + value + "'");
        }
    } else if (arg == "--initial-mean") {
        model.initial_mean = parse_double(arg, require_value(i, argc, argv, arg));
    } else if (arg == "--initial-sd") {
        model.initial_sd = parse_double(arg, require_value(i, argc, argv, arg));
        if (model.initial_sd < 0.0) throw ParseArgsExit(1, "Error: --initial-sd must be >= 0");
    } else if (arg == "--initial-crop") {
        model.initial_crop = parse_double(arg, require_value(i, argc, argv, arg));
    } else if (arg == "--initial-masses") {
        model.initial_density = false;
    } else if (arg == "-t" || arg == "--threads") {
        model.num_threads = parse_int(arg, require_value(i, argc, argv, arg));
        if (model.num_threads < 1) throw ParseArgsExit(1, "Error: --threads must be >= 1");
    } else if (arg == "-v" || arg == "--verbose") {
        model.verbose = true;
    } else {
        return false;
    }
    return true;
}

void print_model_usage() {
    std::cerr << "Lattice:\n";
    std::cerr << "  -n, --classes <int>      Number of fitness classes (default: 251)\n";
    std::cerr << "  --bin-width <float>      Derive the class count from a bin width\n";
    std::cerr << "  --death <float>          Death rate; lattice starts at -death (default: 0.1)\n";
    std::cerr << "  --max-growth <float>     Largest growth rate (default: 0.15)\n";
    std::cerr << "  --exclude-upper-bound    Legacy lattice without the top endpoint\n";
    std::cerr << "  --numeric <kind>         fixed or arbitrary (default: fixed)\n";
    std::cerr << "  --precision <bits>       Arbitrary precision in bits (default: 320)\n";
    std::cerr << "Mutation:\n";
    std::cerr << "  --effects <model>        none, gaussian, double-gamma (default: double-gamma)\n";
    std::cerr << "  --effect-sd <float>      Gaussian effect sd (default: 0.002)\n";
    std::cerr << "  --gamma-shape <float>    Gamma shape (default: 0.5)\n";
    std::cerr << "  --gamma-rate <float>     Gamma rate (default: 500)\n";
    std::cerr << "  --gamma-weight <float>   Share of advantageous effects (default: 0.001)\n";
    std::cerr << "  -u, --mutations <float>  Mutation probability per birth (default: 0.01)\n";
    std::cerr << "  --log2-loci <int>        Split over 2^k loci (default: 0)\n";
    std::cerr << "  --discard-excess         Drop mass convolved off the effect range\n";
    std::cerr << "  --lossy                  Do not renormalize kernel columns\n";
    std::cerr << "  --matrix-free            Apply the kernel as a convolution\n";
    std::cerr << "Initial distribution:\n";
    std::cerr << "  --initial <model>        gaussian or point (default: gaussian)\n";
    std::cerr << "  --initial-mean <float>   Mean growth (default: 0.044)\n";
    std::cerr << "  --initial-sd <float>     Standard deviation (default: 0.005)\n";
    std::cerr << "  --initial-crop <float>   Cut-off in standard deviations (default: 11.2)\n";
    std::cerr << "  --initial-masses         Interval masses instead of densities\n";
    std::cerr << "General:\n";
    std::cerr << "  -t, --threads <int>      OpenMP threads (default: auto)\n";
    std::cerr << "  -v, --verbose            Verbose output\n";
    std::cerr << "  -h, --help               Show this help\n";
}

EvolveOptions parse_evolve_args(int argc, char* argv[]) {
    EvolveOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            std::cerr << "Usage: mutsel evolve [options]\n\n";
            std::cerr << "Evolve class frequencies epoch by epoch.\n\n";
            std::cerr << "Evolution:\n";
            std::cerr << "  -e, --epochs <int>       Epochs to run (default: 100)\n";
            std::cerr << "  --years-per-epoch <int>  Years between snapshots (default: 1)\n";
            std::cerr << "  --steps-per-year <int>   Discrete sub-steps per year (default: 1)\n";
            std::cerr << "  --stride <int>           Record every k-th class (default: 1)\n";
            std::cerr << "  --ode                    Adaptive Dormand-Prince integration\n";
            std::cerr << "  --threshold <float>      Zero classes at or below threshold * norm\n";
            std::cerr << "  --threshold-norm <norm>  none, sum or max (default: none)\n";
            std::cerr << "  --zero-forever           Zeroed classes never recover\n";
            std::cerr << "  --track-support          Step only the non-zero interval\n";
            std::cerr << "  --target-exponent <int>  Rescale exponent (default: 512)\n";
            std::cerr << "Output:\n";
            std::cerr << "  -o, --snapshot <file>    Binary snapshot\n";
            std::cerr << "  --tsv <file>             Trajectory as gzip TSV\n";
            std::cerr << "  --equilibrium            Solve for the equilibrium and store it\n";
            print_solver_usage();
            print_model_usage();
            throw ParseArgsExit(0);
        } else if (parse_model_args(i, argc, argv, opts.model)) {
            continue;
        } else if (parse_solver_args(i, argc, argv, opts.solver)) {
            continue;
        } else if (arg == "-e" || arg == "--epochs") {
            opts.n_epochs = parse_size(arg, require_value(i, argc, argv, arg));
        } else if (arg == "--years-per-epoch") {
            opts.evolution.years_per_epoch = parse_positive(arg, require_value(i, argc, argv, arg));
        } else if (arg == "--steps-per-year") {
            opts.population.steps_per_year = parse_positive(arg, require_value(i, argc, argv, arg));
        } else if (arg == "--stride") {
            opts.evolution.class_stride = parse_positive(arg, require_value(i, argc, argv, arg));
        } else if (arg == "--ode") {
            opts.evolution.use_ode_solver = true;
        } else if (arg == "--threshold") {
            opts.population.threshold = parse_double(arg, require_value(i, argc, argv, arg));
            if (opts.population.threshold < 0.0) {
                throw ParseArgsExit(1, "Error: --threshold must be >= 0");
            }
        } else if (arg == "--threshold-norm") {
            const std::string value = require_value(i, argc, argv, arg);
            try {
                opts.population.norm = parse_threshold_norm(value);
            } catch (const InvalidArgument&) {
                throw ParseArgsExit(1, "Error: Unknown threshold norm '" + value + "'");
            }
        } else if (arg == "--zero-forever") {
            opts.population.zero_forever = true;
        } else if (arg == "--track-support") {
            opts.population.track_support = true;
        } else if (arg == "--target-exponent") {
            opts.population.target_exponent = parse_int(arg, require_value(i, argc, argv, arg));
        } else if (arg == "-o" || arg == "--snapshot") {
            opts.snapshot_file = require_value(i, argc, argv, arg);
        } else if (arg == "--tsv") {
            opts.tsv_file = require_value(i, argc, argv, arg);
        } else if (arg == "--equilibrium") {
            opts.with_equilibrium = true;
        } else {
            throw ParseArgsExit(1, "Error: Unknown option '" + arg + "'");
        }
    }
    if (opts.population.zero_forever && opts.population.norm == ThresholdNorm::NONE) {
        throw ParseArgsExit(1, "Error: --zero-forever requires --threshold-norm sum|max");
    }
    opts.evolution.verbose = opts.model.verbose;
    opts.solver.verbose = opts.model.verbose;
    opts.solver.num_threads = opts.model.num_threads;
    return opts;
}

EquilibriumOptions parse_equilibrium_args(int argc, char* argv[]) {
    EquilibriumOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            std::cerr << "Usage: mutsel equilibrium [options]\n\n";
            std::cerr << "Find the equilibrium class distribution (dominant eigenvector).\n\n";
            std::cerr << "Output:\n";
            std::cerr << "  -o, --output <file>      class, growth, frequency table\n";
            print_solver_usage();
            print_model_usage();
            throw ParseArgsExit(0);
        } else if (parse_model_args(i, argc, argv, opts.model)) {
            continue;
        } else if (parse_solver_args(i, argc, argv, opts.solver)) {
            continue;
        } else if (arg == "-o" || arg == "--output") {
            opts.output_file = require_value(i, argc, argv, arg);
        } else {
            throw ParseArgsExit(1, "Error: Unknown option '" + arg + "'");
        }
    }
    opts.solver.verbose = opts.model.verbose;
    opts.solver.num_threads = opts.model.num_threads;
    return opts;
}

CompareOptions parse_compare_args(int argc, char* argv[]) {
    CompareOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            std::cerr << "Usage: mutsel compare <snapshot> <reference> [options]\n\n";
            std::cerr << "Maximum absolute relative error of a snapshot against reference\n";
            std::cerr << "arrays (one per line or nested JSON lists, text or .gz).\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --target <name>          trajectory, normalized, equilibrium, mean,\n";
            std::cerr << "                           variance (default: normalized)\n";
            std::cerr << "  --max-error <float>      Exit with 1 above this error\n";
            std::cerr << "  -h, --help               Show this help\n";
            throw ParseArgsExit(0);
        } else if (arg == "--target") {
            opts.target = require_value(i, argc, argv, arg);
            if (opts.target != "trajectory" && opts.target != "normalized" &&
                opts.target != "equilibrium" && opts.target != "mean" &&
                opts.target != "variance") {
                throw ParseArgsExit(1, "Error: Unknown comparison target '" + opts.target + "'");
            }
        } else if (arg == "--max-error") {
            opts.max_error = parse_double(arg, require_value(i, argc, argv, arg));
        } else if (!arg.empty() && arg[0] == '-') {
            throw ParseArgsExit(1, "Error: Unknown option '" + arg + "'");
        } else if (opts.snapshot_file.empty()) {
            opts.snapshot_file = arg;
        } else if (opts.reference_file.empty()) {
            opts.reference_file = arg;
        } else {
            throw ParseArgsExit(1, "Error: Unexpected argument '" + arg + "'");
        }
    }
    if (opts.snapshot_file.empty() || opts.reference_file.empty()) {
        throw ParseArgsExit(1, "Error: compare needs a snapshot and a reference file");
    }
    return opts;
}

}  // namespace cli
}  // namespace mutsel
