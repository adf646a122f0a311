#ifndef MUTSEL_CLI_ARGS_HPP
#define MUTSEL_CLI_ARGS_HPP

#include "mutsel/equilibrium.hpp"
#include "mutsel/evolution.hpp"
#include "mutsel/precision.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <string>
#include <utility>

namespace mutsel {
namespace cli {

// Thrown by the parsers instead of calling exit(); carries the process exit
// code (0 after --help) and the message to print, if any.
class ParseArgsExit : public std::exception {
public:
    explicit ParseArgsExit(int code, std::string message = {})
        : code_(code), message_(std::move(message)) {}

    int exit_code() const { return code_; }
    const char* what() const noexcept override { return message_.c_str(); }

private:
    int code_;
    std::string message_;
};

enum class EffectsModel {
    NONE,           // no mutation
    GAUSSIAN,       // symmetric discretized Normal
    DOUBLE_GAMMA    // weighted Gamma reflection mixture
};

enum class InitialModel {
    GAUSSIAN,       // discretized Normal over growth
    POINT           // unit mass on the class nearest to the mean
};

inline const char* effects_model_to_string(EffectsModel m) {
    switch (m) {
        case EffectsModel::NONE: return "none";
        case EffectsModel::GAUSSIAN: return "gaussian";
        default: return "double-gamma";
    }
}

// Lattice, mutation model and initial condition shared by every subcommand.
struct ModelOptions {
    size_t n_classes = 251;
    double bin_width = 0.0;            // > 0 derives n_classes from the range
    double death = 0.1;                // lattice spans [-death, max_growth]
    double max_growth = 0.15;
    bool exclude_upper_bound = false;  // legacy lattice without the top endpoint
    NumericKind numeric = NumericKind::FIXED;
    unsigned long precision_bits = 320;

    EffectsModel effects = EffectsModel::DOUBLE_GAMMA;
    double effect_sd = 0.002;          // Gaussian effects
    double gamma_shape = 0.5;          // double-gamma effects
    double gamma_rate = 500.0;
    double gamma_weight = 1e-3;        // share of advantageous mutations
    double mutations = 0.01;           // mutation probability per birth
    unsigned log2_loci = 0;            // split over 2^k loci, recombined by convolution
    bool discard_excess = false;
    bool lossy = false;                // keep mass that mutates off the lattice as lost
    bool matrix_free = false;          // kernel as convolution instead of a dense matrix

    InitialModel initial = InitialModel::GAUSSIAN;
    double initial_mean = 0.044;
    double initial_sd = 0.005;
    double initial_crop = 11.2;
    bool initial_density = true;

    int num_threads = 0;
    bool verbose = false;
};

struct EvolveOptions {
    ModelOptions model;
    PopulationParams population;
    EvolutionParams evolution;
    size_t n_epochs = 100;
    std::string snapshot_file;         // binary snapshot (.msnap)
    std::string tsv_file;              // gzip TSV trajectory
    bool with_equilibrium = false;     // solve for the equilibrium and store it
    EquilibriumParams solver;
};

struct EquilibriumOptions {
    ModelOptions model;
    EquilibriumParams solver;
    std::string output_file;           // class, growth, frequency table
};

struct CompareOptions {
    std::string snapshot_file;
    std::string reference_file;
    std::string target = "normalized"; // trajectory, normalized, equilibrium, mean, variance
    double max_error = -1.0;           // fail (exit 1) above this error, < 0 = report only
};

// Consume argv[i] (and its value) when it is a model flag. Returns false for
// flags the caller must handle.
bool parse_model_args(int& i, int argc, char* argv[], ModelOptions& model);

void print_model_usage();

EvolveOptions parse_evolve_args(int argc, char* argv[]);
EquilibriumOptions parse_equilibrium_args(int argc, char* argv[]);
CompareOptions parse_compare_args(int argc, char* argv[]);

}  // namespace cli
}  // namespace mutsel

#endif  // MUTSEL_CLI_ARGS_HPP
