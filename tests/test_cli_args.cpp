// Unit tests for CLI argument parsing
// Compile: g++ -std=c++20 -I../include -I../src -o test_cli_args test_cli_args.cpp ../src/cli/args.cpp ../src/cli/subcommand.cpp

#include "cli/args.hpp"
#include "cli/subcommand.hpp"
#include <cassert>
#include <cstring>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

class ArgvBuilder {
public:
    ArgvBuilder& add(const char* arg) {
        args_.push_back(strdup(arg));
        return *this;
    }

    int argc() const { return static_cast<int>(args_.size()); }
    char** argv() { return args_.data(); }

    ~ArgvBuilder() {
        for (char* arg : args_) {
            std::free(arg);
        }
    }

private:
    std::vector<char*> args_;
};

template <typename Parser>
static void expect_parse_exit(int expected_code, ArgvBuilder& builder, Parser parse) {
    bool threw = false;
    try {
        (void)parse(builder.argc(), builder.argv());
    } catch (const mutsel::cli::ParseArgsExit& e) {
        threw = true;
        assert(e.exit_code() == expected_code);
    }
    assert(threw);
}

void test_model_defaults() {
    std::cout << "Testing model defaults... ";
    ArgvBuilder builder;
    builder.add("evolve");
    auto opts = mutsel::cli::parse_evolve_args(builder.argc(), builder.argv());
    assert(opts.model.n_classes == 251);
    assert(opts.model.death == 0.1);
    assert(opts.model.max_growth == 0.15);
    assert(opts.model.numeric == mutsel::NumericKind::FIXED);
    assert(opts.model.effects == mutsel::cli::EffectsModel::DOUBLE_GAMMA);
    assert(opts.model.mutations == 0.01);
    assert(opts.model.initial == mutsel::cli::InitialModel::GAUSSIAN);
    assert(opts.model.initial_density == true);
    assert(opts.model.matrix_free == false);
    assert(opts.n_epochs == 100);
    assert(opts.population.norm == mutsel::ThresholdNorm::NONE);
    assert(opts.evolution.use_ode_solver == false);
    assert(opts.with_equilibrium == false);
    assert(opts.snapshot_file.empty());
    std::cout << "PASSED\n";
}

void test_model_flags() {
    std::cout << "Testing model flags... ";
    ArgvBuilder builder;
    builder.add("equilibrium")
           .add("-n").add("101")
           .add("--death").add("0.2")
           .add("--max-growth").add("0.3")
           .add("--exclude-upper-bound")
           .add("--numeric").add("arbitrary")
           .add("--precision").add("512")
           .add("--effects").add("gaussian")
           .add("--effect-sd").add("0.004")
           .add("-u").add("0.05")
           .add("--log2-loci").add("3")
           .add("--discard-excess")
           .add("--lossy")
           .add("--matrix-free")
           .add("--initial").add("point")
           .add("--initial-mean").add("0.01")
           .add("-t").add("4")
           .add("-v")
           .add("-o").add("eq.tsv");
    auto opts = mutsel::cli::parse_equilibrium_args(builder.argc(), builder.argv());
    assert(opts.model.n_classes == 101);
    assert(opts.model.death == 0.2);
    assert(opts.model.max_growth == 0.3);
    assert(opts.model.exclude_upper_bound == true);
    assert(opts.model.numeric == mutsel::NumericKind::ARBITRARY);
    assert(opts.model.precision_bits == 512);
    assert(opts.model.effects == mutsel::cli::EffectsModel::GAUSSIAN);
    assert(opts.model.effect_sd == 0.004);
    assert(opts.model.mutations == 0.05);
    assert(opts.model.log2_loci == 3);
    assert(opts.model.discard_excess == true);
    assert(opts.model.lossy == true);
    assert(opts.model.matrix_free == true);
    assert(opts.model.initial == mutsel::cli::InitialModel::POINT);
    assert(opts.model.initial_mean == 0.01);
    assert(opts.model.num_threads == 4);
    assert(opts.model.verbose == true);
    assert(opts.output_file == "eq.tsv");
    // Verbosity and threads reach the solver.
    assert(opts.solver.verbose == true);
    assert(opts.solver.num_threads == 4);
    std::cout << "PASSED\n";
}

void test_solver_flags() {
    std::cout << "Testing solver flags... ";
    ArgvBuilder builder;
    builder.add("equilibrium")
           .add("--max-iters").add("5000")
           .add("--block-size").add("50")
           .add("--tol").add("1e-10")
           .add("--shift").add("0")
           .add("--inverse-iters").add("0")
           .add("--no-bootstrap")
           .add("--seed").add("99");
    auto opts = mutsel::cli::parse_equilibrium_args(builder.argc(), builder.argv());
    assert(opts.solver.max_iterations == 5000);
    assert(opts.solver.block_size == 50);
    assert(opts.solver.tolerance == 1e-10);
    assert(opts.solver.shift == 0.0);
    assert(opts.solver.inverse_power_iterations == 0);
    assert(opts.solver.bootstrap == false);
    assert(opts.solver.seed == 99);
    std::cout << "PASSED\n";
}

void test_evolve_flags() {
    std::cout << "Testing evolve flags... ";
    ArgvBuilder builder;
    builder.add("evolve")
           .add("-e").add("25")
           .add("--years-per-epoch").add("10")
           .add("--steps-per-year").add("4")
           .add("--stride").add("5")
           .add("--threshold").add("1e-12")
           .add("--threshold-norm").add("max")
           .add("--zero-forever")
           .add("--track-support")
           .add("--target-exponent").add("-100")
           .add("-o").add("run.msnap")
           .add("--tsv").add("run.tsv.gz")
           .add("--equilibrium")
           .add("--verbose");
    auto opts = mutsel::cli::parse_evolve_args(builder.argc(), builder.argv());
    assert(opts.n_epochs == 25);
    assert(opts.evolution.years_per_epoch == 10);
    assert(opts.population.steps_per_year == 4);
    assert(opts.evolution.class_stride == 5);
    assert(opts.population.threshold == 1e-12);
    assert(opts.population.norm == mutsel::ThresholdNorm::MAX);
    assert(opts.population.zero_forever == true);
    assert(opts.population.track_support == true);
    assert(opts.population.target_exponent == -100);
    assert(opts.snapshot_file == "run.msnap");
    assert(opts.tsv_file == "run.tsv.gz");
    assert(opts.with_equilibrium == true);
    assert(opts.evolution.verbose == true);

    ArgvBuilder ode;
    ode.add("evolve").add("--ode").add("--bin-width").add("0.001");
    auto ode_opts = mutsel::cli::parse_evolve_args(ode.argc(), ode.argv());
    assert(ode_opts.evolution.use_ode_solver == true);
    assert(ode_opts.model.bin_width == 0.001);
    std::cout << "PASSED\n";
}

void test_compare_args() {
    std::cout << "Testing compare args... ";
    ArgvBuilder builder;
    builder.add("compare").add("run.msnap").add("ref.txt.gz")
           .add("--target").add("equilibrium")
           .add("--max-error").add("1e-6");
    auto opts = mutsel::cli::parse_compare_args(builder.argc(), builder.argv());
    assert(opts.snapshot_file == "run.msnap");
    assert(opts.reference_file == "ref.txt.gz");
    assert(opts.target == "equilibrium");
    assert(opts.max_error == 1e-6);

    ArgvBuilder defaults;
    defaults.add("compare").add("a").add("b");
    auto d = mutsel::cli::parse_compare_args(defaults.argc(), defaults.argv());
    assert(d.target == "normalized");
    assert(d.max_error < 0.0);
    std::cout << "PASSED\n";
}

void test_validation_errors() {
    std::cout << "Testing validation errors... ";
    auto evolve = mutsel::cli::parse_evolve_args;
    auto equilibrium = mutsel::cli::parse_equilibrium_args;
    auto compare = mutsel::cli::parse_compare_args;
    {
        ArgvBuilder builder;
        builder.add("evolve").add("--threads").add("0");
        expect_parse_exit(1, builder, evolve);
    }
    {
        ArgvBuilder builder;
        builder.add("evolve").add("--epochs").add("-3");
        expect_parse_exit(1, builder, evolve);
    }
    {
        ArgvBuilder builder;
        builder.add("evolve").add("--classes").add("1");
        expect_parse_exit(1, builder, evolve);
    }
    {
        ArgvBuilder builder;
        builder.add("evolve").add("--death").add("x");
        expect_parse_exit(1, builder, evolve);
    }
    {
        ArgvBuilder builder;
        builder.add("evolve").add("--zero-forever");
        expect_parse_exit(1, builder, evolve);
    }
    {
        ArgvBuilder builder;
        builder.add("evolve").add("--threshold-norm").add("l2");
        expect_parse_exit(1, builder, evolve);
    }
    {
        ArgvBuilder builder;
        builder.add("evolve").add("--epochs");
        expect_parse_exit(1, builder, evolve);
    }
    {
        ArgvBuilder builder;
        builder.add("equilibrium").add("--numeric").add("quad");
        expect_parse_exit(1, builder, equilibrium);
    }
    {
        ArgvBuilder builder;
        builder.add("equilibrium").add("--effects").add("cauchy");
        expect_parse_exit(1, builder, equilibrium);
    }
    {
        ArgvBuilder builder;
        builder.add("equilibrium").add("--tol").add("0");
        expect_parse_exit(1, builder, equilibrium);
    }
    {
        ArgvBuilder builder;
        builder.add("equilibrium").add("--gamma-weight").add("1.5");
        expect_parse_exit(1, builder, equilibrium);
    }
    {
        ArgvBuilder builder;
        builder.add("equilibrium").add("--bogus");
        expect_parse_exit(1, builder, equilibrium);
    }
    {
        ArgvBuilder builder;
        builder.add("compare").add("only-one");
        expect_parse_exit(1, builder, compare);
    }
    {
        ArgvBuilder builder;
        builder.add("compare").add("a").add("b").add("c");
        expect_parse_exit(1, builder, compare);
    }
    {
        ArgvBuilder builder;
        builder.add("compare").add("a").add("b").add("--target").add("median");
        expect_parse_exit(1, builder, compare);
    }
    std::cout << "PASSED\n";
}

void test_controlled_exits() {
    std::cout << "Testing help controlled exits... ";
    {
        ArgvBuilder builder;
        builder.add("evolve").add("--help");
        expect_parse_exit(0, builder, mutsel::cli::parse_evolve_args);
    }
    {
        ArgvBuilder builder;
        builder.add("equilibrium").add("-h");
        expect_parse_exit(0, builder, mutsel::cli::parse_equilibrium_args);
    }
    {
        ArgvBuilder builder;
        builder.add("compare").add("--help");
        expect_parse_exit(0, builder, mutsel::cli::parse_compare_args);
    }
    std::cout << "PASSED\n";
}

static int last_argc = 0;

void test_subcommand_registry() {
    std::cout << "Testing subcommand registry... ";
    using mutsel::cli::SubcommandRegistry;
    auto& registry = SubcommandRegistry::instance();
    registry.register_command({"status", "<snapshot>", "Report", [](int argc, char**) {
                                   last_argc = argc;
                                   return 7;
                               }, 20});
    registry.register_command({"simulate", "[options]", "Run", [](int, char**) { return 3; }, 10});
    registry.register_command({"stats", "", "Summaries", [](int, char**) { return 0; }, 20});

    // Help order follows `order`, then registration order.
    const auto& commands = registry.commands();
    assert(commands.size() == 3);
    assert(commands[0].name == "simulate");
    assert(commands[1].name == "status");
    assert(commands[2].name == "stats");

    ArgvBuilder builder;
    builder.add("status").add("file.msnap");
    assert(registry.run_command("status", builder.argc(), builder.argv()) == 7);
    assert(last_argc == 2);
    assert(registry.run_command("nope", builder.argc(), builder.argv()) == 1);
    assert(registry.find("nope") == nullptr);

    const auto close = registry.suggestions("stat");
    assert(close.size() == 2 && close[0] == "status" && close[1] == "stats");
    assert(registry.suggestions("xyz").empty());

    // Re-registering replaces the handler without duplicating the entry.
    registry.register_command({"simulate", "[options]", "Run", [](int, char**) { return 4; }, 10});
    assert(registry.commands().size() == 3);
    assert(registry.run_command("simulate", builder.argc(), builder.argv()) == 4);

    std::ostringstream help;
    registry.print_help(help, "mutsel");
    const std::string text = help.str();
    assert(text.find("Usage: mutsel <command> [options]") != std::string::npos);
    assert(text.find("  simulate [options]") != std::string::npos);
    assert(text.find("  status <snapshot>") != std::string::npos);
    assert(text.find("simulate") < text.find("status"));
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== CLI Argument Parsing Tests ===\n\n";
    test_model_defaults();
    test_model_flags();
    test_solver_flags();
    test_evolve_flags();
    test_compare_args();
    test_validation_errors();
    test_controlled_exits();
    test_subcommand_registry();
    std::cout << "\nAll tests passed!\n";
    return 0;
}
