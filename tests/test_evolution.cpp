// tests/test_evolution.cpp
//
// Population stepping, thresholding and the Evolution record.

#include "mutsel/distributions.hpp"
#include "mutsel/errors.hpp"
#include "mutsel/evolution.hpp"
#include "mutsel/generator.hpp"
#include "mutsel/precision.hpp"
#include "mutsel/rates.hpp"

#include <gmpxx.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

bool rel_close(double a, double b, double tol) {
    return std::fabs(a - b) <= tol * std::max(std::fabs(b), 1e-300);
}

// Selection only: W = diag(growth).
struct SelectionModel {
    mutsel::Rates<double> rates = mutsel::make_rates<double>(5, 0.1, 0.3);
    mutsel::EffectsDistribution<double> effects =
        mutsel::EffectsDistribution<double>::point_mass(rates);
    mutsel::Generator<double> generator{rates, effects};
};

struct MutationModel {
    mutsel::Rates<double> rates = mutsel::make_rates<double>(51, 0.1, 0.15);
    mutsel::EffectsDistribution<double> effects;
    mutsel::Generator<double> generator;

    MutationModel()
        : effects(mutsel::EffectsDistribution<double>::symmetric_gaussian(rates, 0.01)),
          generator(rates, with_mutation(effects)) {}

    static mutsel::EffectsDistribution<double>& with_mutation(
        mutsel::EffectsDistribution<double>& e) {
        e.apply_mutation_rate(0.05);
        return e;
    }
};

int test_selection_only_euler() {
    std::cout << "[E1] Euler steps without mutation\n";
    int failed = 0;
    SelectionModel m;
    mutsel::Population<double> population(m.generator, std::vector<double>(5, 1.0));
    mutsel::Evolution<double> evolution(population);
    evolution.run(10);

    expect(evolution.size() == 11, "initial state plus one row per epoch", failed);
    expect(evolution.n_years() == 10, "ten years", failed);

    const std::vector<double>& last = evolution.trajectory().back();
    const long scale = evolution.log_scalars().back();
    bool ok = true;
    for (size_t i = 0; i < last.size(); ++i) {
        const double expected = std::pow(1.0 + m.rates.growth[i], 10);
        if (!rel_close(std::ldexp(last[i], -scale), expected, 1e-12)) ok = false;
    }
    expect(ok, "P_i(10) = (1 + growth_i)^10", failed);
    expect(scale != 0, "rescaling moved the exponent", failed);

    // Four sub-steps per year follow (1 + g/4)^4 per year.
    mutsel::PopulationParams quarterly;
    quarterly.steps_per_year = 4;
    mutsel::Population<double> fine(m.generator, std::vector<double>(5, 1.0), quarterly);
    for (int y = 0; y < 3; ++y) fine.annual_update();
    bool sub_ok = true;
    for (size_t i = 0; i < 5; ++i) {
        const double expected = std::pow(1.0 + m.rates.growth[i] / 4.0, 12);
        if (!rel_close(std::ldexp(fine.frequencies()[i], -fine.log_scalar()), expected, 1e-12)) {
            sub_ok = false;
        }
    }
    expect(sub_ok, "sub-steps per year", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_ode_solver() {
    std::cout << "[E2] adaptive ODE solver\n";
    int failed = 0;
    SelectionModel m;
    mutsel::Population<double> population(m.generator, std::vector<double>(5, 1.0));
    mutsel::EvolutionParams params;
    params.use_ode_solver = true;
    params.years_per_epoch = 2;
    mutsel::Evolution<double> evolution(population, params);
    evolution.run(3);

    expect(evolution.n_years() == 6, "three epochs of two years", failed);
    const std::vector<double>& last = evolution.trajectory().back();
    const long scale = evolution.log_scalars().back();
    bool ok = true;
    for (size_t i = 0; i < last.size(); ++i) {
        const double expected = std::exp(m.rates.growth[i] * 6.0);
        if (!rel_close(std::ldexp(last[i], -scale), expected, 1e-8)) ok = false;
    }
    expect(ok, "P_i(T) = exp(growth_i T)", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_configuration_checks() {
    std::cout << "[E3] configuration checks\n";
    int failed = 0;
    SelectionModel m;
    const std::vector<double> P(5, 1.0);

    mutsel::PopulationParams thresholded;
    thresholded.norm = mutsel::ThresholdNorm::SUM;
    thresholded.threshold = 1e-9;
    mutsel::Population<double> population(m.generator, P, thresholded);
    mutsel::EvolutionParams ode;
    ode.use_ode_solver = true;
    bool conflict = false;
    try {
        mutsel::Evolution<double> evolution(population, ode);
    } catch (const mutsel::ConfigurationConflict&) {
        conflict = true;
    }
    expect(conflict, "ODE solver with thresholding", failed);

    mutsel::set_default_precision(128);
    const auto rates_mp = mutsel::make_rates<mpf_class>(5, mpf_class(0.1), mpf_class(0.3));
    const auto effects_mp = mutsel::EffectsDistribution<mpf_class>::point_mass(rates_mp);
    const mutsel::Generator<mpf_class> generator_mp(rates_mp, effects_mp);
    mutsel::Population<mpf_class> population_mp(generator_mp,
                                                 std::vector<mpf_class>(5, mpf_class(1)));
    conflict = false;
    try {
        mutsel::Evolution<mpf_class> evolution(population_mp, ode);
    } catch (const mutsel::ConfigurationConflict&) {
        conflict = true;
    }
    expect(conflict, "ODE solver in arbitrary precision", failed);

    mutsel::PopulationParams tracking;
    tracking.track_support = true;
    conflict = false;
    try {
        mutsel::Population<double> p(m.generator, P, tracking);
    } catch (const mutsel::ConfigurationConflict&) {
        conflict = true;
    }
    expect(conflict, "track_support without zero_forever", failed);

    mutsel::PopulationParams forever;
    forever.zero_forever = true;
    bool invalid = false;
    try {
        mutsel::Population<double> p(m.generator, P, forever);
    } catch (const mutsel::InvalidArgument&) {
        invalid = true;
    }
    expect(invalid, "zero_forever without a norm", failed);

    invalid = false;
    try {
        mutsel::Population<double> p(m.generator, {1.0, 1.0, -1.0, 1.0, 1.0});
    } catch (const mutsel::InvalidArgument&) {
        invalid = true;
    }
    expect(invalid, "negative frequency", failed);

    invalid = false;
    try {
        mutsel::Population<double> p(m.generator, std::vector<double>(4, 1.0));
    } catch (const mutsel::InvalidArgument&) {
        invalid = true;
    }
    expect(invalid, "length mismatch", failed);

    invalid = false;
    try {
        mutsel::Population<double> p(m.generator, P);
        mutsel::EvolutionParams zero_years;
        zero_years.years_per_epoch = 0;
        mutsel::Evolution<double> evolution(p, zero_years);
    } catch (const mutsel::InvalidArgument&) {
        invalid = true;
    }
    expect(invalid, "zero years per epoch", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_zero_forever() {
    std::cout << "[E4] zero-forever thresholding\n";
    int failed = 0;
    MutationModel m;
    mutsel::PopulationParams params;
    params.norm = mutsel::ThresholdNorm::MAX;
    params.threshold = 1e-8;
    params.zero_forever = true;
    mutsel::Population<double> population(m.generator,
                                          mutsel::gaussian_frequencies(m.rates), params);
    mutsel::Evolution<double> evolution(population);
    evolution.run(30);

    const auto& rows = evolution.trajectory();
    bool absorbing = true;
    for (size_t i = 0; i < rows.front().size(); ++i) {
        bool seen_zero = false;
        for (size_t k = 1; k < rows.size(); ++k) {
            if (rows[k][i] == 0.0) {
                seen_zero = true;
            } else if (seen_zero) {
                absorbing = false;
            }
        }
    }
    expect(absorbing, "a zeroed class never recovers", failed);

    bool consistent = true;
    size_t n_zeroed = 0;
    for (size_t i = 0; i < population.n_classes(); ++i) {
        if (population.zeroed(i)) {
            ++n_zeroed;
            if (population.frequencies()[i] != 0.0) consistent = false;
        }
    }
    expect(consistent, "zeroed classes hold zero", failed);
    expect(n_zeroed > 0 && n_zeroed < population.n_classes(), "some, not all, classes zeroed",
           failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_track_support() {
    std::cout << "[E5] support tracking\n";
    int failed = 0;
    MutationModel m;
    mutsel::PopulationParams params;
    params.norm = mutsel::ThresholdNorm::SUM;
    params.threshold = 1e-10;
    params.zero_forever = true;

    mutsel::Population<double> plain(m.generator, mutsel::gaussian_frequencies(m.rates), params);
    params.track_support = true;
    mutsel::Population<double> tracked(m.generator, mutsel::gaussian_frequencies(m.rates), params);

    mutsel::Evolution<double> a(plain);
    mutsel::Evolution<double> b(tracked);
    a.run(20);
    b.run(20);

    const auto na = a.normalized();
    const auto nb = b.normalized();
    bool same = na.size() == nb.size();
    for (size_t k = 0; same && k < na.size(); ++k) {
        for (size_t i = 0; i < na[k].size(); ++i) {
            if (std::fabs(na[k][i] - nb[k][i]) > 1e-12) same = false;
        }
    }
    expect(same, "tracking the support leaves the trajectory unchanged", failed);

    const mutsel::ClassRange range = tracked.included();
    expect(range.size() < tracked.n_classes(), "support range shrank", failed);
    bool outside_zero = true;
    for (size_t i = 0; i < tracked.n_classes(); ++i) {
        if (!range.contains(i) && tracked.frequencies()[i] != 0.0) outside_zero = false;
    }
    expect(outside_zero, "no mass outside the support range", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_divergence() {
    std::cout << "[E6] divergence detection\n";
    int failed = 0;
    SelectionModel m;
    mutsel::Population<double> population(m.generator, std::vector<double>(5, 1.0));
    mutsel::Evolution<double> evolution(population);

    const double nan = std::numeric_limits<double>::quiet_NaN();
    evolution.set_trajectory({std::vector<double>(5, 1.0), std::vector<double>(5, 2.0),
                              {1.0, nan, 1.0, 1.0, 1.0}, std::vector<double>(5, 3.0)});
    expect(evolution.last_valid_epoch() == std::optional<size_t>(1), "NaN at epoch 2", failed);

    const auto mv = evolution.mean_and_variance();
    expect(std::isnan(mv.mean[2]) && std::isnan(mv.variance[2]), "NaN moments at epoch 2",
           failed);
    expect(std::isfinite(mv.mean[1]), "finite moments before divergence", failed);

    evolution.set_trajectory({std::vector<double>(5, 0.0), std::vector<double>(5, 1.0)});
    expect(!evolution.last_valid_epoch().has_value(), "unusable initial state", failed);

    evolution.set_trajectory({std::vector<double>(5, 1.0), std::vector<double>(5, 1.0)});
    expect(evolution.last_valid_epoch() == std::optional<size_t>(1), "all epochs valid", failed);

    bool threw = false;
    try {
        evolution.set_trajectory({std::vector<double>(3, 1.0)});
    } catch (const mutsel::InvalidArgument&) {
        threw = true;
    }
    expect(threw, "row length mismatch", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_selection_raises_mean() {
    std::cout << "[E7] mean growth under selection\n";
    int failed = 0;
    SelectionModel m;
    mutsel::Population<double> population(m.generator, std::vector<double>(5, 1.0));
    mutsel::Evolution<double> evolution(population);
    evolution.run(25);

    const auto mv = evolution.mean_and_variance();
    bool increasing = true;
    for (size_t k = 1; k < mv.mean.size(); ++k) {
        if (!(mv.mean[k] > mv.mean[k - 1])) increasing = false;
    }
    expect(increasing, "mean growth increases every epoch", failed);
    expect(std::fabs(mv.mean[0] - 0.1) < 1e-12, "uniform start has the mid-lattice mean", failed);
    expect(mv.mean.back() < 0.3, "mean stays below the top class", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_fundamental_theorem() {
    std::cout << "[E8] fundamental theorem decomposition\n";
    int failed = 0;
    MutationModel m;
    mutsel::Population<double> population(m.generator, mutsel::gaussian_frequencies(m.rates));
    for (int y = 0; y < 5; ++y) population.annual_update();

    const auto terms = population.fundamental_theorem_terms();
    const std::vector<double>& P = population.frequencies();
    std::vector<double> dP;
    m.generator.derivative(0.0, P, dP);
    const double S = mutsel::accurate_sum(P);
    const double mean = population.mean_and_variance().first;
    std::vector<double> centered(P.size());
    for (size_t i = 0; i < P.size(); ++i) centered[i] = m.rates.growth[i] - mean;
    const double dmean = mutsel::accurate_dot(centered, dP) / S;

    expect(rel_close(terms.selection + terms.mutation, dmean, 1e-9),
           "selection + mutation = d(mean)/dt", failed);
    expect(terms.selection > 0.0, "positive variance", failed);
    expect(std::fabs(terms.mutation) < 0.01 * terms.selection,
           "symmetric mutation barely moves the mean", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_arbitrary_precision_matches() {
    std::cout << "[E9] arbitrary precision agrees with double\n";
    int failed = 0;
    mutsel::set_default_precision(256);

    const auto rates = mutsel::make_rates<double>(21, 0.1, 0.15);
    auto effects = mutsel::EffectsDistribution<double>::symmetric_gaussian(rates, 0.02);
    effects.apply_mutation_rate(0.05);
    const mutsel::Generator<double> generator(rates, effects);

    const auto rates_mp = mutsel::make_rates<mpf_class>(21, mpf_class("0.1"), mpf_class("0.15"));
    auto effects_mp = mutsel::EffectsDistribution<mpf_class>::symmetric_gaussian(rates_mp, 0.02);
    effects_mp.apply_mutation_rate(0.05);
    const mutsel::Generator<mpf_class> generator_mp(rates_mp, effects_mp);

    mutsel::Population<double> population(generator, mutsel::gaussian_frequencies(rates));
    mutsel::Population<mpf_class> population_mp(generator_mp,
                                                mutsel::gaussian_frequencies(rates_mp));
    mutsel::Evolution<double> a(population);
    mutsel::Evolution<mpf_class> b(population_mp);
    a.run(10);
    b.run(10);

    const auto na = a.normalized().back();
    const auto nb = b.normalized().back();
    bool ok = na.size() == nb.size();
    for (size_t i = 0; ok && i < na.size(); ++i) {
        if (std::fabs(na[i] - nb[i]) > 1e-12) ok = false;
    }
    expect(ok, "normalized trajectories agree", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_rescaling() {
    std::cout << "[E10] rescaling, normalization, class stride\n";
    int failed = 0;
    SelectionModel m;
    mutsel::Population<double> population(m.generator, {1.0, 2.0, 3.0, 4.0, 6.0});

    const long k = population.rebias();
    expect(k == 512 - 3, "max(P) = 6 moves to exponent 512", failed);
    expect(population.log_scalar() == k, "log_scalar records the shift", failed);
    expect(population.rebias() == 0, "rebias is idempotent", failed);

    population.scale(-k);
    expect(population.frequencies()[4] == 6.0 && population.log_scalar() == 0, "scale back",
           failed);

    const auto freq = population.normalized();
    expect(std::fabs(freq[2] - 0.1875) < 1e-15, "normalized copy", failed);

    population.scale(10);
    population.normalize();
    expect(population.log_scalar() == 0, "normalize resets log_scalar", failed);
    expect(std::fabs(population.size() - 1.0) < 1e-15, "normalize sums to one", failed);

    mutsel::EvolutionParams strided;
    strided.class_stride = 2;
    mutsel::Evolution<double> evolution(population, strided);
    evolution.run(2);
    expect(evolution.trajectory().front().size() == 3, "every second class recorded", failed);
    expect(evolution.growth().size() == 3, "growth follows the stride", failed);

    mutsel::Population<double> empty(m.generator, std::vector<double>(5, 0.0));
    bool threw = false;
    try {
        empty.normalize();
    } catch (const mutsel::InvalidArgument&) {
        threw = true;
    }
    expect(threw, "normalizing an empty population throws", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_gaussian_start_long_run() {
    std::cout << "[E11] discretized Normal start over 300 epochs\n";
    int failed = 0;
    const auto rates = mutsel::make_rates<double>(251, 0.1, 0.15);
    // Advantageous mutations outweigh deleterious ones.
    auto effects =
        mutsel::EffectsDistribution<double>::weighted_double_gamma(rates, 0.5, 500.0, 0.6);
    effects.apply_mutation_rate(0.01);
    const mutsel::Generator<double> generator(rates, effects);

    mutsel::PopulationParams pp;
    pp.norm = mutsel::ThresholdNorm::SUM;
    pp.threshold = 1e-9;
    mutsel::Population<double> population(generator, mutsel::gaussian_frequencies(rates), pp);
    mutsel::Evolution<double> evolution(population);
    evolution.run(300);

    const auto last = evolution.last_valid_epoch();
    expect(last.has_value() && *last == 300, "no divergence", failed);

    bool finite = true;
    for (const auto& row : evolution.trajectory()) {
        for (double x : row) {
            if (!std::isfinite(x) || x < 0.0) finite = false;
        }
    }
    for (double total : evolution.sums()) {
        if (!std::isfinite(total) || !(total > 0.0)) finite = false;
    }
    expect(finite, "frequencies finite and non-negative", failed);

    const auto mean = evolution.mean_and_variance().mean;
    expect(std::fabs(mean.front() - 0.044) < 1e-9, "initial mean", failed);
    bool increasing = true;
    for (size_t k = 1; k < mean.size(); ++k) {
        if (mean[k] < mean[k - 1] - 1e-12) increasing = false;
    }
    expect(increasing, "mean growth never decreases", failed);
    expect(mean.back() > mean.front(), "mean growth rises overall", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_class_shift() {
    std::cout << "[E12] shifting the distribution across classes\n";
    int failed = 0;
    SelectionModel m;
    mutsel::Population<double> population(m.generator, {1.0, 2.0, 3.0, 4.0, 5.0});

    population.shift(1);
    expect(population.frequencies() == std::vector<double>({0.0, 1.0, 2.0, 3.0, 4.0}),
           "shift up by one", failed);
    expect(population.log_scalar() == 0, "log_scalar untouched", failed);

    population.shift(-2);
    expect(population.frequencies() == std::vector<double>({2.0, 3.0, 4.0, 0.0, 0.0}),
           "shift down by two", failed);

    population.shift(0);
    expect(population.frequencies() == std::vector<double>({2.0, 3.0, 4.0, 0.0, 0.0}),
           "zero shift", failed);

    population.shift(-5);
    expect(population.frequencies() == std::vector<double>(5, 0.0), "shift off the lattice",
           failed);

    mutsel::Population<double> wide(m.generator, {1.0, 2.0, 3.0, 4.0, 5.0});
    wide.shift(7);
    expect(wide.frequencies() == std::vector<double>(5, 0.0), "shift beyond the top", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // namespace

int main() {
    int total = 0;
    total += test_selection_only_euler();
    total += test_ode_solver();
    total += test_configuration_checks();
    total += test_zero_forever();
    total += test_track_support();
    total += test_divergence();
    total += test_selection_raises_mean();
    total += test_fundamental_theorem();
    total += test_arbitrary_precision_matches();
    total += test_rescaling();
    total += test_gaussian_start_long_run();
    total += test_class_shift();

    if (total == 0) {
        std::cout << "\nAll evolution tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
