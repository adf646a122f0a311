#pragma once
// Per-class growth and birth rates on an equispaced fitness lattice.
//
// Class i has growth rate growth[i] = -death + i * delta and birth rate
// birth[i] = growth[i] + death, so the least fit class cannot reproduce.
// `effects` lists the 2n-1 possible offsets (k - (n-1)) * delta a mutation can
// move an offspring by, which is the support of the effect distribution.

#include "mutsel/errors.hpp"
#include "mutsel/precision.hpp"

#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

namespace mutsel {

template <typename Real>
struct Rates {
    size_t n_classes = 0;
    Real death{0};
    Real max_growth{0};
    Real delta{0};                 // bin width
    bool exclude_upper_bound = false;
    std::vector<Real> growth;      // n entries, strictly increasing
    std::vector<Real> birth;       // growth + death, birth[0] == 0
    std::vector<Real> effects;     // 2n-1 offsets, effects[n-1] == 0

    size_t zero_effect_index() const { return n_classes - 1; }

    template <typename To>
    Rates<To> convert() const {
        Rates<To> out;
        out.n_classes = n_classes;
        out.death = type_convert<To>(death);
        out.max_growth = type_convert<To>(max_growth);
        out.delta = type_convert<To>(delta);
        out.exclude_upper_bound = exclude_upper_bound;
        out.growth = convert_vector<To>(growth);
        out.birth = convert_vector<To>(birth);
        out.effects = convert_vector<To>(effects);
        return out;
    }
};

template <typename Real>
Rates<Real> make_rates(size_t n, const Real& death, const Real& max_growth,
                       bool exclude_upper_bound = false) {
    if (n < 2) {
        throw InvalidArgument("make_rates: need at least 2 classes, got " + std::to_string(n));
    }
    if (death < 0) {
        throw InvalidArgument("make_rates: death rate must be non-negative, got " + to_string(death));
    }
    const Real span = max_growth + death;
    if (!(span > 0)) {
        throw InvalidArgument("make_rates: growth range [-death, max_growth] is empty");
    }

    Rates<Real> r;
    r.n_classes = n;
    r.death = death;
    r.max_growth = max_growth;
    r.exclude_upper_bound = exclude_upper_bound;
    // Legacy layout divides into n bins and drops the upper endpoint.
    const size_t divisions = exclude_upper_bound ? n : n - 1;
    r.delta = Real(span / Real(static_cast<unsigned long>(divisions)));

    r.growth.resize(n);
    r.birth.resize(n);
    const Real lower = Real(0) - death;
    for (size_t i = 0; i < n; ++i) {
        r.growth[i] = lower + Real(static_cast<unsigned long>(i)) * r.delta;
    }
    if (!exclude_upper_bound) r.growth[n - 1] = max_growth;
    for (size_t i = 0; i < n; ++i) r.birth[i] = r.growth[i] + death;

    if (r.birth[0] != 0) {
        throw InvariantViolation("make_rates: least fit class has non-zero birth rate " +
                                 to_string(r.birth[0]));
    }

    r.effects.resize(2 * n - 1);
    for (size_t k = 0; k < n; ++k) r.effects[k] = Real(0) - r.birth[n - 1 - k];
    for (size_t k = 1; k < n; ++k) r.effects[n - 1 + k] = r.birth[k];
    return r;
}

// Lattice over [min_fitness, max_fitness] with the given bin width; the
// death rate is -min_fitness.
template <typename Real>
Rates<Real> rates_from_bin_width(const Real& min_fitness, const Real& max_fitness,
                                 const Real& bin_width) {
    if (!(bin_width > 0)) {
        throw InvalidArgument("rates_from_bin_width: bin width must be positive");
    }
    if (!(max_fitness > min_fitness)) {
        throw InvalidArgument("rates_from_bin_width: max_fitness must exceed min_fitness");
    }
    const double bins = to_double(Real((max_fitness - min_fitness) / bin_width));
    const long long rounded = std::llround(bins);
    if (rounded < 1) {
        throw InvalidArgument("rates_from_bin_width: bin width wider than the fitness range");
    }
    const size_t n = static_cast<size_t>(rounded) + 1;
    return make_rates<Real>(n, Real(Real(0) - min_fitness), max_fitness, false);
}

}  // namespace mutsel
