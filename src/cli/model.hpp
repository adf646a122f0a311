#ifndef MUTSEL_CLI_MODEL_HPP
#define MUTSEL_CLI_MODEL_HPP

// Builds rates, effect distribution, generator and initial frequencies from
// ModelOptions in either numeric representation.

#include "args.hpp"
#include "mutsel/distributions.hpp"
#include "mutsel/generator.hpp"
#include "mutsel/precision.hpp"
#include "mutsel/rates.hpp"

#include <iostream>
#include <type_traits>
#include <vector>

namespace mutsel {
namespace cli {

// Option values are decimal; route them through their decimal text so an
// arbitrary-precision lattice gets 0.001 rather than the nearest double.
// 15 significant digits recover any decimal typed with at most that many.
template <typename Real>
Real option_value(double x) {
    if constexpr (std::is_same_v<Real, double>) {
        return x;
    } else {
        return from_string<Real>(to_string(x, 15));
    }
}

template <typename Real>
Rates<Real> model_rates(const ModelOptions& opts) {
    if (opts.bin_width > 0.0) {
        return rates_from_bin_width(option_value<Real>(-opts.death),
                                    option_value<Real>(opts.max_growth),
                                    option_value<Real>(opts.bin_width));
    }
    return make_rates(opts.n_classes, option_value<Real>(opts.death),
                      option_value<Real>(opts.max_growth), opts.exclude_upper_bound);
}

template <typename Real>
EffectsDistribution<Real> model_effects(const Rates<Real>& rates, const ModelOptions& opts) {
    if (opts.effects == EffectsModel::NONE) return EffectsDistribution<Real>::point_mass(rates);
    EffectsDistribution<Real> effects =
        opts.effects == EffectsModel::GAUSSIAN
            ? EffectsDistribution<Real>::symmetric_gaussian(rates, opts.effect_sd)
            : EffectsDistribution<Real>::weighted_double_gamma(rates, opts.gamma_shape,
                                                               opts.gamma_rate, opts.gamma_weight);
    effects.apply_mutation_rate(opts.mutations, opts.log2_loci, opts.discard_excess);
    return effects;
}

template <typename Real>
std::vector<Real> model_initial(const Rates<Real>& rates, const ModelOptions& opts) {
    if (opts.initial == InitialModel::POINT) {
        return gaussian_frequencies(rates, opts.initial_mean, 0.0);
    }
    return gaussian_frequencies(rates, opts.initial_mean, opts.initial_sd, opts.initial_crop,
                                opts.initial_density);
}

template <typename Real>
class Model {
public:
    explicit Model(const ModelOptions& opts)
        : rates_(model_rates<Real>(opts)),
          effects_(model_effects(rates_, opts)),
          generator_(rates_, effects_, opts.lossy, !opts.matrix_free, opts.num_threads),
          initial_(model_initial(rates_, opts)) {
        if (opts.verbose) {
            std::cerr << "[model] " << rates_.n_classes << " classes, bin width "
                      << to_string(rates_.delta, 10) << ", growth ["
                      << to_string(rates_.growth.front(), 10) << ", "
                      << to_string(rates_.growth.back(), 10) << "], "
                      << numeric_kind_name(numeric_kind_of<Real>()) << " precision\n";
            std::cerr << "[model] Effects " << effects_model_to_string(opts.effects)
                      << ": P(neutral)=" << to_string(effects_.probability_neutral(), 6)
                      << " P(deleterious)/P(advantageous)="
                      << effects_.deleterious_to_advantageous() << "\n";
        }
    }

    Model(const Model&) = delete;
    Model& operator=(const Model&) = delete;

    const Rates<Real>& rates() const { return rates_; }
    const EffectsDistribution<Real>& effects() const { return effects_; }
    const Generator<Real>& generator() const { return generator_; }
    const std::vector<Real>& initial() const { return initial_; }

private:
    Rates<Real> rates_;
    EffectsDistribution<Real> effects_;
    Generator<Real> generator_;
    std::vector<Real> initial_;
};

}  // namespace cli
}  // namespace mutsel

#endif  // MUTSEL_CLI_MODEL_HPP
