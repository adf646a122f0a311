#pragma once
// Initial class frequencies and mutation-effect distributions.
//
// Normal and Gamma interval masses are evaluated in double and converted to
// the working representation afterwards. Masses that are positive in exact
// arithmetic but underflow to zero in double are counted and reported on
// std::cerr; the resulting distribution is still usable.

#include "mutsel/errors.hpp"
#include "mutsel/log_utils.hpp"
#include "mutsel/precision.hpp"
#include "mutsel/rates.hpp"

#include <cmath>
#include <cstddef>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace mutsel {

// Interval masses in double plus the number that underflowed to zero.
struct ClassMasses {
    std::vector<double> mass;
    size_t underflowed = 0;
};

// Discretized Normal(mean, sd) over class centers with bin width `delta`.
// Classes more than `crop` standard deviations from the mean get zero mass.
// density=true uses pdf(x) * delta, otherwise CDF differences over
// [x - delta/2, x + delta/2] (upper-tail differences above the mean).
ClassMasses normal_class_masses(const std::vector<double>& centers, double delta,
                                double mean, double sd, double crop, bool density);

// Masses of a zero-mean Normal over effects j * delta, j = 0..half-1.
// Index 0 is the zero bin, which holds 2 * (F(delta/2) - F(0)).
ClassMasses half_normal_effect_masses(size_t half, double delta, double sd, bool density);

// Masses of Gamma(shape, rate) over effects j * delta, j = 0..half-1.
// Index 0 holds the mass of (0, delta/2].
ClassMasses half_gamma_effect_masses(size_t half, double delta, double shape, double rate);

namespace detail {

inline void report_underflow(const ClassMasses& masses, const char* what) {
    if (masses.underflowed == 0) return;
    log_utils::warn("distributions", std::to_string(masses.underflowed) + " of " +
                                         std::to_string(masses.mass.size()) + " " + what +
                                         " masses underflowed to zero in double precision");
}

template <typename Real>
void normalize_in_place(std::vector<Real>& values, const char* what) {
    const Real total = accurate_sum(values);
    if (!(total > 0)) {
        throw InvalidArgument(std::string(what) + ": distribution has no mass to normalize");
    }
    for (Real& v : values) v /= total;
}

}  // namespace detail

// Unit mass on one class.
template <typename Real>
std::vector<Real> point_frequencies(const Rates<Real>& rates, size_t index) {
    if (index >= rates.n_classes) {
        throw InvalidArgument("point_frequencies: class " + std::to_string(index) +
                              " outside lattice of " + std::to_string(rates.n_classes));
    }
    std::vector<Real> freq(rates.n_classes, Real(0));
    freq[index] = Real(1);
    return freq;
}

template <typename Real>
std::vector<Real> gaussian_frequencies(const Rates<Real>& rates, double mean = 0.044,
                                       double sd = 0.005, double crop = 11.2,
                                       bool density = true) {
    if (sd < 0.0) throw InvalidArgument("gaussian_frequencies: negative standard deviation");
    if (!(crop > 0.0)) throw InvalidArgument("gaussian_frequencies: crop must be positive");
    const std::vector<double> centers = convert_vector<double>(rates.growth);
    if (mean < centers.front() || mean > centers.back()) {
        throw InvalidArgument("gaussian_frequencies: mean " + to_string(mean) +
                              " outside the fitness lattice [" + to_string(centers.front()) +
                              ", " + to_string(centers.back()) + "]");
    }
    if (sd == 0.0) {
        size_t nearest = 0;
        for (size_t i = 1; i < centers.size(); ++i) {
            if (std::fabs(centers[i] - mean) < std::fabs(centers[nearest] - mean)) nearest = i;
        }
        return point_frequencies(rates, nearest);
    }

    const ClassMasses masses = normal_class_masses(centers, to_double(rates.delta), mean, sd,
                                                   crop, density);
    detail::report_underflow(masses, "initial class");
    std::vector<Real> freq = convert_vector<Real>(masses.mass);
    detail::normalize_in_place(freq, "gaussian_frequencies");
    return freq;
}

// Probability mass over the 2n-1 effect offsets of a Rates lattice.
template <typename Real>
class EffectsDistribution {
public:
    // No mutation: all mass on the zero effect.
    explicit EffectsDistribution(const Rates<Real>& rates)
        : effects_(rates.effects), p_(rates.effects.size(), Real(0)),
          delta_(rates.delta), zero_index_(rates.zero_effect_index()) {
        p_[zero_index_] = Real(1);
    }

    EffectsDistribution(const Rates<Real>& rates, std::vector<Real> masses)
        : effects_(rates.effects), p_(std::move(masses)),
          delta_(rates.delta), zero_index_(rates.zero_effect_index()) {
        if (p_.size() != effects_.size()) {
            throw InvalidArgument("EffectsDistribution: expected " +
                                  std::to_string(effects_.size()) + " masses, got " +
                                  std::to_string(p_.size()));
        }
        for (const Real& v : p_) {
            if (!is_finite(v) || v < 0) {
                throw InvalidArgument("EffectsDistribution: masses must be finite and non-negative");
            }
        }
    }

    static EffectsDistribution point_mass(const Rates<Real>& rates) {
        return EffectsDistribution(rates);
    }

    static EffectsDistribution symmetric_gaussian(const Rates<Real>& rates, double sd,
                                                  bool density = false, bool normed = true) {
        if (!(sd > 0.0)) {
            throw InvalidArgument("symmetric_gaussian: standard deviation must be positive");
        }
        const ClassMasses half = half_normal_effect_masses(rates.n_classes,
                                                           to_double(rates.delta), sd, density);
        detail::report_underflow(half, "Gaussian effect");
        return reflect(rates, half.mass, 1.0, 1.0, normed);
    }

    // Gamma-distributed advantageous effects weighted by `weight`, reflected
    // onto the deleterious side with weight 1 - weight.
    static EffectsDistribution weighted_double_gamma(const Rates<Real>& rates,
                                                     double shape = 0.5, double rate = 500.0,
                                                     double weight = 1e-3, bool normed = true) {
        if (weight < 0.0 || weight > 1.0) {
            throw InvalidArgument("weighted_double_gamma: weight " + to_string(weight) +
                                  " outside [0, 1]");
        }
        if (!(shape > 0.0) || !(rate > 0.0)) {
            throw InvalidArgument("weighted_double_gamma: shape and rate must be positive");
        }
        const ClassMasses half = half_gamma_effect_masses(rates.n_classes,
                                                          to_double(rates.delta), shape, rate);
        detail::report_underflow(half, "Gamma effect");
        return reflect(rates, half.mass, 1.0 - weight, weight, normed);
    }

    // Per-genome mutation probability `mutations`, split over 2^log2_loci
    // independent loci and recombined by repeated self-convolution.
    void apply_mutation_rate(double mutations, unsigned log2_loci = 0,
                             bool discard_excess = false) {
        Real mu(mutations);
        scale_by_power_of_two(mu, -static_cast<long>(log2_loci));
        if (mu < 0 || mu > 1) {
            throw InvalidArgument("apply_mutation_rate: per-locus mutation probability " +
                                  to_string(mu) + " outside [0, 1]");
        }
        for (Real& v : p_) v *= mu;
        p_[zero_index_] += Real(1) - mu;
        for (unsigned k = 0; k < log2_loci; ++k) {
            p_ = convolve(p_, discard_excess);
            if (discard_excess) normalize();
        }
    }

    // Convolution of x (length 2n-1) with this distribution, cut back to the
    // length of x. Mass beyond either end is added to the end bins unless
    // discarded.
    std::vector<Real> convolve(const std::vector<Real>& x, bool discard_excess = false) const {
        const size_t m = p_.size();
        const size_t h = zero_index_;
        const size_t full_len = x.size() + m - 1;
        std::vector<Real> full(full_len, Real(0));
        for (size_t i = 0; i < x.size(); ++i) {
            if (x[i] == 0) continue;
            for (size_t j = 0; j < m; ++j) full[i + j] += x[i] * p_[j];
        }
        if (!discard_excess) {
            full[h] += accurate_sum(full.begin(), full.begin() + static_cast<long>(h));
            full[full_len - h - 1] += accurate_sum(full.end() - static_cast<long>(h), full.end());
        }
        return std::vector<Real>(full.begin() + static_cast<long>(h),
                                 full.end() - static_cast<long>(h));
    }

    void normalize() { detail::normalize_in_place(p_, "EffectsDistribution"); }

    // Zero every mass below theta.
    void threshold(const Real& theta, bool normed = true) {
        for (Real& v : p_) {
            if (v < theta) v = Real(0);
        }
        if (normed) normalize();
    }

    Real total() const { return accurate_sum(p_); }
    Real probability_neutral() const { return p_[zero_index_]; }
    Real probability_deleterious() const {
        return accurate_sum(p_.begin(), p_.begin() + static_cast<long>(zero_index_));
    }
    Real probability_advantageous() const {
        return accurate_sum(p_.begin() + static_cast<long>(zero_index_) + 1, p_.end());
    }
    double deleterious_to_advantageous() const {
        const double adv = to_double(probability_advantageous());
        const double del = to_double(probability_deleterious());
        if (adv == 0.0) return del == 0.0 ? 0.0 : std::numeric_limits<double>::infinity();
        return del / adv;
    }

    Real mean() const { return Real(accurate_dot(p_, effects_) / total()); }
    Real variance() const {
        std::vector<Real> squares(effects_.size());
        for (size_t k = 0; k < effects_.size(); ++k) squares[k] = effects_[k] * effects_[k];
        const Real m = mean();
        return Real(accurate_dot(p_, squares) / total() - m * m);
    }

    size_t size() const { return p_.size(); }
    size_t n_classes() const { return zero_index_ + 1; }
    size_t zero_index() const { return zero_index_; }
    const Real& delta() const { return delta_; }
    const Real& operator[](size_t k) const { return p_[k]; }
    const std::vector<Real>& masses() const { return p_; }
    const std::vector<Real>& effects() const { return effects_; }

private:
    static EffectsDistribution reflect(const Rates<Real>& rates, const std::vector<double>& half,
                                       double deleterious_weight, double advantageous_weight,
                                       bool normed) {
        EffectsDistribution out(rates);
        const size_t zero = out.zero_index_;
        out.p_[zero] = Real(half[0]);
        for (size_t j = 1; j < half.size(); ++j) {
            out.p_[zero + j] = Real(Real(half[j]) * Real(advantageous_weight));
            out.p_[zero - j] = Real(Real(half[j]) * Real(deleterious_weight));
        }
        if (normed) out.normalize();
        return out;
    }

    std::vector<Real> effects_;
    std::vector<Real> p_;
    Real delta_;
    size_t zero_index_;
};

}  // namespace mutsel
