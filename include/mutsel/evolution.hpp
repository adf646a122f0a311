#pragma once
// Frequency evolution under the generator.
//
// Population owns one frequency vector P and advances it one year at a time
// with the discrete update of the generator. P is kept at a comfortable
// magnitude by exact power-of-two rescaling; the cumulative scale is tracked
// in log_scalar so the true frequencies are P * 2^-log_scalar.
//
// Evolution drives a Population epoch by epoch (rescale, integrate, record)
// and keeps the per-epoch snapshots, sums and log-scalars.

#include "mutsel/equilibrium.hpp"
#include "mutsel/errors.hpp"
#include "mutsel/generator.hpp"
#include "mutsel/log_utils.hpp"
#include "mutsel/matrix.hpp"
#include "mutsel/precision.hpp"
#include "mutsel/statistics.hpp"

#include <boost/numeric/odeint.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace mutsel {

enum class ThresholdNorm : uint8_t {
    NONE = 0,   // no thresholding
    SUM = 1,    // cutoff relative to sum(P)
    MAX = 2     // cutoff relative to max(P)
};

inline const char* threshold_norm_name(ThresholdNorm norm) {
    switch (norm) {
        case ThresholdNorm::SUM: return "sum";
        case ThresholdNorm::MAX: return "max";
        default: return "none";
    }
}

inline ThresholdNorm parse_threshold_norm(const std::string& name) {
    if (name == "none") return ThresholdNorm::NONE;
    if (name == "sum") return ThresholdNorm::SUM;
    if (name == "max") return ThresholdNorm::MAX;
    throw InvalidArgument("unknown threshold norm '" + name + "' (expected none, sum or max)");
}

struct PopulationParams {
    unsigned steps_per_year = 1;            // discrete sub-steps per year, h = 1/steps
    ThresholdNorm norm = ThresholdNorm::NONE;
    double threshold = 0.0;                 // P[i] <= threshold * norm(P) is set to zero
    bool zero_forever = false;              // zeroed classes never recover (needs a norm)
    bool track_support = false;             // step only the non-zero interval (zero_forever)
    long target_exponent = 512;             // binary exponent of max(P) after rebias()
};

// Selection and mutation contributions to d(mean growth)/dt.
template <typename Real>
struct FitnessChange {
    Real selection{0};   // variance of growth
    Real mutation{0};    // covariance of net mutational births with growth
};

template <typename Real>
class Population {
public:
    Population(const Generator<Real>& generator, std::vector<Real> initial,
               PopulationParams params = {})
        : generator_(&generator), params_(params), P_(std::move(initial)) {
        if (P_.size() != generator.size()) {
            throw InvalidArgument("Population: initial distribution has " +
                                  std::to_string(P_.size()) + " classes, generator has " +
                                  std::to_string(generator.size()));
        }
        for (const Real& x : P_) {
            if (!is_finite(x) || x < 0) {
                throw InvalidArgument("Population: initial frequencies must be finite and non-negative");
            }
        }
        if (params_.steps_per_year == 0) {
            throw InvalidArgument("Population: steps_per_year must be positive");
        }
        if (params_.threshold < 0.0) {
            throw InvalidArgument("Population: threshold must be non-negative");
        }
        if (params_.zero_forever && params_.norm == ThresholdNorm::NONE) {
            throw InvalidArgument("Population: zero_forever needs a threshold norm");
        }
        if (params_.track_support && !params_.zero_forever) {
            throw ConfigurationConflict("Population: track_support requires zero_forever");
        }
        step_ = Real(1) / Real(static_cast<unsigned long>(params_.steps_per_year));
        zeroed_.assign(P_.size(), 0);
        included_ = ClassRange{0, P_.size()};
    }

    // Rescale P by 2^k so max(P) has the target exponent; returns k.
    long rebias() {
        const long k = rebias_exponent(P_, params_.target_exponent);
        log_scalar_ += k;
        return k;
    }

    bool thresholding() const { return params_.norm != ThresholdNorm::NONE; }

    void apply_threshold() {
        if (!thresholding()) return;
        Real reference(0);
        if (params_.norm == ThresholdNorm::SUM) {
            reference = accurate_sum(P_);
        } else {
            for (const Real& x : P_) {
                if (x > reference) reference = x;
            }
        }
        const Real cutoff = Real(params_.threshold) * reference;
        for (size_t i = 0; i < P_.size(); ++i) {
            if (zeroed_[i] || P_[i] <= cutoff) {
                P_[i] = Real(0);
                if (params_.zero_forever) zeroed_[i] = 1;
            }
        }
        if (params_.track_support) {
            const ClassRange support = support_range(P_);
            included_.begin = std::max(included_.begin, support.begin);
            included_.end = std::min(included_.end, support.end);
            if (included_.end < included_.begin) included_.end = included_.begin;
        }
    }

    // One discrete sub-step of length 1/steps_per_year, then thresholding.
    void euler_step() {
        if (params_.track_support) {
            if (included_.empty()) return;
            generator_->step(P_, step_, included_);
        } else {
            generator_->step(P_, step_);
        }
        if (params_.zero_forever) {
            for (size_t i = 0; i < P_.size(); ++i) {
                if (zeroed_[i]) P_[i] = Real(0);
            }
        }
        apply_threshold();
    }

    void annual_update() {
        if (params_.zero_forever) apply_threshold();
        for (unsigned s = 0; s < params_.steps_per_year; ++s) euler_step();
    }

    // Sum of the (scaled) frequency vector.
    Real size() const { return accurate_sum(P_); }

    // Scale P to sum one and reset log_scalar.
    void normalize() {
        const Real total = size();
        if (!(total > 0)) throw InvalidArgument("Population::normalize: population is empty");
        for (Real& x : P_) x /= total;
        log_scalar_ = 0;
    }

    // Multiply P by 2^k and record it in log_scalar.
    void scale(long k) {
        scale_by_power_of_two(P_, k);
        log_scalar_ += k;
    }

    // Move the distribution k classes up (k > 0) or down (k < 0). Vacated
    // classes are empty; mass moved off the lattice is dropped. Zeroed-forever
    // marks move with their classes.
    void shift(long k) {
        const size_t n = P_.size();
        const size_t offset = static_cast<size_t>(k < 0 ? -k : k);
        if (k == 0) return;
        if (offset >= n) {
            std::fill(P_.begin(), P_.end(), Real(0));
            std::fill(zeroed_.begin(), zeroed_.end(), uint8_t(0));
        } else if (k > 0) {
            std::copy_backward(P_.begin(), P_.end() - offset, P_.end());
            std::fill(P_.begin(), P_.begin() + offset, Real(0));
            std::copy_backward(zeroed_.begin(), zeroed_.end() - offset, zeroed_.end());
            std::fill(zeroed_.begin(), zeroed_.begin() + offset, uint8_t(0));
        } else {
            std::copy(P_.begin() + offset, P_.end(), P_.begin());
            std::fill(P_.end() - offset, P_.end(), Real(0));
            std::copy(zeroed_.begin() + offset, zeroed_.end(), zeroed_.begin());
            std::fill(zeroed_.end() - offset, zeroed_.end(), uint8_t(0));
        }
        if (params_.track_support) included_ = support_range(P_);
    }

    std::vector<Real> normalized() const {
        std::vector<Real> out = P_;
        const Real total = size();
        if (total == 0 || !is_finite(total)) return out;
        for (Real& x : out) x /= total;
        return out;
    }

    // Mean and variance of growth over the class distribution. `effective`
    // uses the growth rates realized by the discrete update.
    std::pair<Real, Real> mean_and_variance(bool effective = false) const {
        if (effective) {
            const std::vector<Real> g = convert_vector<Real>(
                generator_->effective_growth(params_.steps_per_year));
            return mutsel::mean_and_variance(P_, g);
        }
        return mutsel::mean_and_variance(P_, generator_->growth());
    }

    // d(mean growth)/dt = variance + mutation term, with the mutation term
    // sum_i (births_of(P)_i - births_to(P)_i) (m_i - mean) / sum(P).
    FitnessChange<Real> fundamental_theorem_terms() const {
        const std::vector<Real> m = generator_->growth();
        const auto moments = mutsel::mean_and_variance(P_, m);
        std::vector<Real> received;
        std::vector<Real> given;
        generator_->births_of(P_, received);
        generator_->births_to(P_, given);
        std::vector<Real> net(P_.size());
        std::vector<Real> centered(P_.size());
        for (size_t i = 0; i < P_.size(); ++i) {
            net[i] = received[i] - given[i];
            centered[i] = m[i] - moments.first;
        }
        FitnessChange<Real> out;
        out.selection = moments.second;
        out.mutation = Real(accurate_dot(net, centered) / size());
        return out;
    }

    // Equilibrium of the current generator, computed once.
    const EigenPair<Real>& equilibrium(const EquilibriumParams& params = {}) {
        if (!equilibrium_) equilibrium_ = mutsel::equilibrium(*generator_, params);
        return *equilibrium_;
    }

    void set_generator(const Generator<Real>& generator) {
        if (generator.size() != P_.size()) {
            throw InvalidArgument("Population::set_generator: generator has " +
                                  std::to_string(generator.size()) + " classes, population " +
                                  std::to_string(P_.size()));
        }
        generator_ = &generator;
        equilibrium_.reset();
    }

    // Replace P without touching log_scalar.
    void set_frequencies(std::vector<Real> P) {
        if (P.size() != P_.size()) {
            throw InvalidArgument("Population::set_frequencies: length " +
                                  std::to_string(P.size()) + ", expected " +
                                  std::to_string(P_.size()));
        }
        P_ = std::move(P);
    }

    size_t n_classes() const { return P_.size(); }
    const std::vector<Real>& frequencies() const { return P_; }
    long log_scalar() const { return log_scalar_; }
    const ClassRange& included() const { return included_; }
    bool zeroed(size_t i) const { return zeroed_[i] != 0; }
    const Generator<Real>& generator() const { return *generator_; }
    const PopulationParams& params() const { return params_; }

private:
    const Generator<Real>* generator_;
    PopulationParams params_;
    std::vector<Real> P_;
    Real step_{1};
    long log_scalar_ = 0;
    std::vector<uint8_t> zeroed_;
    ClassRange included_;
    std::optional<EigenPair<Real>> equilibrium_;
};

struct EvolutionParams {
    unsigned years_per_epoch = 1;
    size_t class_stride = 1;           // record every k-th class
    bool use_ode_solver = false;       // adaptive Dormand-Prince instead of Euler
    double ode_abs_tol = 1e-11;
    double ode_rel_tol = 1e-13;
    double ode_initial_step = 1.0 / 128.0;
    bool verbose = false;
    size_t progress_interval = 100;    // epochs between progress lines
};

struct MeanVarianceSeries {
    std::vector<double> mean;
    std::vector<double> variance;
};

template <typename Real>
class Evolution {
public:
    // Records the population's current state as epoch 0.
    Evolution(Population<Real>& population, EvolutionParams params = {})
        : population_(population), params_(params) {
        if (params_.years_per_epoch == 0) {
            throw InvalidArgument("Evolution: years_per_epoch must be positive");
        }
        if (params_.class_stride == 0) {
            throw InvalidArgument("Evolution: class_stride must be positive");
        }
        if (params_.use_ode_solver) {
            if (population_.thresholding()) {
                throw ConfigurationConflict(
                    "Evolution: the adaptive ODE solver cannot be combined with thresholding");
            }
            if (!std::is_same_v<Real, double>) {
                throw ConfigurationConflict(
                    "Evolution: the adaptive ODE solver is only available in fixed precision");
            }
        }
        record();
    }

    void run(size_t n_epochs) {
        const auto t0 = std::chrono::steady_clock::now();
        for (size_t e = 0; e < n_epochs; ++e) {
            run_epoch();
            if (params_.verbose && params_.progress_interval > 0 &&
                (e + 1) % params_.progress_interval == 0) {
                std::cerr << "[evolve] Epoch " << (e + 1) << "/" << n_epochs
                          << ": sum=" << sums_.back()
                          << " log_scalar=" << log_scalars_.back() << "\n";
            }
        }
        if (params_.verbose) {
            const auto t1 = std::chrono::steady_clock::now();
            std::cerr << "[evolve] " << n_epochs << " epochs ("
                      << (static_cast<size_t>(params_.years_per_epoch) * n_epochs)
                      << " years) in " << log_utils::format_elapsed(t0, t1) << "\n";
        }
    }

    void run_epoch() {
        population_.rebias();
        if (params_.use_ode_solver) {
            integrate_adaptive();
        } else {
            for (unsigned y = 0; y < params_.years_per_epoch; ++y) population_.annual_update();
        }
        record();
    }

    // Rows recorded, including the initial state.
    size_t size() const { return sums_.size(); }
    size_t n_years() const {
        return (sums_.size() - 1) * static_cast<size_t>(params_.years_per_epoch);
    }

    const std::vector<std::vector<double>>& trajectory() const { return trajectory_; }
    const std::vector<double>& sums() const { return sums_; }
    const std::vector<long>& log_scalars() const { return log_scalars_; }
    const EvolutionParams& params() const { return params_; }
    const Population<Real>& population() const { return population_; }

    // Last epoch before the first NaN, infinite or zero sum; empty when
    // already the initial state is unusable.
    std::optional<size_t> last_valid_epoch() const {
        for (size_t k = 0; k < sums_.size(); ++k) {
            if (!std::isfinite(sums_[k]) || sums_[k] == 0.0) {
                if (k == 0) return std::nullopt;
                return k - 1;
            }
        }
        return sums_.size() - 1;
    }

    // Snapshots divided by their epoch sums.
    std::vector<std::vector<double>> normalized() const {
        std::vector<std::vector<double>> out(trajectory_.size());
        for (size_t k = 0; k < trajectory_.size(); ++k) {
            out[k] = trajectory_[k];
            for (double& x : out[k]) x /= sums_[k];
        }
        return out;
    }

    // Growth rates of the recorded classes.
    std::vector<double> growth(bool effective = false) const {
        const std::vector<double> full =
            effective ? population_.generator().effective_growth(population_.params().steps_per_year)
                      : convert_vector<double>(population_.generator().growth());
        return stride(full);
    }

    MeanVarianceSeries mean_and_variance(bool effective = false) const {
        const std::vector<double> g = growth(effective);
        MeanVarianceSeries out;
        out.mean.reserve(trajectory_.size());
        out.variance.reserve(trajectory_.size());
        const double nan = std::numeric_limits<double>::quiet_NaN();
        for (const std::vector<double>& row : trajectory_) {
            const double total = accurate_sum(row);
            if (!std::isfinite(total) || total == 0.0) {
                out.mean.push_back(nan);
                out.variance.push_back(nan);
                continue;
            }
            const auto mv = mutsel::mean_and_variance(row, g);
            out.mean.push_back(mv.first);
            out.variance.push_back(mv.second);
        }
        return out;
    }

    // Replace the record with an externally produced full-resolution
    // trajectory, down-sampled to the class stride.
    void set_trajectory(const std::vector<std::vector<double>>& full) {
        std::vector<std::vector<double>> rows;
        std::vector<double> sums;
        rows.reserve(full.size());
        sums.reserve(full.size());
        for (const std::vector<double>& row : full) {
            if (row.size() != population_.n_classes()) {
                throw InvalidArgument("Evolution::set_trajectory: row has " +
                                      std::to_string(row.size()) + " classes, expected " +
                                      std::to_string(population_.n_classes()));
            }
            sums.push_back(accurate_sum(row));
            rows.push_back(stride(row));
        }
        trajectory_ = std::move(rows);
        sums_ = std::move(sums);
        log_scalars_.assign(sums_.size(), 0);
    }

private:
    template <typename T>
    std::vector<double> stride(const std::vector<T>& full) const {
        std::vector<double> out;
        out.reserve(full.size() / params_.class_stride + 1);
        for (size_t i = 0; i < full.size(); i += params_.class_stride) {
            out.push_back(to_double(full[i]));
        }
        return out;
    }

    void record() {
        const std::vector<Real>& P = population_.frequencies();
        trajectory_.push_back(stride(P));
        sums_.push_back(to_double(accurate_sum(P)));
        log_scalars_.push_back(population_.log_scalar());
    }

    void integrate_adaptive() {
        if constexpr (std::is_same_v<Real, double>) {
            namespace odeint = boost::numeric::odeint;
            using State = std::vector<double>;
            const Generator<double>& generator = population_.generator();
            State x = population_.frequencies();
            auto stepper = odeint::make_controlled(params_.ode_abs_tol, params_.ode_rel_tol,
                                                   odeint::runge_kutta_dopri5<State>());
            odeint::integrate_adaptive(
                stepper,
                [&generator](const State& P, State& dPdt, double t) {
                    generator.derivative(t, P, dPdt);
                },
                x, 0.0, static_cast<double>(params_.years_per_epoch), params_.ode_initial_step);
            population_.set_frequencies(std::move(x));
        } else {
            throw ConfigurationConflict(
                "Evolution: the adaptive ODE solver is only available in fixed precision");
        }
    }

    Population<Real>& population_;
    EvolutionParams params_;
    std::vector<std::vector<double>> trajectory_;
    std::vector<double> sums_;
    std::vector<long> log_scalars_;
};

}  // namespace mutsel
