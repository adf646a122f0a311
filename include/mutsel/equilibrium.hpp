#pragma once
// Dominant eigenpair of the generator: the equilibrium class distribution.
//
// Three stages:
//   1. bootstrap: dense eigendecomposition of the double image of W, or a
//      seeded random non-negative vector when that is unusable,
//   2. shifted power iteration v <- W v + s v with power-of-two rescaling,
//      scored every block by the Rayleigh quotient and the eigen error,
//   3. inverse power refinement (double only) solving (W - lambda I) v' = v.
// The best vector seen is kept throughout and its error is always reported.
//
// Eigen error: max_i |(lambda v_i - (W v)_i) / (W v)_i| with 0/0 = 0 and
// x/0 = inf.

#include "mutsel/errors.hpp"
#include "mutsel/generator.hpp"
#include "mutsel/log_utils.hpp"
#include "mutsel/matrix.hpp"
#include "mutsel/precision.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <functional>
#include <iostream>
#include <limits>
#include <random>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace mutsel {

// Power iteration rescales early when the largest exponent drifts this far
// from the safe exponent.
constexpr long kExponentWindow = 256;

struct PowerIterationDiagnostics {
    size_t iteration = 0;
    double eigenvalue = 0.0;
    double error = std::numeric_limits<double>::infinity();
    bool improved = false;
};

struct InversePowerDiagnostics {
    unsigned step = 0;
    double shift = 0.0;               // eigenvalue subtracted from the diagonal
    double eigenvalue = 0.0;
    double error = std::numeric_limits<double>::infinity();
    bool improved = false;
};

struct EquilibriumParams {
    bool bootstrap = true;            // start from a dense eigendecomposition
    uint64_t seed = 42;               // random start when bootstrap is off or fails
    size_t max_iterations = 100000;   // power iterations, across all blocks
    size_t block_size = 1000;         // iterations between rescale + error check
    double tolerance = 1e-14;         // stop once the eigen error drops below
    double shift = 1.0;               // s in v <- W v + s v
    long safe_exponent = 0;           // binary exponent the iterate is rescaled to
    unsigned inverse_power_iterations = 5;
    int num_threads = 0;              // 0 = OpenMP default
    bool verbose = false;
    std::function<void(const PowerIterationDiagnostics&)> progress;
    std::function<void(const InversePowerDiagnostics&)> refinement_progress;
};

template <typename Real>
struct EigenPair {
    Real value{0};
    std::vector<Real> vector;         // sums to one
    double error = std::numeric_limits<double>::infinity();
    size_t iterations = 0;            // power iterations to reach `vector`
    bool converged = false;
    bool bootstrapped = false;
    bool refined = false;             // inverse power improved on power iteration

    template <typename To>
    EigenPair<To> convert() const {
        EigenPair<To> out;
        out.value = type_convert<To>(value);
        out.vector = convert_vector<To>(vector);
        out.error = error;
        out.iterations = iterations;
        out.converged = converged;
        out.bootstrapped = bootstrapped;
        out.refined = refined;
        return out;
    }
};

template <typename Real>
struct RayleighEstimate {
    Real value{0};
    double error = std::numeric_limits<double>::infinity();
};

template <typename Real>
double eigen_error(const std::vector<Real>& Wv, const std::vector<Real>& v, const Real& lambda) {
    double worst = 0.0;
    for (size_t i = 0; i < v.size(); ++i) {
        const Real residual = lambda * v[i] - Wv[i];
        double e;
        if (Wv[i] == 0) {
            e = residual == 0 ? 0.0 : std::numeric_limits<double>::infinity();
        } else {
            e = std::fabs(to_double(Real(residual / Wv[i])));
        }
        if (std::isnan(e)) return e;
        worst = std::max(worst, e);
    }
    return worst;
}

// Rayleigh quotient v.Wv / v.v and the eigen error of (quotient, v).
template <typename Real>
RayleighEstimate<Real> rayleigh(const Matrix<Real>& W, const std::vector<Real>& v,
                                int num_threads = 0) {
    std::vector<Real> x = v;
    rebias_exponent(x, 0);
    std::vector<Real> Wx;
    W.multiply(x, Wx, num_threads);
    RayleighEstimate<Real> out;
    const Real norm = accurate_dot(x, x);
    if (!(norm > 0)) return out;
    out.value = Real(accurate_dot(x, Wx) / norm);
    out.error = eigen_error(Wx, x, out.value);
    return out;
}

namespace detail {

template <typename Real>
std::vector<Real> normalized_copy(const std::vector<Real>& v) {
    std::vector<Real> out = v;
    const Real total = accurate_sum(out);
    if (total == 0 || !is_finite(total)) return out;
    for (Real& x : out) x /= total;
    return out;
}

template <typename Real>
Eigen::MatrixXd to_eigen(const Matrix<Real>& W) {
    Eigen::MatrixXd A(W.rows(), W.cols());
    for (size_t i = 0; i < W.rows(); ++i) {
        for (size_t j = 0; j < W.cols(); ++j) {
            A(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = to_double(W(i, j));
        }
    }
    return A;
}

// Solve (A - lambda I) x = b; singular or non-finite solves throw.
inline Eigen::VectorXd solve_shifted(const Eigen::MatrixXd& A, double lambda,
                                     const Eigen::VectorXd& b) {
    Eigen::MatrixXd shifted = A;
    shifted.diagonal().array() -= lambda;
    const Eigen::PartialPivLU<Eigen::MatrixXd> lu(shifted);
    if ((lu.matrixLU().diagonal().array() == 0.0).any()) {
        throw NumericDegeneracy("shifted generator is singular at lambda = " + to_string(lambda));
    }
    Eigen::VectorXd x = lu.solve(b);
    if (!x.allFinite()) {
        throw NumericDegeneracy("inverse power solve produced non-finite values");
    }
    return x;
}

}  // namespace detail

// Starting vector for power iteration. Sets `bootstrapped` when the dense
// eigendecomposition supplied it.
template <typename Real>
std::vector<Real> bootstrap_vector(const Matrix<Real>& W, const EquilibriumParams& params,
                                   bool& bootstrapped) {
    const size_t n = W.rows();
    bootstrapped = false;
    if (params.bootstrap) {
        const Eigen::MatrixXd A = detail::to_eigen(W);
        if (A.allFinite()) {
            const Eigen::EigenSolver<Eigen::MatrixXd> solver(A, true);
            if (solver.info() == Eigen::Success) {
                Eigen::Index best = 0;
                solver.eigenvalues().real().maxCoeff(&best);
                const Eigen::VectorXd vec = solver.eigenvectors().col(best).real();
                std::vector<double> v(vec.data(), vec.data() + vec.size());
                const double total = accurate_sum(v);
                if (std::isfinite(total) && total != 0.0) {
                    for (double& x : v) x /= total;
                    bootstrapped = true;
                    return convert_vector<Real>(v);
                }
            }
        }
        if (params.verbose) {
            std::cerr << "[equilibrium] Bootstrap eigenvector unusable, starting from a random vector\n";
        }
    }
    std::mt19937_64 rng(params.seed);
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    std::vector<double> v(n);
    for (double& x : v) x = uniform(rng);
    const double total = accurate_sum(v);
    for (double& x : v) x /= total;
    return convert_vector<Real>(v);
}

template <typename Real>
EigenPair<Real> power_iteration(const Matrix<Real>& W, std::vector<Real> v,
                                const EquilibriumParams& params) {
    if (!W.square() || W.rows() == 0) {
        throw InvalidArgument("power_iteration: generator must be a non-empty square matrix");
    }
    if (v.size() != W.rows()) {
        throw InvalidArgument("power_iteration: start vector has " + std::to_string(v.size()) +
                              " entries, expected " + std::to_string(W.rows()));
    }
    if (params.block_size == 0) {
        throw InvalidArgument("power_iteration: block_size must be positive");
    }

    const long safe = params.safe_exponent;
    rebias_exponent(v, safe);

    EigenPair<Real> best;
    {
        const RayleighEstimate<Real> start = rayleigh(W, v, params.num_threads);
        best.value = start.value;
        best.error = start.error;
        best.vector = detail::normalized_copy(v);
    }
    if (best.error < params.tolerance) {
        best.converged = true;
        return best;
    }

    const Real shift(params.shift);
    const bool shifted = params.shift != 0.0;
    std::vector<Real> next;
    size_t done = 0;
    while (done < params.max_iterations) {
        const size_t block = std::min(params.block_size, params.max_iterations - done);
        for (size_t k = 0; k < block; ++k) {
            W.multiply(v, next, params.num_threads);
            if (shifted) {
                for (size_t i = 0; i < v.size(); ++i) next[i] += shift * v[i];
            }
            v.swap(next);
            Real largest(0);
            for (const Real& x : v) {
                const Real a = real_abs(x);
                if (a > largest) largest = a;
            }
            if (largest != 0 && is_finite(largest)) {
                const long e = exponent_of(largest);
                if (e > safe + kExponentWindow || e < safe - kExponentWindow) {
                    rebias_exponent(v, safe);
                }
            }
        }
        done += block;
        rebias_exponent(v, safe);

        const RayleighEstimate<Real> estimate = rayleigh(W, v, params.num_threads);
        const bool improved = estimate.error < best.error;
        if (improved) {
            best.value = estimate.value;
            best.error = estimate.error;
            best.vector = detail::normalized_copy(v);
            best.iterations = done;
        }
        if (params.progress) {
            PowerIterationDiagnostics diag;
            diag.iteration = done;
            diag.eigenvalue = to_double(estimate.value);
            diag.error = estimate.error;
            diag.improved = improved;
            params.progress(diag);
        }
        if (params.verbose) {
            std::cerr << "[equilibrium] Iteration " << done
                      << ": eigenvalue=" << to_string(estimate.value, 17)
                      << " error=" << estimate.error << "\n";
        }
        if (estimate.error < params.tolerance) break;
        if (std::isnan(estimate.error)) {
            log_utils::warn("equilibrium", "power iteration produced non-finite values after " +
                                               std::to_string(done) + " iterations");
            break;
        }
    }
    best.converged = best.error < params.tolerance;
    return best;
}

// Inverse power refinement of `start`. Only strict improvements of the eigen
// error replace the result. A singular shifted system ends the refinement with
// a warning. Arbitrary-precision pairs are returned unchanged.
template <typename Real>
EigenPair<Real> inverse_power(const Matrix<Real>& W, const EigenPair<Real>& start,
                              const EquilibriumParams& params) {
    if constexpr (!std::is_same_v<Real, double>) {
        if (params.verbose && params.inverse_power_iterations > 0) {
            std::cerr << "[equilibrium] Inverse power refinement runs in fixed precision only, skipped\n";
        }
        return start;
    } else {
        EigenPair<double> best = start;
        if (params.inverse_power_iterations == 0 || best.vector.empty()) return best;

        const Eigen::MatrixXd A = detail::to_eigen(W);
        Eigen::VectorXd v = Eigen::Map<const Eigen::VectorXd>(
            best.vector.data(), static_cast<Eigen::Index>(best.vector.size()));
        double lambda = best.value;
        for (unsigned it = 0; it < params.inverse_power_iterations; ++it) {
            Eigen::VectorXd x;
            try {
                x = detail::solve_shifted(A, lambda, v);
            } catch (const NumericDegeneracy& e) {
                log_utils::warn("equilibrium", std::string("inverse power stopped: ") + e.what());
                break;
            }
            std::vector<double> candidate(x.data(), x.data() + x.size());
            const double total = accurate_sum(candidate);
            if (!std::isfinite(total) || total == 0.0) {
                log_utils::warn("equilibrium", "inverse power iterate has no usable mass");
                break;
            }
            for (double& c : candidate) c /= total;

            const RayleighEstimate<double> estimate = rayleigh(W, candidate, params.num_threads);
            if (params.verbose) {
                std::cerr << "[equilibrium] Inverse power step " << (it + 1)
                          << ": eigenvalue=" << to_string(estimate.value)
                          << " error=" << estimate.error << "\n";
            }
            const bool improved = estimate.error < best.error;
            if (params.refinement_progress) {
                InversePowerDiagnostics diag;
                diag.step = it + 1;
                diag.shift = lambda;
                diag.eigenvalue = estimate.value;
                diag.error = estimate.error;
                diag.improved = improved;
                params.refinement_progress(diag);
            }
            // The shift follows the best eigenvalue; the iterate always advances.
            if (improved) {
                best.value = estimate.value;
                best.error = estimate.error;
                best.vector = candidate;
                best.refined = true;
                lambda = estimate.value;
            }
            v = Eigen::Map<const Eigen::VectorXd>(candidate.data(),
                                                  static_cast<Eigen::Index>(candidate.size()));
        }
        best.converged = best.error < params.tolerance;
        return best;
    }
}

template <typename Real>
EigenPair<Real> equilibrium(const Matrix<Real>& W, const EquilibriumParams& params = {}) {
    const auto t0 = std::chrono::steady_clock::now();
    bool bootstrapped = false;
    std::vector<Real> start = bootstrap_vector(W, params, bootstrapped);
    EigenPair<Real> result = power_iteration(W, std::move(start), params);
    result.bootstrapped = bootstrapped;
    result = inverse_power(W, result, params);

    if (!result.converged) {
        log_utils::warn("equilibrium", "tolerance " + to_string(params.tolerance, 3) +
                                           " not reached, achieved error " +
                                           to_string(result.error, 6));
    }
    if (params.verbose) {
        const auto t1 = std::chrono::steady_clock::now();
        std::cerr << "[equilibrium] eigenvalue=" << to_string(result.value, 17)
                  << " error=" << result.error
                  << " iterations=" << result.iterations
                  << (result.refined ? " (refined)" : "")
                  << " in " << log_utils::format_elapsed(t0, t1) << "\n";
    }
    return result;
}

template <typename Real>
EigenPair<Real> equilibrium(const Generator<Real>& generator, const EquilibriumParams& params = {}) {
    return equilibrium(generator.dense(), params);
}

}  // namespace mutsel
