#pragma once
// Mutation kernel: effect distribution -> class transition matrix.
//
// Column j is the offspring-class distribution of a parent in class j:
//   K[i][j] = p[i - j + n - 1]
// i.e. offspring class i receives effect (i - j) * delta. Without `lossy`
// every column is renormalized to sum to one, so mutations pushing an
// offspring off the lattice are redistributed over the classes that remain;
// with `lossy` the raw window is kept and that mass is lost.

#include "mutsel/distributions.hpp"
#include "mutsel/errors.hpp"
#include "mutsel/matrix.hpp"
#include "mutsel/precision.hpp"

#include <cmath>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace mutsel {

constexpr double kColumnSumTolerance = 1e-12;

namespace detail {

template <typename Real>
void check_effect_length(const std::vector<Real>& p, size_t n, const char* who) {
    if (n == 0 || p.size() != 2 * n - 1) {
        throw InvalidArgument(std::string(who) + ": effect distribution has " +
                              std::to_string(p.size()) + " entries, expected 2n-1 = " +
                              std::to_string(n == 0 ? 0 : 2 * n - 1));
    }
}

// 1 / (column sum of the window) for each parent class.
template <typename Real>
std::vector<Real> column_scales(const std::vector<Real>& p, size_t n) {
    std::vector<Real> scales(n);
    for (size_t j = 0; j < n; ++j) {
        // Window for parent j covers p[n-1-j .. 2n-2-j].
        const auto first = p.begin() + static_cast<long>(n - 1 - j);
        const Real total = accurate_sum(first, first + static_cast<long>(n));
        if (!(total > 0)) {
            throw InvariantViolation("mutation kernel column " + std::to_string(j) +
                                     " has no mass inside the lattice");
        }
        scales[j] = Real(Real(1) / total);
    }
    return scales;
}

}  // namespace detail

template <typename Real>
Matrix<Real> build_kernel(const std::vector<Real>& p, size_t n, bool lossy = false) {
    detail::check_effect_length(p, n, "build_kernel");
    Matrix<Real> K(n, n);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) K(i, j) = p[i + n - 1 - j];
    }
    if (lossy) return K;

    const std::vector<Real> scales = detail::column_scales(p, n);
    for (size_t j = 0; j < n; ++j) {
        for (size_t i = 0; i < n; ++i) K(i, j) *= scales[j];
        const std::vector<Real> col = K.column(j);
        const double deviation = std::fabs(to_double(accurate_sum(col)) - 1.0);
        if (deviation > kColumnSumTolerance) {
            throw InvariantViolation("mutation kernel column " + std::to_string(j) +
                                     " sums to 1 + " + to_string(deviation) +
                                     " after renormalization");
        }
    }
    return K;
}

template <typename Real>
Matrix<Real> build_kernel(const EffectsDistribution<Real>& effects, bool lossy = false) {
    return build_kernel(effects.masses(), effects.n_classes(), lossy);
}

// Matrix-free K x as a windowed convolution, for lattices too large to hold
// K densely. Column renormalization is folded into per-column scales.
template <typename Real>
class KernelConvolution {
public:
    KernelConvolution(std::vector<Real> p, size_t n, bool lossy = false)
        : p_(std::move(p)), n_(n) {
        detail::check_effect_length(p_, n_, "KernelConvolution");
        scales_ = lossy ? std::vector<Real>(n_, Real(1)) : detail::column_scales(p_, n_);
    }

    size_t size() const { return n_; }
    const std::vector<Real>& scales() const { return scales_; }

    void apply(const std::vector<Real>& x, std::vector<Real>& out, int num_threads = 0) const {
        if (x.size() != n_) {
            throw InvalidArgument("KernelConvolution::apply: vector length " +
                                  std::to_string(x.size()) + ", expected " + std::to_string(n_));
        }
        std::vector<Real> scaled(n_);
        for (size_t j = 0; j < n_; ++j) scaled[j] = x[j] * scales_[j];
        out.resize(n_);
        const long n = static_cast<long>(n_);
#ifdef _OPENMP
        const int threads = num_threads > 0 ? num_threads : omp_get_max_threads();
        #pragma omp parallel for schedule(static) num_threads(threads) if (n_ >= kParallelRowThreshold)
#else
        (void)num_threads;
#endif
        for (long i = 0; i < n; ++i) {
            const Real* window = p_.data() + (static_cast<size_t>(i) + n_ - 1);
            Real acc(0);
            // window[-j] == p[i - j + n - 1]
            for (size_t j = 0; j < n_; ++j) acc += *(window - j) * scaled[j];
            out[static_cast<size_t>(i)] = acc;
        }
    }

private:
    std::vector<Real> p_;
    size_t n_;
    std::vector<Real> scales_;
};

}  // namespace mutsel
