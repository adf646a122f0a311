#pragma once
// Generator of the linear mutation-selection system dP/dt = W P with
//   W = K diag(birth) - death * I.
//
// The birthing part M = K diag(birth) is stored densely, or left implicit as
// a kernel convolution for very large lattices. The death rate is kept as a
// separate scalar, so W itself is never formed unless dense() is asked for.
// A Generator is immutable after construction apart from the sub-range block
// cache used by the restricted operations, which makes restricted calls
// unsafe to share across threads.

#include "mutsel/distributions.hpp"
#include "mutsel/errors.hpp"
#include "mutsel/kernel.hpp"
#include "mutsel/matrix.hpp"
#include "mutsel/precision.hpp"
#include "mutsel/rates.hpp"

#include <cmath>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mutsel {

template <typename Real>
class Generator {
public:
    Generator(const Matrix<Real>& kernel, std::vector<Real> birth, const Real& death,
              int num_threads = 0)
        : birth_(std::move(birth)), death_(death), num_threads_(num_threads) {
        if (!kernel.square()) {
            throw InvalidArgument("Generator: kernel must be square, got " +
                                  std::to_string(kernel.rows()) + "x" +
                                  std::to_string(kernel.cols()));
        }
        if (kernel.rows() != birth_.size()) {
            throw InvalidArgument("Generator: kernel is " + std::to_string(kernel.rows()) +
                                  "x" + std::to_string(kernel.cols()) + " but " +
                                  std::to_string(birth_.size()) + " birth rates were given");
        }
        birthing_ = kernel;
        for (size_t i = 0; i < birthing_.rows(); ++i) {
            for (size_t j = 0; j < birthing_.cols(); ++j) birthing_(i, j) *= birth_[j];
        }
    }

    Generator(const Rates<Real>& rates, const EffectsDistribution<Real>& effects,
              bool lossy = false, bool materialize = true, int num_threads = 0)
        : birth_(rates.birth), death_(rates.death), num_threads_(num_threads) {
        if (effects.n_classes() != rates.n_classes) {
            throw InvalidArgument("Generator: effect distribution built for " +
                                  std::to_string(effects.n_classes()) + " classes, rates have " +
                                  std::to_string(rates.n_classes));
        }
        if (materialize) {
            birthing_ = build_kernel(effects, lossy);
            for (size_t i = 0; i < birthing_.rows(); ++i) {
                for (size_t j = 0; j < birthing_.cols(); ++j) birthing_(i, j) *= birth_[j];
            }
        } else {
            convolution_.emplace(effects.masses(), rates.n_classes, lossy);
        }
    }

    size_t size() const { return birth_.size(); }
    const Real& death() const { return death_; }
    const std::vector<Real>& birth() const { return birth_; }
    bool materialized() const { return !convolution_.has_value(); }
    int num_threads() const { return num_threads_; }

    std::vector<Real> growth() const {
        std::vector<Real> g(birth_.size());
        for (size_t i = 0; i < g.size(); ++i) g[i] = birth_[i] - death_;
        return g;
    }

    // W[i][j]
    Real operator()(size_t i, size_t j) const {
        require_materialized("operator()");
        Real w = birthing_(i, j);
        if (i == j) w -= death_;
        return w;
    }

    // K diag(birth); only available when materialized.
    const Matrix<Real>& birthing() const {
        require_materialized("birthing");
        return birthing_;
    }

    // out = birth .* P, the rate at which each class gives birth.
    void births_to(const std::vector<Real>& P, std::vector<Real>& out) const {
        check_length(P, "births_to");
        out.resize(P.size());
        for (size_t i = 0; i < P.size(); ++i) out[i] = birth_[i] * P[i];
    }

    // out = K (birth .* P), the rate at which each class receives offspring.
    void births_of(const std::vector<Real>& P, std::vector<Real>& out) const {
        check_length(P, "births_of");
        if (materialized()) {
            birthing_.multiply(P, out, num_threads_);
        } else {
            std::vector<Real> born;
            births_to(P, born);
            convolution_->apply(born, out, num_threads_);
        }
    }

    // out = W v
    void apply(const std::vector<Real>& v, std::vector<Real>& out) const {
        births_of(v, out);
        for (size_t i = 0; i < v.size(); ++i) out[i] -= death_ * v[i];
    }

    void derivative(double t, const std::vector<Real>& P, std::vector<Real>& dPdt) const {
        (void)t;
        apply(P, dPdt);
    }

    // dP/dt on the classes of `included` only; P and dPdt are full length and
    // dPdt is zero outside the range. Equals the full derivative restricted to
    // the range when P vanishes outside it.
    void derivative(const std::vector<Real>& P, std::vector<Real>& dPdt,
                    const ClassRange& included) const {
        check_length(P, "derivative");
        check_range(included, "derivative");
        dPdt.assign(P.size(), Real(0));
        if (!materialized()) {
            std::vector<Real> full;
            apply(P, full);
            for (size_t i = included.begin; i < included.end; ++i) dPdt[i] = full[i];
            return;
        }
        const Matrix<Real>& block = restricted_block(included);
        std::vector<Real> sub(P.begin() + static_cast<long>(included.begin),
                              P.begin() + static_cast<long>(included.end));
        std::vector<Real> out;
        block.multiply(sub, out, num_threads_);
        for (size_t k = 0; k < sub.size(); ++k) {
            dPdt[included.begin + k] = out[k] - death_ * sub[k];
        }
    }

    // The system is linear, so the Jacobian is W everywhere.
    Matrix<Real> jacobian(double t, const std::vector<Real>& P) const {
        (void)t;
        check_length(P, "jacobian");
        return dense();
    }

    // Discrete update over a time step h:
    //   P' = P (1 - h death) + h K (birth .* P)
    void step(std::vector<Real>& P, const Real& h) const {
        std::vector<Real> born;
        births_of(P, born);
        const Real survival = Real(1) - h * death_;
        for (size_t i = 0; i < P.size(); ++i) P[i] = P[i] * survival + h * born[i];
    }

    // Discrete update of the classes in `included`; other entries are left as
    // they are.
    void step(std::vector<Real>& P, const Real& h, const ClassRange& included) const {
        check_length(P, "step");
        check_range(included, "step");
        if (included.begin == 0 && included.end == P.size()) {
            step(P, h);
            return;
        }
        std::vector<Real> born;
        if (materialized()) {
            std::vector<Real> sub(P.begin() + static_cast<long>(included.begin),
                                  P.begin() + static_cast<long>(included.end));
            restricted_block(included).multiply(sub, born, num_threads_);
        } else {
            std::vector<Real> full;
            births_of(P, full);
            born.assign(full.begin() + static_cast<long>(included.begin),
                        full.begin() + static_cast<long>(included.end));
        }
        const Real survival = Real(1) - h * death_;
        for (size_t k = 0; k < born.size(); ++k) {
            Real& x = P[included.begin + k];
            x = x * survival + h * born[k];
        }
    }

    // W as a dense matrix. For a matrix-free generator K is materialized here.
    Matrix<Real> dense() const {
        const size_t n = size();
        Matrix<Real> W(n, n);
        if (materialized()) {
            W = birthing_;
        } else {
            std::vector<Real> unit(n, Real(0));
            std::vector<Real> col;
            for (size_t j = 0; j < n; ++j) {
                unit[j] = Real(1);
                births_of(unit, col);
                for (size_t i = 0; i < n; ++i) W(i, j) = col[i];
                unit[j] = Real(0);
            }
        }
        for (size_t i = 0; i < n; ++i) W(i, i) -= death_;
        return W;
    }

    // Accurate column sums of K diag(birth): the total birth rate into the
    // lattice of a parent in each class.
    std::vector<Real> column_sums() const {
        const size_t n = size();
        std::vector<Real> sums(n);
        if (materialized()) {
            for (size_t j = 0; j < n; ++j) sums[j] = accurate_sum(birthing_.column(j));
        } else {
            std::vector<Real> unit(n, Real(0));
            std::vector<Real> col;
            for (size_t j = 0; j < n; ++j) {
                unit[j] = Real(1);
                convolution_->apply(unit, col, num_threads_);
                sums[j] = Real(accurate_sum(col) * birth_[j]);
                unit[j] = Real(0);
            }
        }
        return sums;
    }

    // Per-year growth rate a class actually realizes under the discrete
    // update with `steps_per_year` sub-steps:
    //   log(h * colsum(M)_j + 1 - h * death) / h,  h = 1 / steps_per_year
    std::vector<double> effective_growth(unsigned steps_per_year) const {
        if (steps_per_year == 0) {
            throw InvalidArgument("effective_growth: steps_per_year must be positive");
        }
        const double h = 1.0 / static_cast<double>(steps_per_year);
        const double survival = 1.0 - h * to_double(death_);
        const std::vector<Real> sums = column_sums();
        std::vector<double> out(sums.size());
        for (size_t j = 0; j < sums.size(); ++j) {
            out[j] = std::log(h * to_double(sums[j]) + survival) / h;
        }
        return out;
    }

private:
    void require_materialized(const char* who) const {
        if (!materialized()) {
            throw ConfigurationConflict(std::string("Generator::") + who +
                                        ": kernel is not materialized");
        }
    }

    void check_length(const std::vector<Real>& P, const char* who) const {
        if (P.size() != size()) {
            throw InvalidArgument(std::string("Generator::") + who + ": vector length " +
                                  std::to_string(P.size()) + ", expected " +
                                  std::to_string(size()));
        }
    }

    void check_range(const ClassRange& range, const char* who) const {
        if (range.begin > range.end || range.end > size()) {
            throw InvalidArgument(std::string("Generator::") + who + ": class range [" +
                                  std::to_string(range.begin) + ", " +
                                  std::to_string(range.end) + ") outside " +
                                  std::to_string(size()) + " classes");
        }
    }

    const Matrix<Real>& restricted_block(const ClassRange& range) const {
        if (!cached_block_.has_value() || cached_range_ != range) {
            cached_block_ = birthing_.block(range);
            cached_range_ = range;
        }
        return *cached_block_;
    }

    Matrix<Real> birthing_;
    std::optional<KernelConvolution<Real>> convolution_;
    std::vector<Real> birth_;
    Real death_;
    int num_threads_ = 0;

    mutable ClassRange cached_range_;
    mutable std::optional<Matrix<Real>> cached_block_;
};

}  // namespace mutsel
