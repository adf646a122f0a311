#pragma once
// Weighted moments over the fitness lattice, relative errors against
// reference arrays, and support of a frequency vector.

#include "mutsel/errors.hpp"
#include "mutsel/matrix.hpp"
#include "mutsel/precision.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace mutsel {

// sum_i f[i] x[i]^k / sum_i f[i]
template <typename Real>
Real weighted_moment(const std::vector<Real>& freq, const std::vector<Real>& x, unsigned k) {
    if (freq.size() != x.size()) {
        throw InvalidArgument("weighted_moment: " + std::to_string(freq.size()) +
                              " weights for " + std::to_string(x.size()) + " values");
    }
    std::vector<Real> powers(x.size(), Real(1));
    for (size_t i = 0; i < x.size(); ++i) {
        for (unsigned e = 0; e < k; ++e) powers[i] *= x[i];
    }
    return Real(accurate_dot(freq, powers) / accurate_sum(freq));
}

// (E[x], E[x^2] - E[x]^2) under the normalized weights.
template <typename Real>
std::pair<Real, Real> mean_and_variance(const std::vector<Real>& freq, const std::vector<Real>& x) {
    const Real mean = weighted_moment(freq, x, 1);
    const Real second = weighted_moment(freq, x, 2);
    return {mean, Real(second - mean * mean)};
}

// |actual - desired| / |desired| per element (signed when absolute=false).
// A zero reference gives 0 where actual is also zero and infinity elsewhere.
std::vector<double> relative_error(const std::vector<double>& actual,
                                   const std::vector<double>& desired, bool absolute = true);

double maximum_absolute_relative_error(const std::vector<double>& actual,
                                       const std::vector<double>& desired);

double maximum_absolute_relative_error(const std::vector<std::vector<double>>& actual,
                                       const std::vector<std::vector<double>>& desired);

// Smallest interval holding every entry above `threshold`; empty if none.
template <typename Real>
ClassRange support_range(const std::vector<Real>& p, const Real& threshold) {
    ClassRange range;
    size_t i = 0;
    while (i < p.size() && !(p[i] > threshold)) ++i;
    if (i == p.size()) return range;
    size_t j = p.size();
    while (j > i && !(p[j - 1] > threshold)) --j;
    range.begin = i;
    range.end = j;
    return range;
}

template <typename Real>
ClassRange support_range(const std::vector<Real>& p) {
    return support_range(p, Real(0));
}

// Zero both tails outside support_range(p, threshold) and return it.
template <typename Real>
ClassRange trim_tails(std::vector<Real>& p, const Real& threshold) {
    const ClassRange range = support_range(p, threshold);
    for (size_t i = 0; i < p.size(); ++i) {
        if (!range.contains(i)) p[i] = Real(0);
    }
    return range;
}

}  // namespace mutsel
