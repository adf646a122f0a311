#include "mutsel/distributions.hpp"

#include <boost/math/distributions/gamma.hpp>

#include <cmath>

namespace mutsel {

namespace {

constexpr double kInvSqrt2 = 0.70710678118654752440;
constexpr double kInvSqrt2Pi = 0.39894228040143267794;

double normal_cdf(double z) { return 0.5 * std::erfc(-z * kInvSqrt2); }
double normal_ccdf(double z) { return 0.5 * std::erfc(z * kInvSqrt2); }
double normal_pdf(double z) { return kInvSqrt2Pi * std::exp(-0.5 * z * z); }

}  // namespace

ClassMasses normal_class_masses(const std::vector<double>& centers, double delta,
                                double mean, double sd, double crop, bool density) {
    ClassMasses out;
    out.mass.assign(centers.size(), 0.0);
    const double half_width = 0.5 * delta;
    for (size_t i = 0; i < centers.size(); ++i) {
        const double z = (centers[i] - mean) / sd;
        if (std::fabs(z) > crop) continue;
        double m;
        if (density) {
            m = normal_pdf(z) * delta / sd;
        } else {
            const double lo = (centers[i] - half_width - mean) / sd;
            const double hi = (centers[i] + half_width - mean) / sd;
            // Lower tail from the CDF, upper tail from the complement.
            m = (hi <= 0.0) ? normal_cdf(hi) - normal_cdf(lo)
                            : normal_ccdf(lo) - normal_ccdf(hi);
        }
        if (m <= 0.0) {
            ++out.underflowed;
            m = 0.0;
        }
        out.mass[i] = m;
    }
    return out;
}

ClassMasses half_normal_effect_masses(size_t half, double delta, double sd, bool density) {
    ClassMasses out;
    out.mass.assign(half, 0.0);
    if (half == 0) return out;
    const double half_width = 0.5 * delta;
    for (size_t j = 0; j < half; ++j) {
        const double x = static_cast<double>(j) * delta;
        double m;
        if (density) {
            m = normal_pdf(x / sd) * delta / sd;
        } else if (j == 0) {
            m = std::erf(half_width / sd * kInvSqrt2);
        } else {
            m = normal_ccdf((x - half_width) / sd) - normal_ccdf((x + half_width) / sd);
        }
        if (m <= 0.0) {
            ++out.underflowed;
            m = 0.0;
        }
        out.mass[j] = m;
    }
    return out;
}

ClassMasses half_gamma_effect_masses(size_t half, double delta, double shape, double rate) {
    ClassMasses out;
    out.mass.assign(half, 0.0);
    if (half == 0) return out;
    const boost::math::gamma_distribution<double> law(shape, 1.0 / rate);
    const double half_width = 0.5 * delta;
    out.mass[0] = boost::math::cdf(law, half_width);
    double upper_tail = boost::math::cdf(boost::math::complement(law, half_width));
    for (size_t j = 1; j < half; ++j) {
        const double edge = static_cast<double>(j) * delta + half_width;
        const double next_tail = boost::math::cdf(boost::math::complement(law, edge));
        double m = upper_tail - next_tail;
        upper_tail = next_tail;
        if (m <= 0.0) {
            ++out.underflowed;
            m = 0.0;
        }
        out.mass[j] = m;
    }
    if (out.mass[0] <= 0.0) ++out.underflowed;
    return out;
}

}  // namespace mutsel
