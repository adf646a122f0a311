#pragma once
// Fixed- and arbitrary-precision arithmetic behind one set of free functions.
//
// Every numeric component is a template over Real and is instantiated for
// double and for GMP's mpf_class. The operations whose implementation differs
// between the two live here: compensated summation, exponent decomposition,
// exact power-of-two scaling and conversion between the representations.
// The representation is fixed when an object is constructed; nothing inspects
// the type of a value at run time.

#include "mutsel/errors.hpp"

#include <gmpxx.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace mutsel {

enum class NumericKind : uint8_t {
    FIXED = 0,      // IEEE double
    ARBITRARY = 1   // GMP mpf_class at the default precision
};

inline const char* numeric_kind_name(NumericKind kind) {
    return kind == NumericKind::ARBITRARY ? "arbitrary" : "fixed";
}

inline NumericKind parse_numeric_kind(const std::string& name) {
    if (name == "fixed" || name == "double") return NumericKind::FIXED;
    if (name == "arbitrary" || name == "mpf" || name == "mp") return NumericKind::ARBITRARY;
    throw InvalidArgument("unknown numeric kind '" + name + "' (expected fixed or arbitrary)");
}

template <typename Real>
constexpr NumericKind numeric_kind_of() {
    return std::is_same_v<Real, double> ? NumericKind::FIXED : NumericKind::ARBITRARY;
}

// Default precision (bits) of mpf_class values created afterwards.
inline void set_default_precision(unsigned long bits) {
    mpf_set_default_prec(static_cast<mp_bitcnt_t>(bits));
}

inline unsigned long default_precision() {
    return static_cast<unsigned long>(mpf_get_default_prec());
}

// ---------------------------------------------------------------------------
// Conversion

inline double to_double(double x) { return x; }
inline double to_double(const mpf_class& x) { return x.get_d(); }

template <typename To>
inline To type_convert(double x) {
    return To(x);
}

template <typename To>
inline To type_convert(const mpf_class& x) {
    if constexpr (std::is_same_v<To, double>) {
        return x.get_d();
    } else {
        return To(x);
    }
}

template <typename To, typename From>
inline std::vector<To> convert_vector(const std::vector<From>& values) {
    std::vector<To> out;
    out.reserve(values.size());
    for (const From& v : values) out.push_back(type_convert<To>(v));
    return out;
}

template <typename Real>
Real from_string(const std::string& text);

template <>
inline double from_string<double>(const std::string& text) {
    const char* begin = text.c_str();
    char* end = nullptr;
    const double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0') {
        throw InvalidArgument("not a number: '" + text + "'");
    }
    return value;
}

template <>
inline mpf_class from_string<mpf_class>(const std::string& text) {
    mpf_class value;
    if (text.empty() || value.set_str(text, 10) != 0) {
        throw InvalidArgument("not a number: '" + text + "'");
    }
    return value;
}

inline std::string to_string(double x, int digits = 17) {
    std::ostringstream oss;
    oss << std::setprecision(digits) << x;
    return oss.str();
}

inline std::string to_string(const mpf_class& x, int digits = 40) {
    std::ostringstream oss;
    oss << std::setprecision(digits) << x;
    return oss.str();
}

// ---------------------------------------------------------------------------
// Element predicates

inline bool is_finite(double x) { return std::isfinite(x); }
inline bool is_finite(const mpf_class&) { return true; }

inline double real_abs(double x) { return std::fabs(x); }
inline mpf_class real_abs(const mpf_class& x) { return mpf_class(abs(x)); }

// ---------------------------------------------------------------------------
// Exponent decomposition and exact scaling

// frexp convention: x = mantissa * 2^exponent with 0.5 <= |mantissa| < 1;
// zero decomposes to (0, 0).
inline std::pair<long, double> exponent_and_mantissa(double x) {
    int e = 0;
    const double m = std::frexp(x, &e);
    return {static_cast<long>(e), m};
}

inline std::pair<long, mpf_class> exponent_and_mantissa(const mpf_class& x) {
    signed long e = 0;
    mpf_get_d_2exp(&e, x.get_mpf_t());
    mpf_class m(0, x.get_prec());
    if (e >= 0) {
        mpf_div_2exp(m.get_mpf_t(), x.get_mpf_t(), static_cast<mp_bitcnt_t>(e));
    } else {
        mpf_mul_2exp(m.get_mpf_t(), x.get_mpf_t(), static_cast<mp_bitcnt_t>(-e));
    }
    return {static_cast<long>(e), m};
}

inline long exponent_of(double x) {
    int e = 0;
    std::frexp(x, &e);
    return e;
}

inline long exponent_of(const mpf_class& x) {
    signed long e = 0;
    mpf_get_d_2exp(&e, x.get_mpf_t());
    return e;
}

// x *= 2^e, exact unless the double result leaves the normal range.
inline void scale_by_power_of_two(double& x, long e) {
    x = std::ldexp(x, static_cast<int>(e));
}

inline void scale_by_power_of_two(mpf_class& x, long e) {
    if (e >= 0) {
        mpf_mul_2exp(x.get_mpf_t(), x.get_mpf_t(), static_cast<mp_bitcnt_t>(e));
    } else {
        mpf_div_2exp(x.get_mpf_t(), x.get_mpf_t(), static_cast<mp_bitcnt_t>(-e));
    }
}

template <typename Real>
inline void scale_by_power_of_two(std::vector<Real>& values, long e) {
    if (e == 0) return;
    for (Real& v : values) scale_by_power_of_two(v, e);
}

// Scale by 2^k so that the largest magnitude has binary exponent `target`.
// Returns k (0 when the vector is empty, all zero or holds a non-finite value).
// Applying it twice is the same as applying it once.
template <typename Real>
long rebias_exponent(std::vector<Real>& values, long target) {
    if (values.empty()) return 0;
    Real largest(0);
    for (const Real& v : values) {
        if (!is_finite(v)) return 0;
        const Real a = real_abs(v);
        if (a > largest) largest = a;
    }
    if (largest == 0) return 0;
    const long shift = target - exponent_of(largest);
    scale_by_power_of_two(values, shift);
    return shift;
}

// ---------------------------------------------------------------------------
// Compensated summation

namespace detail {

// Shewchuk's exact partials; the result is the correctly rounded sum.
template <typename It>
double shewchuk_sum(It first, It last) {
    std::vector<double> partials;
    double naive = 0.0;
    bool finite = true;
    for (It it = first; it != last; ++it) {
        double x = static_cast<double>(*it);
        naive += x;
        if (!std::isfinite(x)) {
            finite = false;
            continue;
        }
        if (!finite) continue;
        size_t used = 0;
        for (double y : partials) {
            if (std::fabs(x) < std::fabs(y)) std::swap(x, y);
            const double hi = x + y;
            const double lo = y - (hi - x);
            if (lo != 0.0) partials[used++] = lo;
            x = hi;
        }
        partials.resize(used);
        partials.push_back(x);
    }
    // NaN and infinities propagate the way a plain sum would.
    if (!finite || !std::isfinite(naive)) return naive;
    if (partials.empty()) return 0.0;

    size_t n = partials.size();
    double hi = partials[--n];
    double lo = 0.0;
    while (n > 0) {
        const double x = hi;
        const double y = partials[--n];
        hi = x + y;
        const double yr = hi - x;
        lo = y - yr;
        if (lo != 0.0) break;
    }
    // Half-way case: round-half-even on the remaining partials.
    if (n > 0 && ((lo < 0.0 && partials[n - 1] < 0.0) ||
                  (lo > 0.0 && partials[n - 1] > 0.0))) {
        const double y = lo * 2.0;
        const double x = hi + y;
        const double yr = x - hi;
        if (y == yr) hi = x;
    }
    return hi;
}

// Neumaier's improved Kahan summation at working precision.
template <typename It>
mpf_class neumaier_sum(It first, It last) {
    mpf_class sum(0);
    mpf_class compensation(0);
    mpf_class t;
    for (It it = first; it != last; ++it) {
        const mpf_class& x = *it;
        t = sum + x;
        if (abs(sum) >= abs(x)) {
            compensation += (sum - t) + x;
        } else {
            compensation += (x - t) + sum;
        }
        sum = t;
    }
    return mpf_class(sum + compensation);
}

}  // namespace detail

template <typename It>
typename std::iterator_traits<It>::value_type accurate_sum(It first, It last) {
    using Real = typename std::iterator_traits<It>::value_type;
    if (first == last) throw InvalidArgument("accurate_sum: empty input");
    if constexpr (std::is_same_v<Real, double>) {
        return detail::shewchuk_sum(first, last);
    } else {
        return detail::neumaier_sum(first, last);
    }
}

template <typename Real>
Real accurate_sum(const std::vector<Real>& values) {
    return accurate_sum(values.begin(), values.end());
}

// sum_i a[i] * b[i], products rounded at working precision, sum compensated.
template <typename Real>
Real accurate_dot(const std::vector<Real>& a, const std::vector<Real>& b) {
    if (a.size() != b.size()) {
        throw InvalidArgument("accurate_dot: length mismatch (" + std::to_string(a.size()) +
                              " vs " + std::to_string(b.size()) + ")");
    }
    std::vector<Real> products(a.size());
    for (size_t i = 0; i < a.size(); ++i) products[i] = a[i] * b[i];
    return accurate_sum(products);
}

}  // namespace mutsel
