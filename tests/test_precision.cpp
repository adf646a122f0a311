// tests/test_precision.cpp
//
// Compensated summation, exponent decomposition, power-of-two scaling and
// conversions in both numeric representations.

#include "mutsel/precision.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

int test_accurate_sum_double() {
    std::cout << "[P1] accurate_sum (double)\n";
    int failed = 0;

    const std::vector<double> cancel = {1e100, 1.0, -1e100};
    expect(mutsel::accurate_sum(cancel) == 1.0, "1e100 + 1 - 1e100 == 1", failed);

    const std::vector<double> tenths(10, 0.1);
    expect(mutsel::accurate_sum(tenths) == 1.0, "ten times 0.1 sums to exactly 1", failed);

    const std::vector<double> tiny = {1.0, 1e-16, 1e-16, 1e-16, 1e-16};
    expect(mutsel::accurate_sum(tiny) == 1.0 + 4e-16, "small addends are not lost", failed);

    bool threw = false;
    try {
        (void)mutsel::accurate_sum(std::vector<double>{});
    } catch (const mutsel::InvalidArgument&) {
        threw = true;
    }
    expect(threw, "empty input throws InvalidArgument", failed);

    const std::vector<double> with_nan = {1.0, std::numeric_limits<double>::quiet_NaN()};
    expect(std::isnan(mutsel::accurate_sum(with_nan)), "NaN propagates", failed);
    const std::vector<double> with_inf = {1.0, std::numeric_limits<double>::infinity()};
    expect(std::isinf(mutsel::accurate_sum(with_inf)), "infinity propagates", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_accurate_sum_mpf() {
    std::cout << "[P2] accurate_sum (mpf_class)\n";
    int failed = 0;
    mutsel::set_default_precision(256);

    const std::vector<mpf_class> cancel = {mpf_class(1e100), mpf_class(1), mpf_class(-1e100)};
    expect(mutsel::accurate_sum(cancel) == 1, "1e100 + 1 - 1e100 == 1", failed);

    std::vector<mpf_class> thirds(3, mpf_class(1) / 3);
    const mpf_class total = mutsel::accurate_sum(thirds);
    expect(abs(total - 1) < mpf_class("1e-70"), "three thirds sum to 1 at working precision", failed);

    bool threw = false;
    try {
        (void)mutsel::accurate_sum(std::vector<mpf_class>{});
    } catch (const mutsel::InvalidArgument&) {
        threw = true;
    }
    expect(threw, "empty input throws InvalidArgument", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_exponent_and_mantissa() {
    std::cout << "[P3] exponent_and_mantissa\n";
    int failed = 0;

    auto zero = mutsel::exponent_and_mantissa(0.0);
    expect(zero.first == 0 && zero.second == 0.0, "zero decomposes to (0, 0)", failed);

    auto eight = mutsel::exponent_and_mantissa(8.0);
    expect(eight.first == 4 && eight.second == 0.5, "8 = 0.5 * 2^4", failed);

    auto neg = mutsel::exponent_and_mantissa(-3.0);
    expect(neg.first == 2 && neg.second == -0.75, "-3 = -0.75 * 2^2", failed);

    mutsel::set_default_precision(256);
    auto mp_eight = mutsel::exponent_and_mantissa(mpf_class(8));
    expect(mp_eight.first == 4 && mp_eight.second == 0.5, "mpf 8 = 0.5 * 2^4", failed);

    auto mp_zero = mutsel::exponent_and_mantissa(mpf_class(0));
    expect(mp_zero.first == 0 && mp_zero.second == 0, "mpf zero decomposes to (0, 0)", failed);

    // Far outside the double range.
    mpf_class huge(1);
    mutsel::scale_by_power_of_two(huge, 5000);
    expect(mutsel::exponent_of(huge) == 5001, "mpf 2^5000 has exponent 5001", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_scaling_and_rebias() {
    std::cout << "[P4] scale_by_power_of_two / rebias_exponent\n";
    int failed = 0;

    double x = 3.0;
    mutsel::scale_by_power_of_two(x, 10);
    expect(x == 3072.0, "3 * 2^10 == 3072", failed);

    mpf_class y(3);
    mutsel::scale_by_power_of_two(y, -2);
    expect(y == 0.75, "mpf 3 * 2^-2 == 0.75", failed);

    std::vector<double> v = {1.0, 0.25, 0.0};
    const long shift = mutsel::rebias_exponent(v, 512);
    expect(shift == 511, "shift brings exponent of max from 1 to 512", failed);
    expect(mutsel::exponent_of(v[0]) == 512, "max entry has the target exponent", failed);
    expect(v[1] == std::ldexp(0.25, 511), "other entries scaled exactly", failed);
    expect(v[2] == 0.0, "zeros stay zero", failed);
    expect(mutsel::rebias_exponent(v, 512) == 0, "rebias is idempotent", failed);

    std::vector<double> zeros(4, 0.0);
    expect(mutsel::rebias_exponent(zeros, 512) == 0, "all-zero vector is left alone", failed);

    std::vector<mpf_class> mp = {mpf_class(1), mpf_class("1e-400")};
    const long mp_shift = mutsel::rebias_exponent(mp, -10);
    expect(mp_shift == -11, "mpf shift to negative target", failed);
    expect(mutsel::exponent_of(mp[0]) == -10, "mpf max entry has the target exponent", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_conversions() {
    std::cout << "[P5] conversions and parsing\n";
    int failed = 0;
    mutsel::set_default_precision(256);

    const double tenth = 0.1;
    const mpf_class wide = mutsel::type_convert<mpf_class>(tenth);
    expect(mutsel::type_convert<double>(wide) == tenth, "double -> mpf -> double is exact", failed);

    const mpf_class parsed = mutsel::from_string<mpf_class>("0.001");
    expect(abs(parsed - mpf_class("1e-3")) < mpf_class("1e-70"), "decimal string parses", failed);
    expect(std::fabs(mutsel::to_double(parsed) - 0.001) < 1e-18, "mpf 0.001 converts to double", failed);

    bool threw = false;
    try {
        (void)mutsel::from_string<double>("0.1x");
    } catch (const mutsel::InvalidArgument&) {
        threw = true;
    }
    expect(threw, "trailing garbage is rejected", failed);

    threw = false;
    try {
        (void)mutsel::from_string<mpf_class>("abc");
    } catch (const mutsel::InvalidArgument&) {
        threw = true;
    }
    expect(threw, "non-numeric mpf string is rejected", failed);

    expect(mutsel::parse_numeric_kind("fixed") == mutsel::NumericKind::FIXED, "fixed", failed);
    expect(mutsel::parse_numeric_kind("arbitrary") == mutsel::NumericKind::ARBITRARY, "arbitrary", failed);
    threw = false;
    try {
        (void)mutsel::parse_numeric_kind("quad");
    } catch (const mutsel::InvalidArgument&) {
        threw = true;
    }
    expect(threw, "unknown numeric kind throws", failed);

    const std::vector<double> a = {1.0, 2.0, 3.0};
    const std::vector<double> b = {4.0, 5.0, 6.0};
    expect(mutsel::accurate_dot(a, b) == 32.0, "accurate_dot", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // namespace

int main() {
    int total = 0;
    total += test_accurate_sum_double();
    total += test_accurate_sum_mpf();
    total += test_exponent_and_mantissa();
    total += test_scaling_and_rebias();
    total += test_conversions();

    if (total == 0) {
        std::cout << "\nAll precision tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
