#include "mutsel/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace mutsel {

std::vector<double> relative_error(const std::vector<double>& actual,
                                   const std::vector<double>& desired, bool absolute) {
    if (actual.size() != desired.size()) {
        throw InvalidArgument("relative_error: shape mismatch (" + std::to_string(actual.size()) +
                              " vs " + std::to_string(desired.size()) + ")");
    }
    std::vector<double> out(actual.size());
    for (size_t i = 0; i < actual.size(); ++i) {
        const double diff = actual[i] - desired[i];
        double e;
        if (desired[i] == 0.0) {
            e = diff == 0.0 ? 0.0 : std::numeric_limits<double>::infinity();
            if (!absolute && diff < 0.0) e = -e;
        } else {
            e = diff / desired[i];
            if (absolute) e = std::fabs(e);
        }
        out[i] = e;
    }
    return out;
}

double maximum_absolute_relative_error(const std::vector<double>& actual,
                                       const std::vector<double>& desired) {
    const std::vector<double> errors = relative_error(actual, desired, true);
    double worst = 0.0;
    for (double e : errors) {
        if (std::isnan(e)) return std::numeric_limits<double>::quiet_NaN();
        worst = std::max(worst, e);
    }
    return worst;
}

double maximum_absolute_relative_error(const std::vector<std::vector<double>>& actual,
                                       const std::vector<std::vector<double>>& desired) {
    if (actual.size() != desired.size()) {
        throw InvalidArgument("maximum_absolute_relative_error: " +
                              std::to_string(actual.size()) + " arrays vs " +
                              std::to_string(desired.size()));
    }
    double worst = 0.0;
    for (size_t k = 0; k < actual.size(); ++k) {
        const double e = maximum_absolute_relative_error(actual[k], desired[k]);
        if (std::isnan(e)) return e;
        worst = std::max(worst, e);
    }
    return worst;
}

}  // namespace mutsel
