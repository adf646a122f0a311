#pragma once

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace mutsel {
namespace log_utils {

inline std::string format_duration_ms(int64_t ms) {
    if (ms < 0) ms = 0;
    if (ms < 1000) return std::to_string(ms) + " ms";

    const int64_t total_seconds = ms / 1000;
    if (total_seconds < 60) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2)
            << (static_cast<double>(ms) / 1000.0) << " s";
        return oss.str();
    }

    const int64_t total_minutes = total_seconds / 60;
    const int64_t hours = total_minutes / 60;
    std::string out;
    if (hours > 0) out = std::to_string(hours) + "h ";
    return out + std::to_string(total_minutes % 60) + "m " +
           std::to_string(total_seconds % 60) + "s";
}

template <typename Clock, typename DurA, typename DurB>
inline std::string format_elapsed(
    const std::chrono::time_point<Clock, DurA>& start,
    const std::chrono::time_point<Clock, DurB>& end) {
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    return format_duration_ms(ms);
}

// Warnings are never gated by a verbose flag.
inline void warn(const char* tag, const std::string& message) {
    std::cerr << "[" << tag << "] warning: " << message << "\n";
}

}  // namespace log_utils
}  // namespace mutsel
