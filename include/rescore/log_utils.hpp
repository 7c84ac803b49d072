#pragma once

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace rescore {
namespace log_utils {

// "850 ms", "12.3 s", "4m 10s", "2h 5m 0s"
inline std::string format_duration_ms(int64_t ms) {
    if (ms < 0) ms = 0;
    if (ms < 1000) {
        return std::to_string(ms) + " ms";
    }

    const int64_t total_seconds = ms / 1000;
    if (total_seconds < 60) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1)
            << (static_cast<double>(ms) / 1000.0) << " s";
        return oss.str();
    }

    const int64_t seconds = total_seconds % 60;
    const int64_t total_minutes = total_seconds / 60;
    if (total_minutes < 60) {
        return std::to_string(total_minutes) + "m " + std::to_string(seconds) + "s";
    }

    const int64_t minutes = total_minutes % 60;
    const int64_t hours = total_minutes / 60;
    return std::to_string(hours) + "h " + std::to_string(minutes) + "m " +
           std::to_string(seconds) + "s";
}

template <typename Clock, typename DurA, typename DurB>
inline std::string format_elapsed(
    const std::chrono::time_point<Clock, DurA>& start,
    const std::chrono::time_point<Clock, DurB>& end) {
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    return format_duration_ms(ms);
}

// Throughput line for progress output, e.g. "1200000 records (310000/s)"
inline std::string format_rate(uint64_t count, const char* unit, int64_t elapsed_ms) {
    std::ostringstream oss;
    oss << count << ' ' << unit;
    if (elapsed_ms > 0) {
        oss << " (" << static_cast<uint64_t>(count * 1000.0 / static_cast<double>(elapsed_ms))
            << "/s)";
    }
    return oss.str();
}

// Verbose-gated progress line on stderr
inline void progress(bool verbose, const std::string& msg) {
    if (verbose) std::cerr << msg << "\n";
}

}  // namespace log_utils
}  // namespace rescore
