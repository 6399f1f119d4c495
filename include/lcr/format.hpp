#pragma once

#include <string>
#include <format>
#include <cstdint>
#include <algorithm>
#include <chrono>


namespace lcr {

// Format an integer with thousands separators
// Example: 6436311 -> "6,436,311"
inline std::string format_number_exact(uint64_t value) {
    std::string raw = std::to_string(value);
    std::string formatted;
    formatted.reserve(raw.size() + raw.size() / 3);

    int count = 0;
    for (auto it = raw.rbegin(); it != raw.rend(); ++it) {
        if (count == 3) {
            formatted.push_back(',');
            count = 0;
        }
        formatted.push_back(*it);
        ++count;
    }
    std::reverse(formatted.begin(), formatted.end());
    return formatted;
}


// Format a millisecond delay the way retry logs read best
// Examples:
//   250    -> "250 ms"
//   4'000  -> "4.00 s"
//   300'000 -> "5.00 min"
inline std::string format_delay(std::chrono::milliseconds delay) {
    const double ms = static_cast<double>(delay.count());
    if (ms < 1'000.0) {
        return std::format("{} ms", delay.count());
    }
    if (ms < 60'000.0) {
        return std::format("{:.2f} s", ms / 1'000.0);
    }
    return std::format("{:.2f} min", ms / 60'000.0);
}

} // namespace lcr
