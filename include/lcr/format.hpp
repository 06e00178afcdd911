#pragma once

#include <string>
#include <format>
#include <cstdint>
#include <algorithm>
#include <chrono>


namespace lcr {

// Format an integer with thousands separators
// Example: 6436311 -> "6,436,311"
inline std::string format_number_exact(std::uint64_t value) {
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


// Format bytes as a scaled human-readable value (binary units)
// Example: 1234567 -> "1.18 MB"
inline std::string format_bytes_scaled(std::uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int unit_index = 0;

    while (value >= 1024.0 && unit_index < 4) {
        value /= 1024.0;
        ++unit_index;
    }

    int precision =
        (value < 10.0)  ? 2 :
        (value < 100.0) ? 1 : 0;

    return std::format("{:.{}f} {}", value, precision, units[unit_index]);
}


// Format a delay for logs
// Examples:
//   250ms   -> "250 ms"
//   1500ms  -> "1.5 s"
//   30000ms -> "30 s"
inline std::string format_delay(std::chrono::milliseconds delay) {
    const auto ms = delay.count();
    if (ms < 1000) {
        return std::format("{} ms", ms);
    }
    if (ms % 1000 == 0) {
        return std::format("{} s", ms / 1000);
    }
    return std::format("{:.1f} s", static_cast<double>(ms) / 1000.0);
}

} // namespace lcr
