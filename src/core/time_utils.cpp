#include "time_utils.hpp"
#include <fmt/format.h>

std::string format_elapsed(std::chrono::milliseconds elapsed) {
    auto ms = elapsed.count();
    if (ms < 0) ms = 0;
    if (ms < 1000) {
        return fmt::format("{}ms", ms);
    }

    long long seconds = ms / 1000;
    long long hours = seconds / 3600;
    long long mins = (seconds % 3600) / 60;
    long long secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{:02d}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{:02d}s", mins, secs);
    }
    return fmt::format("{}s", secs);
}

std::string format_bytes(uint64_t bytes) {
    static const char* UNITS[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        unit++;
    }
    return fmt::format("{:.1f} {}", value, UNITS[unit]);
}

std::string format_rate(uint64_t bytes, std::chrono::milliseconds elapsed) {
    if (elapsed.count() <= 0) return "-";
    double per_sec = static_cast<double>(bytes) * 1000.0 / static_cast<double>(elapsed.count());
    return format_bytes(static_cast<uint64_t>(per_sec)) + "/s";
}
