/**
 * @file format.cpp
 * @brief Formatting helpers
 */

#include <clipxfer/format.hpp>

#include <cstdio>

namespace clipxfer {

namespace {

constexpr double KIB = 1024.0;
constexpr double MIB = 1024.0 * 1024.0;
constexpr double GIB = 1024.0 * 1024.0 * 1024.0;

std::string format_scaled(double value, const char *suffix) {
    char buf[48];
    if (value >= GIB) snprintf(buf, sizeof(buf), "%.1f GiB%s", value / GIB, suffix);
    else if (value >= MIB) snprintf(buf, sizeof(buf), "%.1f MiB%s", value / MIB, suffix);
    else if (value >= KIB) snprintf(buf, sizeof(buf), "%.1f KiB%s", value / KIB, suffix);
    else snprintf(buf, sizeof(buf), "%.0f B%s", value, suffix);
    return buf;
}

} // namespace

std::string format_bytes(uint64_t bytes) {
    return format_scaled(static_cast<double>(bytes), "");
}

std::string format_rate(uint64_t bytes_per_sec) {
    return format_scaled(static_cast<double>(bytes_per_sec), "/s");
}

std::string format_duration(std::chrono::seconds duration) {
    long long secs = duration.count();
    if (secs < 0) secs = 0;

    char buf[48];
    if (secs < 60) {
        snprintf(buf, sizeof(buf), "%llds", secs);
    } else if (secs < 3600) {
        snprintf(buf, sizeof(buf), "%lldm %llds", secs / 60, secs % 60);
    } else {
        snprintf(buf, sizeof(buf), "%lldh %lldm", secs / 3600, (secs % 3600) / 60);
    }
    return buf;
}

} // namespace clipxfer
