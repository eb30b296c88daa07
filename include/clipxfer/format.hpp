/**
 * @file format.hpp
 * @brief Human-readable sizes, rates and durations for progress views
 */

#ifndef CLIPXFER_FORMAT_HPP
#define CLIPXFER_FORMAT_HPP

#include <chrono>
#include <cstdint>
#include <string>

namespace clipxfer {

/// "512 B", "1.5 KiB", "2.0 MiB", "1.0 GiB"
[[nodiscard]] std::string format_bytes(uint64_t bytes);

/// Same units as format_bytes() with a "/s" suffix
[[nodiscard]] std::string format_rate(uint64_t bytes_per_sec);

/// "45s", "2m 5s", "1h 2m"
[[nodiscard]] std::string format_duration(std::chrono::seconds duration);

} // namespace clipxfer

#endif // CLIPXFER_FORMAT_HPP
