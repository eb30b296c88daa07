/**
 * @file speed_tracker.cpp
 * @brief SpeedTracker implementation
 */

#include <clipxfer/speed_tracker.hpp>

namespace clipxfer {

void SpeedTracker::update(uint64_t bytes, TimePoint now) {
    bytes_transferred_ += bytes;
    samples_.emplace_back(now, bytes);
    while (samples_.size() > MAX_SAMPLES) samples_.pop_front();
}

uint64_t SpeedTracker::average_bytes_per_sec(TimePoint now) const {
    double elapsed = std::chrono::duration<double>(now - start_time_).count();
    if (elapsed <= 0.0) return 0;
    return static_cast<uint64_t>(static_cast<double>(bytes_transferred_) / elapsed);
}

uint64_t SpeedTracker::speed_bytes_per_sec(TimePoint now) const {
    if (samples_.size() < 2) return average_bytes_per_sec(now);

    // The oldest sample's bytes were moved before its timestamp, so only
    // the later samples count against the window's span.
    double span = std::chrono::duration<double>(samples_.back().first - samples_.front().first)
                      .count();
    if (span <= 0.0) return average_bytes_per_sec(now);

    uint64_t window_bytes = 0;
    for (auto it = samples_.begin() + 1; it != samples_.end(); ++it) window_bytes += it->second;
    return static_cast<uint64_t>(static_cast<double>(window_bytes) / span);
}

std::chrono::seconds SpeedTracker::estimated_remaining(uint64_t remaining_bytes,
                                                       TimePoint now) const {
    uint64_t speed = speed_bytes_per_sec(now);
    if (speed == 0) return std::chrono::seconds::zero();
    return std::chrono::seconds(static_cast<std::chrono::seconds::rep>(remaining_bytes / speed));
}

} // namespace clipxfer
