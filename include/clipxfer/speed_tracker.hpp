/**
 * @file speed_tracker.hpp
 * @brief Throughput and ETA accumulator for a running transfer
 */

#ifndef CLIPXFER_SPEED_TRACKER_HPP
#define CLIPXFER_SPEED_TRACKER_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <utility>

namespace clipxfer {

/**
 * Tracks transfer speed for progress display
 *
 * Keeps the cumulative byte count plus a window of the most recent
 * samples. speed_bytes_per_sec() reports the moving rate across that
 * window so the ETA follows the current throughput; the lifetime
 * average stays available through average_bytes_per_sec().
 *
 * The overloads taking a time point exist for deterministic tests;
 * the executor uses the ones reading the steady clock.
 */
class SpeedTracker {
  public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    static constexpr size_t MAX_SAMPLES = 10;

    SpeedTracker() : SpeedTracker(Clock::now()) {}
    explicit SpeedTracker(TimePoint start) : start_time_(start) {}

    /// Record @p bytes transferred now
    void update(uint64_t bytes) { update(bytes, Clock::now()); }
    void update(uint64_t bytes, TimePoint now);

    /// Moving rate over the sample window (bytes/sec)
    [[nodiscard]] uint64_t speed_bytes_per_sec() const { return speed_bytes_per_sec(Clock::now()); }
    [[nodiscard]] uint64_t speed_bytes_per_sec(TimePoint now) const;

    /// Cumulative bytes divided by time since construction (bytes/sec)
    [[nodiscard]] uint64_t average_bytes_per_sec() const {
        return average_bytes_per_sec(Clock::now());
    }
    [[nodiscard]] uint64_t average_bytes_per_sec(TimePoint now) const;

    /// Time left for @p remaining_bytes at the current speed; zero when speed is zero
    [[nodiscard]] std::chrono::seconds estimated_remaining(uint64_t remaining_bytes) const {
        return estimated_remaining(remaining_bytes, Clock::now());
    }
    [[nodiscard]] std::chrono::seconds estimated_remaining(uint64_t remaining_bytes,
                                                           TimePoint now) const;

    [[nodiscard]] uint64_t bytes_transferred() const noexcept { return bytes_transferred_; }
    [[nodiscard]] size_t sample_count() const noexcept { return samples_.size(); }

  private:
    TimePoint start_time_;
    uint64_t bytes_transferred_ = 0;
    std::deque<std::pair<TimePoint, uint64_t>> samples_;
};

} // namespace clipxfer

#endif // CLIPXFER_SPEED_TRACKER_HPP
