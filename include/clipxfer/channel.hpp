/**
 * @file channel.hpp
 * @brief Unbounded progress channel between the paste worker and the UI
 *
 * Any number of senders push PasteProgressUpdate events; the UI side
 * drains them through the receiver without ever blocking a sender.
 *
 * Example:
 * @code
 * auto [tx, rx] = clipxfer::make_progress_channel();
 * std::thread worker([tx] { tx.send(clipxfer::progress::Started{1, 10}); });
 * while (auto ev = rx.recv_for(std::chrono::milliseconds(100))) { ... }
 * @endcode
 */

#ifndef CLIPXFER_CHANNEL_HPP
#define CLIPXFER_CHANNEL_HPP

#include <clipxfer/progress.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace clipxfer {

namespace detail {
struct ChannelState;
} // namespace detail

class ProgressReceiver;

/**
 * Producer handle
 *
 * Copies share the queue. A default-constructed sender is detached and
 * discards everything sent through it.
 */
class ProgressSender {
  public:
    ProgressSender() = default;

    /// Queue an event. Never blocks.
    void send(PasteProgressUpdate update) const;

    [[nodiscard]] bool connected() const noexcept { return state_ != nullptr; }

  private:
    friend std::pair<ProgressSender, ProgressReceiver> make_progress_channel();
    explicit ProgressSender(std::shared_ptr<detail::ChannelState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::ChannelState> state_;
};

/**
 * Consumer handle
 *
 * Meant to be used from one thread; copies share the queue.
 */
class ProgressReceiver {
  public:
    /// Pop the oldest event, if any, without waiting
    [[nodiscard]] std::optional<PasteProgressUpdate> try_recv();

    /// Pop the oldest event, waiting up to @p timeout for one to arrive
    [[nodiscard]] std::optional<PasteProgressUpdate> recv_for(std::chrono::milliseconds timeout);

    /// Pop everything currently queued, oldest first
    [[nodiscard]] std::vector<PasteProgressUpdate> drain();

    /// Number of queued events
    [[nodiscard]] size_t pending() const;

  private:
    friend std::pair<ProgressSender, ProgressReceiver> make_progress_channel();
    explicit ProgressReceiver(std::shared_ptr<detail::ChannelState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::ChannelState> state_;
};

/// Create a connected sender/receiver pair
[[nodiscard]] std::pair<ProgressSender, ProgressReceiver> make_progress_channel();

} // namespace clipxfer

#endif // CLIPXFER_CHANNEL_HPP
