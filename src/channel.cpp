/**
 * @file channel.cpp
 * @brief Progress channel implementation
 */

#include <clipxfer/channel.hpp>

#include <condition_variable>
#include <deque>
#include <mutex>

namespace clipxfer {

namespace detail {

struct ChannelState {
    mutable std::mutex mutex;
    std::condition_variable ready;
    std::deque<PasteProgressUpdate> queue;
};

} // namespace detail

void ProgressSender::send(PasteProgressUpdate update) const {
    if (!state_) return;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->queue.push_back(std::move(update));
    }
    state_->ready.notify_one();
}

std::optional<PasteProgressUpdate> ProgressReceiver::try_recv() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->queue.empty()) return std::nullopt;
    PasteProgressUpdate update = std::move(state_->queue.front());
    state_->queue.pop_front();
    return update;
}

std::optional<PasteProgressUpdate> ProgressReceiver::recv_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(state_->mutex);
    if (!state_->ready.wait_for(lock, timeout, [this] { return !state_->queue.empty(); })) {
        return std::nullopt;
    }
    PasteProgressUpdate update = std::move(state_->queue.front());
    state_->queue.pop_front();
    return update;
}

std::vector<PasteProgressUpdate> ProgressReceiver::drain() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    std::vector<PasteProgressUpdate> out;
    out.reserve(state_->queue.size());
    for (auto &update : state_->queue) out.push_back(std::move(update));
    state_->queue.clear();
    return out;
}

size_t ProgressReceiver::pending() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->queue.size();
}

std::pair<ProgressSender, ProgressReceiver> make_progress_channel() {
    auto state = std::make_shared<detail::ChannelState>();
    return {ProgressSender(state), ProgressReceiver(state)};
}

} // namespace clipxfer
