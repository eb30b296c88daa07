/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation token shared between UI and worker
 */

#ifndef CLIPXFER_CANCELLATION_HPP
#define CLIPXFER_CANCELLATION_HPP

#include <atomic>
#include <memory>

namespace clipxfer {

/**
 * Shared cancellation flag
 *
 * Copies share one flag: the manager keeps one copy, the executor gets
 * another by value. cancel() is sticky; once set the flag never clears.
 * Thread-safe.
 *
 * Example:
 * @code
 * clipxfer::CancellationToken token;
 * std::thread worker([token, &executor_args] { ... token.is_cancelled() ... });
 * token.cancel();
 * @endcode
 */
class CancellationToken {
  public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    /// Request cancellation. Seen by every copy of this token.
    void cancel() const noexcept { flag_->store(true, std::memory_order_release); }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return flag_->load(std::memory_order_acquire);
    }

    /// True if both tokens share the same flag
    [[nodiscard]] bool same_as(const CancellationToken &other) const noexcept {
        return flag_ == other.flag_;
    }

  private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace clipxfer

#endif // CLIPXFER_CANCELLATION_HPP
