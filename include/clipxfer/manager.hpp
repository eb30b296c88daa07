/**
 * @file manager.hpp
 * @brief ClipboardManager: current operation, history and paste lifecycle
 */

#ifndef CLIPXFER_MANAGER_HPP
#define CLIPXFER_MANAGER_HPP

#include <clipxfer/cancellation.hpp>
#include <clipxfer/channel.hpp>
#include <clipxfer/operation.hpp>

#include <cstddef>
#include <deque>
#include <filesystem>
#include <optional>
#include <span>
#include <vector>

namespace clipxfer {

/**
 * Clipboard state of one file-manager window
 *
 * Owned by the UI thread; not thread-safe. Only the CancellationToken
 * and the ProgressSender it hands out cross over to the paste worker.
 *
 * Example:
 * @code
 * clipxfer::ClipboardManager clipboard;
 * clipboard.cut({"/home/me/a.txt"});
 *
 * auto rx = clipboard.setup_progress_channel();
 * auto token = clipboard.start_paste();
 * clipxfer::PasteExecutor executor(token, *clipboard.progress_sender());
 * // run executor.execute(...) on a worker, drain rx here ...
 * clipboard.complete_paste(clipboard.is_cut());
 * @endcode
 */
class ClipboardManager {
  public:
    static constexpr size_t MAX_HISTORY = 10;

    ClipboardManager() = default;

    /// Mark @p paths for copy, archiving the current operation
    void copy(std::vector<std::filesystem::path> paths);

    /// Mark @p paths for cut, archiving the current operation
    void cut(std::vector<std::filesystem::path> paths);

    /// Archive the current operation (if any) and unset it
    void clear();

    [[nodiscard]] bool has_content() const noexcept { return operation_.has_value(); }
    [[nodiscard]] const std::optional<ClipboardOperation> &operation() const noexcept {
        return operation_;
    }

    /// Paths of the current operation; empty when there is none
    [[nodiscard]] std::span<const std::filesystem::path> paths() const noexcept;

    [[nodiscard]] bool is_cut() const noexcept { return operation_ && operation_->is_cut(); }
    [[nodiscard]] bool is_copy() const noexcept { return operation_ && operation_->is_copy(); }

    /// True if @p path is part of the current operation
    [[nodiscard]] bool contains_path(const std::filesystem::path &path) const;

    /// True if the current operation is a cut containing @p path
    [[nodiscard]] bool is_path_cut(const std::filesystem::path &path) const;

    /// Archived operations, newest first, at most MAX_HISTORY
    [[nodiscard]] const std::deque<ClipboardEntry> &history() const noexcept { return history_; }

    /// Number of paths in the current operation
    [[nodiscard]] size_t item_count() const noexcept { return paths().size(); }

    // -------------------------------------------------------------------------
    // Paste lifecycle
    // -------------------------------------------------------------------------

    /// Create a fresh progress channel for the next paste; returns its receiver
    [[nodiscard]] ProgressReceiver setup_progress_channel();

    /// Sender of the current progress channel, if one was set up
    [[nodiscard]] std::optional<ProgressSender> progress_sender() const { return progress_sender_; }

    /// Issue and record a new cancellation token
    [[nodiscard]] CancellationToken start_paste();

    /// Cancel the active paste, if any
    void cancel_paste();

    /// True while a paste was started and has been neither cancelled nor completed
    [[nodiscard]] bool is_paste_active() const noexcept;

    /**
     * Finish the active paste
     *
     * Drops the token and the progress channel. When @p was_cut is true
     * the clipboard operation is cleared too (the cut files have moved),
     * without being archived.
     */
    void complete_paste(bool was_cut);

  private:
    void set_operation(ClipboardOperation operation);
    void archive_current();

    std::optional<ClipboardOperation> operation_;
    std::deque<ClipboardEntry> history_;
    std::optional<CancellationToken> active_paste_;
    std::optional<ProgressSender> progress_sender_;
};

} // namespace clipxfer

#endif // CLIPXFER_MANAGER_HPP
