/**
 * @file executor.hpp
 * @brief PasteExecutor: recursive copy/move with progress and conflict policy
 */

#ifndef CLIPXFER_EXECUTOR_HPP
#define CLIPXFER_EXECUTOR_HPP

#include <clipxfer/cancellation.hpp>
#include <clipxfer/channel.hpp>
#include <clipxfer/conflict.hpp>
#include <clipxfer/options.hpp>
#include <clipxfer/progress.hpp>

#include <filesystem>
#include <span>

namespace clipxfer {

/**
 * Performs one paste
 *
 * execute() blocks on filesystem I/O and is meant to run on a worker
 * thread. Progress leaves through the sender given at construction;
 * the token is checked between top-level sources and before every chunk.
 *
 * Bytes are moved through an AuraIO engine owned by the execute() call
 * (one ring, single-thread mode), one chunk-sized buffer at a time.
 *
 * Example:
 * @code
 * auto [tx, rx] = clipxfer::make_progress_channel();
 * clipxfer::CancellationToken token;
 * clipxfer::PasteExecutor executor(token, tx);
 *
 * std::thread worker([&] {
 *     auto result = executor.execute(sources, "/tmp/dest", false,
 *                                    clipxfer::fixed_policy(clipxfer::ConflictResolution::KeepBoth));
 * });
 * // drain rx on the UI thread ...
 * @endcode
 */
class PasteExecutor {
  public:
    /**
     * @param token Cancellation token shared with the UI side
     * @param sender Progress channel sender (may be detached)
     * @param options Executor configuration
     * @throws Error (EINVAL) if options are out of range
     */
    PasteExecutor(CancellationToken token, ProgressSender sender, PasteOptions options = {});

    /**
     * Copy (or move) every source into @p destination_dir
     *
     * Per-source I/O failures are recorded in the result and do not stop
     * the paste. Cancellation is not an error: the partial result comes
     * back with cancelled set and a Cancelled event is emitted.
     *
     * @param sources Files, directories or symlinks, processed in order
     * @param destination_dir Existing directory receiving the sources
     * @param is_cut Delete transferred sources afterwards (only when no source failed)
     * @param conflict_handler Called for each destination that already exists
     * @return Paste outcome
     * @throws Error if destination_dir is not a directory or the I/O engine cannot start
     */
    PasteResult execute(std::span<const std::filesystem::path> sources,
                        const std::filesystem::path &destination_dir, bool is_cut,
                        const ConflictHandler &conflict_handler);

    [[nodiscard]] const PasteOptions &options() const noexcept { return options_; }

    /// destination_dir / source's file name
    [[nodiscard]] static std::filesystem::path
    compute_destination(const std::filesystem::path &source,
                        const std::filesystem::path &destination_dir);

    /// First free "stem (N).ext" sibling of @p destination, N counting from 1
    [[nodiscard]] static std::filesystem::path
    unique_destination(const std::filesystem::path &destination);

  private:
    CancellationToken token_;
    ProgressSender sender_;
    PasteOptions options_;
};

} // namespace clipxfer

#endif // CLIPXFER_EXECUTOR_HPP
