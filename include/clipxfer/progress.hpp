/**
 * @file progress.hpp
 * @brief Progress events, progress snapshot and paste result
 *
 * The executor describes a running paste as a stream of
 * PasteProgressUpdate events. A UI keeps a PasteProgress snapshot and
 * feeds every drained event through PasteProgress::apply().
 */

#ifndef CLIPXFER_PROGRESS_HPP
#define CLIPXFER_PROGRESS_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace clipxfer {

/**
 * Outcome of a paste
 *
 * Every top-level source the executor processed is listed in exactly one
 * of successful_files (by its destination path), skipped_files or
 * failed_files (both by source path). Sources left unprocessed because of
 * cancellation appear in none of them.
 */
struct PasteResult {
    std::vector<std::filesystem::path> successful_files;
    std::vector<std::filesystem::path> skipped_files;
    std::vector<std::pair<std::filesystem::path, std::string>> failed_files;
    uint64_t total_bytes_transferred = 0;
    std::chrono::milliseconds duration{0};

    /// Set when the paste stopped early because its token was cancelled
    bool cancelled = false;

    /// Cut sources that were transferred but could not be deleted afterwards
    std::vector<std::pair<std::filesystem::path, std::string>> cleanup_failures;

    [[nodiscard]] bool is_success() const noexcept { return failed_files.empty(); }

    [[nodiscard]] size_t total_processed() const noexcept {
        return successful_files.size() + skipped_files.size() + failed_files.size();
    }
};

/// Progress event payloads
namespace progress {

struct Started {
    size_t total_files;
    uint64_t total_bytes;
};

/// A regular file (top-level or inside a directory) starts streaming
struct FileStarted {
    std::filesystem::path file;
    uint64_t file_size;
};

/// One chunk was written
struct BytesTransferred {
    uint64_t bytes;
    uint64_t total_transferred;
    uint64_t speed_bytes_per_sec;
    std::chrono::seconds estimated_remaining;
};

/// A top-level source finished; completed_files counts files finished so far
struct FileCompleted {
    std::filesystem::path file;
    size_t completed_files;
};

struct FileSkipped {
    std::filesystem::path file;
    std::string reason;
    size_t completed_files;
};

struct FileFailed {
    std::filesystem::path file;
    std::string error;
    size_t completed_files;
};

struct ConflictDetected {
    std::filesystem::path source;
    std::filesystem::path destination;
};

/// A cut source could not be removed after a successful transfer
struct CleanupFailed {
    std::filesystem::path file;
    std::string error;
};

struct Completed {
    PasteResult result;
};

struct Cancelled {
    PasteResult partial_result;
};

} // namespace progress

using PasteProgressUpdate =
    std::variant<progress::Started, progress::FileStarted, progress::BytesTransferred,
                 progress::FileCompleted, progress::FileSkipped, progress::FileFailed,
                 progress::ConflictDetected, progress::CleanupFailed, progress::Completed,
                 progress::Cancelled>;

/// Short name of an event ("Started", "BytesTransferred", ...)
[[nodiscard]] const char *update_name(const PasteProgressUpdate &update) noexcept;

/// True for the last event of a paste (Completed or Cancelled)
[[nodiscard]] inline bool is_terminal(const PasteProgressUpdate &update) noexcept {
    return std::holds_alternative<progress::Completed>(update) ||
           std::holds_alternative<progress::Cancelled>(update);
}

/**
 * Snapshot of a running paste, as shown by a progress view
 *
 * current_file_progress is a fraction in [0, 1].
 */
struct PasteProgress {
    std::filesystem::path current_file;
    double current_file_progress = 0.0;
    size_t total_files = 0;
    size_t completed_files = 0;
    uint64_t bytes_transferred = 0;
    uint64_t total_bytes = 0;
    uint64_t speed_bytes_per_sec = 0;
    std::chrono::seconds estimated_remaining{0};

    PasteProgress() = default;
    PasteProgress(size_t files, uint64_t bytes) : total_files(files), total_bytes(bytes) {}

    /// Percent done: by bytes, or by file count when there are no bytes
    [[nodiscard]] double percentage() const noexcept;

    /// Fold one event into the snapshot
    void apply(const PasteProgressUpdate &update);

  private:
    uint64_t current_file_size_ = 0;
    uint64_t current_file_bytes_ = 0;
};

} // namespace clipxfer

#endif // CLIPXFER_PROGRESS_HPP
