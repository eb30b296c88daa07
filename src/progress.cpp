/**
 * @file progress.cpp
 * @brief PasteProgress bookkeeping
 */

#include <clipxfer/progress.hpp>

#include <iterator>
#include <type_traits>

namespace clipxfer {

const char *update_name(const PasteProgressUpdate &update) noexcept {
    static constexpr const char *NAMES[] = {
        "Started",          "FileStarted",   "BytesTransferred", "FileCompleted", "FileSkipped",
        "FileFailed",       "ConflictDetected", "CleanupFailed", "Completed",     "Cancelled",
    };
    static_assert(std::size(NAMES) == std::variant_size_v<PasteProgressUpdate>);
    if (update.valueless_by_exception()) return "???";
    return NAMES[update.index()];
}

double PasteProgress::percentage() const noexcept {
    if (total_bytes == 0) {
        if (total_files == 0) return 100.0;
        return static_cast<double>(completed_files) / static_cast<double>(total_files) * 100.0;
    }
    return static_cast<double>(bytes_transferred) / static_cast<double>(total_bytes) * 100.0;
}

void PasteProgress::apply(const PasteProgressUpdate &update) {
    std::visit(
        [this](const auto &ev) {
            using T = std::decay_t<decltype(ev)>;
            if constexpr (std::is_same_v<T, progress::Started>) {
                *this = PasteProgress(ev.total_files, ev.total_bytes);
            } else if constexpr (std::is_same_v<T, progress::FileStarted>) {
                current_file = ev.file;
                current_file_size_ = ev.file_size;
                current_file_bytes_ = 0;
                current_file_progress = ev.file_size == 0 ? 1.0 : 0.0;
            } else if constexpr (std::is_same_v<T, progress::BytesTransferred>) {
                bytes_transferred = ev.total_transferred;
                speed_bytes_per_sec = ev.speed_bytes_per_sec;
                estimated_remaining = ev.estimated_remaining;
                current_file_bytes_ += ev.bytes;
                if (current_file_size_ > 0) {
                    double fraction = static_cast<double>(current_file_bytes_) /
                                      static_cast<double>(current_file_size_);
                    current_file_progress = fraction > 1.0 ? 1.0 : fraction;
                }
            } else if constexpr (std::is_same_v<T, progress::FileCompleted> ||
                                 std::is_same_v<T, progress::FileSkipped> ||
                                 std::is_same_v<T, progress::FileFailed>) {
                completed_files = ev.completed_files;
            } else if constexpr (std::is_same_v<T, progress::Completed>) {
                completed_files = total_files;
                bytes_transferred = total_bytes;
                estimated_remaining = std::chrono::seconds::zero();
                current_file_progress = 1.0;
            } else if constexpr (std::is_same_v<T, progress::Cancelled>) {
                estimated_remaining = std::chrono::seconds::zero();
            }
            // ConflictDetected and CleanupFailed do not move the counters
        },
        update);
}

} // namespace clipxfer
