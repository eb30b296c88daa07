/**
 * @file operation.hpp
 * @brief Clipboard operation (copy/cut path set) and history entry
 */

#ifndef CLIPXFER_OPERATION_HPP
#define CLIPXFER_OPERATION_HPP

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <span>
#include <utility>
#include <vector>

namespace clipxfer {

/**
 * The set of paths marked for copy or cut
 *
 * Either Copy{paths} or Cut{paths}; built with copy() / cut().
 */
class ClipboardOperation {
  public:
    enum class Kind { Copy, Cut };

    [[nodiscard]] static ClipboardOperation copy(std::vector<std::filesystem::path> paths) {
        return ClipboardOperation(Kind::Copy, std::move(paths));
    }

    [[nodiscard]] static ClipboardOperation cut(std::vector<std::filesystem::path> paths) {
        return ClipboardOperation(Kind::Cut, std::move(paths));
    }

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_copy() const noexcept { return kind_ == Kind::Copy; }
    [[nodiscard]] bool is_cut() const noexcept { return kind_ == Kind::Cut; }

    [[nodiscard]] std::span<const std::filesystem::path> paths() const noexcept { return paths_; }

    [[nodiscard]] bool contains(const std::filesystem::path &path) const {
        return std::find(paths_.begin(), paths_.end(), path) != paths_.end();
    }

    bool operator==(const ClipboardOperation &) const = default;

  private:
    ClipboardOperation(Kind kind, std::vector<std::filesystem::path> paths)
        : kind_(kind), paths_(std::move(paths)) {}

    Kind kind_;
    std::vector<std::filesystem::path> paths_;
};

/**
 * Archived clipboard operation
 *
 * Entries are created when an operation is replaced or cleared and are
 * never modified afterwards.
 */
struct ClipboardEntry {
    ClipboardOperation operation;
    std::chrono::system_clock::time_point timestamp;

    explicit ClipboardEntry(ClipboardOperation op)
        : operation(std::move(op)), timestamp(std::chrono::system_clock::now()) {}
};

} // namespace clipxfer

#endif // CLIPXFER_OPERATION_HPP
