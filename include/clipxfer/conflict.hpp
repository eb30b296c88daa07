/**
 * @file conflict.hpp
 * @brief Conflict resolution policy for paste operations
 */

#ifndef CLIPXFER_CONFLICT_HPP
#define CLIPXFER_CONFLICT_HPP

#include <filesystem>
#include <functional>
#include <optional>
#include <string_view>

namespace clipxfer {

/**
 * What to do when a paste destination already exists
 */
enum class ConflictResolution {
    Skip,           ///< Leave the destination untouched, skip the source
    Replace,        ///< Remove the destination, then copy
    KeepBoth,       ///< Copy under a fresh "name (N).ext" next to the destination
    ReplaceIfNewer, ///< Replace only if the source mtime is strictly newer
    ReplaceIfLarger ///< Replace only if the source is strictly larger
};

/**
 * Conflict callback, invoked synchronously on the worker thread
 *
 * Receives the source path and the existing destination path.
 */
using ConflictHandler =
    std::function<ConflictResolution(const std::filesystem::path &, const std::filesystem::path &)>;

/// Return the command-line spelling of a policy ("skip", "keep-both", ...)
[[nodiscard]] const char *conflict_resolution_name(ConflictResolution resolution) noexcept;

/// Parse a command-line spelling; returns nullopt for unknown names
[[nodiscard]] std::optional<ConflictResolution> parse_conflict_resolution(std::string_view name);

/// Build a handler that answers every conflict with the same policy
[[nodiscard]] inline ConflictHandler fixed_policy(ConflictResolution resolution) {
    return [resolution](const std::filesystem::path &, const std::filesystem::path &) {
        return resolution;
    };
}

} // namespace clipxfer

#endif // CLIPXFER_CONFLICT_HPP
