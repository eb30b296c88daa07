/**
 * @file conflict.cpp
 * @brief Conflict policy names
 */

#include <clipxfer/conflict.hpp>

namespace clipxfer {

namespace {

struct PolicyName {
    ConflictResolution resolution;
    std::string_view name;
};

constexpr PolicyName POLICY_NAMES[] = {
    {ConflictResolution::Skip, "skip"},
    {ConflictResolution::Replace, "replace"},
    {ConflictResolution::KeepBoth, "keep-both"},
    {ConflictResolution::ReplaceIfNewer, "replace-if-newer"},
    {ConflictResolution::ReplaceIfLarger, "replace-if-larger"},
};

} // namespace

const char *conflict_resolution_name(ConflictResolution resolution) noexcept {
    for (const auto &entry : POLICY_NAMES) {
        if (entry.resolution == resolution) return entry.name.data();
    }
    return "???";
}

std::optional<ConflictResolution> parse_conflict_resolution(std::string_view name) {
    for (const auto &entry : POLICY_NAMES) {
        if (entry.name == name) return entry.resolution;
    }
    return std::nullopt;
}

} // namespace clipxfer
