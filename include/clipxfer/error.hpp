// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 clipxfer Contributors


/**
 * @file error.hpp
 * @brief Error exception class for clipxfer
 */

#ifndef CLIPXFER_ERROR_HPP
#define CLIPXFER_ERROR_HPP

#include <cerrno>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace clipxfer {

/**
 * Exception class for clipxfer errors
 *
 * Inherits from std::system_error so callers can catch either
 * clipxfer::Error or std::system_error (aura::Error, thrown by the I/O
 * engine, is a std::system_error as well). Uses std::generic_category
 * for POSIX errno values.
 */
class Error : public std::system_error {
  public:
    /**
     * Construct error from errno value
     *
     * @param err Error code (positive errno value)
     * @param context Optional context message
     */
    explicit Error(int err, std::string_view context = {})
        : std::system_error(err, std::generic_category(), std::string(context)) {}

    /**
     * Get the error code
     * @return Positive errno value
     */
    [[nodiscard]] int code() const noexcept { return std::system_error::code().value(); }

    // Convenience predicates
    [[nodiscard]] bool is_invalid() const noexcept { return code() == EINVAL; }
    [[nodiscard]] bool is_not_found() const noexcept { return code() == ENOENT; }
    [[nodiscard]] bool is_not_directory() const noexcept { return code() == ENOTDIR; }
    [[nodiscard]] bool is_exists() const noexcept { return code() == EEXIST; }
    [[nodiscard]] bool is_permission() const noexcept {
        return code() == EACCES || code() == EPERM;
    }
};

/**
 * Throw Error from current errno, naming the path involved
 *
 * @param what Short description of the failed action ("cannot open")
 * @param path Path the action was applied to
 * @throws Error with current errno
 */
[[noreturn]] inline void throw_errno(std::string_view what, const std::filesystem::path &path) {
    int err = errno;
    std::string context(what);
    context += " '";
    context += path.string();
    context += '\'';
    throw Error(err, context);
}

/**
 * Throw Error built from a std::error_code reported by std::filesystem
 *
 * @param what Short description of the failed action
 * @param path Path the action was applied to
 * @param ec Error code (generic or system category)
 */
[[noreturn]] inline void throw_error_code(std::string_view what, const std::filesystem::path &path,
                                          const std::error_code &ec) {
    std::string context(what);
    context += " '";
    context += path.string();
    context += '\'';
    throw Error(ec.value(), context);
}

} // namespace clipxfer

#endif // CLIPXFER_ERROR_HPP
