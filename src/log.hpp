/**
 * @file log.hpp
 * @brief Internal logging helper
 *
 * Internal header - not part of public API.
 * Formats printf-style and forwards to the AuraIO log pipeline with a
 * "clipxfer: " prefix. No-op cost beyond formatting when no handler is
 * installed.
 */

#ifndef CLIPXFER_SRC_LOG_HPP
#define CLIPXFER_SRC_LOG_HPP

#include <clipxfer/log.hpp>

namespace clipxfer::detail {

void log(LogLevel level, const char *fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace clipxfer::detail

#endif // CLIPXFER_SRC_LOG_HPP
