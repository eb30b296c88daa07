/**
 * @file log.hpp
 * @brief Logging interface for clipxfer
 *
 * clipxfer does not own a log sink. Library messages are emitted through
 * the AuraIO process-wide log pipeline, so one handler receives both the
 * I/O engine's diagnostics and the transfer engine's messages (prefixed
 * with "clipxfer:").
 *
 * Example:
 * @code
 *   clipxfer::set_log_handler([](clipxfer::LogLevel level, std::string_view msg) {
 *       std::cerr << "[" << clipxfer::log_level_name(level) << "] " << msg << "\n";
 *   });
 *
 *   // ... run pastes ...
 *
 *   clipxfer::clear_log_handler();
 * @endcode
 */

#ifndef CLIPXFER_LOG_HPP
#define CLIPXFER_LOG_HPP

#include <aura.hpp>

namespace clipxfer {

using LogLevel = aura::LogLevel;
using LogHandler = aura::LogHandler;

using aura::clear_log_handler;
using aura::log_emit;
using aura::log_level_name;
using aura::set_log_handler;

} // namespace clipxfer

#endif // CLIPXFER_LOG_HPP
