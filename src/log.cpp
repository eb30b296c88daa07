/**
 * @file log.cpp
 * @brief Internal logging helper
 */

#include "log.hpp"

#include <cstdarg>
#include <cstdio>
#include <string>

namespace clipxfer::detail {

void log(LogLevel level, const char *fmt, ...) {
    char buf[512];
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);

    std::string msg("clipxfer: ");
    msg += buf;
    aura::log_emit(level, msg);
}

} // namespace clipxfer::detail
