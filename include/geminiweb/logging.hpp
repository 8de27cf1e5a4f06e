/**
 * @file logging.hpp
 * @brief Level-gated diagnostics for geminiweb
 */

#ifndef GEMINIWEB_LOGGING_HPP
#define GEMINIWEB_LOGGING_HPP

#include <string>

namespace geminiweb {

enum class LogLevel {
    None,
    Error,
    Warning,
    Info,
    Debug,
    All
};

namespace log {

/**
 * Set the process-wide threshold; messages above it are dropped
 */
void set_level(LogLevel level);
LogLevel level();

bool enabled(LogLevel level);

void error(const std::string& message);
void warning(const std::string& message);
void info(const std::string& message);
void debug(const std::string& message);

} // namespace log

} // namespace geminiweb

#endif // GEMINIWEB_LOGGING_HPP
