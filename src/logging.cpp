/**
 * @file logging.cpp
 * @brief Level-gated diagnostics for geminiweb
 */

#include "geminiweb/logging.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace geminiweb {

namespace log {

static std::atomic<LogLevel> current_level{LogLevel::Warning};
static std::mutex output_mutex;

static void write(LogLevel level, const char* label, const std::string& message) {
    if (!enabled(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << "[geminiweb] " << label << ": " << message << std::endl;
}

void set_level(LogLevel level) {
    current_level.store(level);
}

LogLevel level() {
    return current_level.load();
}

bool enabled(LogLevel level) {
    return level != LogLevel::None && static_cast<int>(level) <= static_cast<int>(current_level.load());
}

void error(const std::string& message) {
    write(LogLevel::Error, "Error", message);
}

void warning(const std::string& message) {
    write(LogLevel::Warning, "Warning", message);
}

void info(const std::string& message) {
    write(LogLevel::Info, "Info", message);
}

void debug(const std::string& message) {
    write(LogLevel::Debug, "Debug", message);
}

} // namespace log

} // namespace geminiweb
