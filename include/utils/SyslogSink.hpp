#pragma once

#include <string>

namespace payload_hal {
namespace utils {

enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

/**
 * @brief Thin bridge to the system logger (LOG_DAEMON facility)
 *
 * Kept out of Logger.hpp because <syslog.h> defines LOG_INFO and
 * LOG_DEBUG as priorities, which clash with the logging macros.
 */
namespace syslog_sink {

void open(const char* ident);
void close();
void write(LogLevel level, const std::string& message);

} // namespace syslog_sink

} // namespace utils
} // namespace payload_hal
