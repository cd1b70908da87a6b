#include "utils/SyslogSink.hpp"
#include <syslog.h>

namespace payload_hal {
namespace utils {
namespace syslog_sink {

namespace {

int levelToPriority(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
        case LogLevel::DEBUG: return LOG_DEBUG;
        case LogLevel::INFO:  return LOG_INFO;
        case LogLevel::WARN:  return LOG_WARNING;
        case LogLevel::ERROR: return LOG_ERR;
        case LogLevel::FATAL: return LOG_CRIT;
        default: return LOG_NOTICE;
    }
}

} // namespace

void open(const char* ident) {
    ::openlog(ident, LOG_PID, LOG_DAEMON);
}

void close() {
    ::closelog();
}

void write(LogLevel level, const std::string& message) {
    ::syslog(levelToPriority(level), "%s", message.c_str());
}

} // namespace syslog_sink
} // namespace utils
} // namespace payload_hal
