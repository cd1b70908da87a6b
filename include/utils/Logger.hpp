#pragma once

#include <string>
#include <sstream>
#include <iostream>
#include <iomanip>
#include <chrono>
#include <mutex>
#include <optional>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include "utils/SyslogSink.hpp"

namespace payload_hal {
namespace utils {

/**
 * @brief Where log lines end up
 *
 * TERMINAL writes timestamped lines to stdout (development),
 * SYSLOG routes them to the LOG_DAEMON facility (flight).
 */
enum class LogSink {
    TERMINAL,
    SYSLOG
};

class Logger {
public:
    static constexpr const char* SINK_ENV = "PAYLOAD_HAL_LOGGER";
    static constexpr const char* LEVEL_ENV = "PAYLOAD_HAL_LOG";

    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        current_level_ = level;
    }

    LogLevel getLevel() const {
        return current_level_;
    }

    void setSink(LogSink sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sink == sink_) return;

        if (sink == LogSink::SYSLOG) {
            syslog_sink::open("payload_hal");
        } else {
            syslog_sink::close();
        }
        sink_ = sink;
    }

    LogSink getSink() const {
        return sink_;
    }

    /**
     * @brief Apply PAYLOAD_HAL_LOGGER ("term" | "syslog") and
     *        PAYLOAD_HAL_LOG ("trace" ... "error") from the environment
     *
     * Unset variables leave the terminal sink at INFO.
     */
    void configureFromEnvironment() {
        const char* sink = std::getenv(SINK_ENV);
        setSink(sink != nullptr && toLower(sink) == "syslog" ? LogSink::SYSLOG
                                                             : LogSink::TERMINAL);

        const char* level = std::getenv(LEVEL_ENV);
        setLevel(level != nullptr ? parseLevel(level).value_or(LogLevel::INFO)
                                  : LogLevel::INFO);
    }

    /**
     * @brief Parse a level name, case-insensitive
     */
    static std::optional<LogLevel> parseLevel(const std::string& name) {
        const std::string lowered = toLower(name);
        if (lowered == "trace") return LogLevel::TRACE;
        if (lowered == "debug") return LogLevel::DEBUG;
        if (lowered == "info")  return LogLevel::INFO;
        if (lowered == "warn")  return LogLevel::WARN;
        if (lowered == "error") return LogLevel::ERROR;
        if (lowered == "fatal") return LogLevel::FATAL;
        return std::nullopt;
    }

    template<typename... Args>
    void log(LogLevel level, const Args&... args) {
        if (level < current_level_) return;

        std::lock_guard<std::mutex> lock(mutex_);

        if (sink_ == LogSink::SYSLOG) {
            std::ostringstream oss;
            ((oss << args), ...);
            syslog_sink::write(level, oss.str());
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::ostringstream oss;
        oss << "[" << std::put_time(std::localtime(&time_t), "%H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count()
            << "] [" << levelToString(level) << "] ";

        ((oss << args), ...);
        oss << std::endl;

        std::cout << oss.str();
    }

    template<typename... Args>
    void trace(const Args&... args) { log(LogLevel::TRACE, args...); }

    template<typename... Args>
    void debug(const Args&... args) { log(LogLevel::DEBUG, args...); }

    template<typename... Args>
    void info(const Args&... args) { log(LogLevel::INFO, args...); }

    template<typename... Args>
    void warn(const Args&... args) { log(LogLevel::WARN, args...); }

    template<typename... Args>
    void error(const Args&... args) { log(LogLevel::ERROR, args...); }

    template<typename... Args>
    void fatal(const Args&... args) { log(LogLevel::FATAL, args...); }

private:
    Logger() : current_level_(LogLevel::INFO), sink_(LogSink::TERMINAL) {}

    static std::string toLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    std::string levelToString(LogLevel level) const {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            default: return "UNKNOWN";
        }
    }

    LogLevel current_level_;
    LogSink sink_;
    std::mutex mutex_;
};

// Convenience macros
#define LOG_TRACE(...) payload_hal::utils::Logger::getInstance().trace(__VA_ARGS__)
#define LOG_DEBUG(...) payload_hal::utils::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...)  payload_hal::utils::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...)  payload_hal::utils::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) payload_hal::utils::Logger::getInstance().error(__VA_ARGS__)
#define LOG_FATAL(...) payload_hal::utils::Logger::getInstance().fatal(__VA_ARGS__)

} // namespace utils
} // namespace payload_hal
