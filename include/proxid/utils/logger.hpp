/**
 * @file logger.hpp
 * @brief Thread-safe logging for proxid.
 *
 * Level-filtered, component-tagged log lines with millisecond timestamps.
 * Messages use "{}" placeholders that are filled in order from the
 * arguments, each of which only needs an operator<<.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#pragma once

#include "proxid/utils/export.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace proxid {
namespace utils {

/**
 * @enum LogLevel
 * @brief Logging severity levels.
 */
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

/**
 * @brief Fixed-width name of a level, as printed in log lines.
 */
PROXID_UTILS_API const char* logLevelToString(LogLevel level);

/**
 * @brief Parse a level name (case-insensitive).
 * @return The level, or INFO when the name is not recognised.
 */
PROXID_UTILS_API LogLevel parseLogLevel(const std::string& name);

/**
 * @class Logger
 * @brief Process-wide logger.
 *
 * Usage:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_INFO("Scan", "Sighting from {} rssi={}", address, rssi);
 * @endcode
 *
 * Output goes to stderr unless a sink is installed. FATAL lines abort the
 * process after being written; library code does not log at FATAL.
 */
class PROXID_UTILS_API Logger {
public:
    /// Receives each fully formatted line (without trailing newline).
    using Sink = std::function<void(LogLevel level, const std::string& line)>;

    static Logger& instance();

    void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    bool isEnabled(LogLevel level) const {
        return static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    void setColorEnabled(bool enabled) {
        colorEnabled_.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief Redirect output. Pass an empty function to restore stderr.
     */
    void setSink(Sink sink);

    template<typename... Args>
    void log(LogLevel level, const char* component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }
        std::ostringstream oss;
        appendFormatted(oss, format, std::forward<Args>(args)...);
        write(level, component, oss.str());
    }

private:
    Logger();
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static void appendFormatted(std::ostringstream& oss, const char* format) {
        oss << format;
    }

    template<typename T, typename... Args>
    static void appendFormatted(std::ostringstream& oss, const char* format,
                                T&& value, Args&&... args) {
        while (*format) {
            if (format[0] == '{' && format[1] == '}') {
                oss << value;
                appendFormatted(oss, format + 2, std::forward<Args>(args)...);
                return;
            }
            oss << *format++;
        }
    }

    void write(LogLevel level, const char* component, const std::string& message);

    std::atomic<int> level_;
    std::atomic<bool> colorEnabled_;
    std::mutex mutex_;
    Sink sink_;
};

}  // namespace utils
}  // namespace proxid

#define LOG_TRACE(component, ...) \
    ::proxid::utils::Logger::instance().log(::proxid::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::proxid::utils::Logger::instance().log(::proxid::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::proxid::utils::Logger::instance().log(::proxid::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::proxid::utils::Logger::instance().log(::proxid::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::proxid::utils::Logger::instance().log(::proxid::utils::LogLevel::ERROR, component, __VA_ARGS__)

#define LOG_FATAL(component, ...) \
    ::proxid::utils::Logger::instance().log(::proxid::utils::LogLevel::FATAL, component, __VA_ARGS__)
