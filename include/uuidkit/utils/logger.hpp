/**
 * @file logger.hpp
 * @brief Thread-safe native logging framework for uuidkit.
 *
 * Zero external dependencies. Lines carry a timestamp, a level column
 * and a component tag; messages use "{}" placeholders.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#pragma once

#include "uuidkit/utils/export.hpp"

#include <atomic>
#include <iosfwd>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace uuidkit {
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
 * @brief Convert LogLevel to its padded column representation.
 */
inline const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF  ";
        default:              return "?????";
    }
}

/**
 * @class Logger
 * @brief Process-wide logger writing to std::cerr or a caller-supplied stream.
 *
 * The generators log under their own component tag:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_DEBUG("TimeGenerator", "Created generator: node {}", node);
 * LOG_WARN("TimeGenerator", "Clock went back by {} intervals", delta);
 * @endcode
 *
 * FATAL messages abort the process after they are written.
 */
class UUIDKIT_UTILS_API Logger {
public:
    static Logger& instance();

    /// Level name without column padding ("INFO", "WARN", ...).
    static std::string levelName(LogLevel level);

    /**
     * @brief Parse a level name, case-insensitively.
     *
     * "WARNING" is accepted as an alias of WARN.
     *
     * @return The matching level, or INFO for unknown names.
     */
    static LogLevel parseLevel(const std::string& name);

    void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    bool isEnabled(LogLevel level) const {
        return static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    /// ANSI colors on the level column.
    void setColorEnabled(bool enabled) {
        colorEnabled_.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief Redirect output.
     * @param out Target stream, not owned. nullptr restores std::cerr.
     */
    void setOutput(std::ostream* out);

    template<typename... Args>
    void log(LogLevel level, const char* component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }
        write(level, component, formatMessage(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void log(LogLevel level, const std::string& component, const char* format, Args&&... args) {
        log(level, component.c_str(), format, std::forward<Args>(args)...);
    }

private:
    Logger();
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::string formatMessage(const char* format) {
        return std::string(format);
    }

    // Each "{}" takes the next argument; surplus placeholders stay verbatim
    template<typename T, typename... Args>
    static std::string formatMessage(const char* format, T&& value, Args&&... args) {
        std::ostringstream oss;

        while (*format) {
            if (*format == '{' && *(format + 1) == '}') {
                oss << value;
                return oss.str() + formatMessage(format + 2, std::forward<Args>(args)...);
            }
            oss << *format++;
        }

        return oss.str();
    }

    /// Timestamp, level and component prefix, then one locked write.
    void write(LogLevel level, const char* component, const std::string& message);

    std::atomic<int> level_;
    std::atomic<bool> colorEnabled_;
    std::ostream* out_;
    std::mutex mutex_;
};

}  // namespace utils
}  // namespace uuidkit

// =============================================================================
// Convenience Macros
// =============================================================================

#define LOG_TRACE(component, ...) \
    ::uuidkit::utils::Logger::instance().log(::uuidkit::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::uuidkit::utils::Logger::instance().log(::uuidkit::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::uuidkit::utils::Logger::instance().log(::uuidkit::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::uuidkit::utils::Logger::instance().log(::uuidkit::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::uuidkit::utils::Logger::instance().log(::uuidkit::utils::LogLevel::ERROR, component, __VA_ARGS__)

#define LOG_FATAL(component, ...) \
    ::uuidkit::utils::Logger::instance().log(::uuidkit::utils::LogLevel::FATAL, component, __VA_ARGS__)

// Arguments are not evaluated unless the condition holds and the level is on
#define LOG_IF(level, component, condition, ...) \
    do { \
        if ((condition) && ::uuidkit::utils::Logger::instance().isEnabled(level)) { \
            ::uuidkit::utils::Logger::instance().log(level, component, __VA_ARGS__); \
        } \
    } while(0)
