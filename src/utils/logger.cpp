/**
 * @file logger.cpp
 * @brief Logger implementation.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#include "uuidkit/utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace uuidkit {
namespace utils {

namespace {

const char* colorCode(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[90m";    // Gray
        case LogLevel::DEBUG: return "\033[36m";    // Cyan
        case LogLevel::INFO:  return "\033[32m";    // Green
        case LogLevel::WARN:  return "\033[33m";    // Yellow
        case LogLevel::ERROR: return "\033[31m";    // Red
        case LogLevel::FATAL: return "\033[35;1m";  // Bold Magenta
        default:              return "";
    }
}

// [YYYY-MM-DD HH:MM:SS.mmm] in local time
void appendTimestamp(std::ostream& os) {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    os << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
       << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
}

}  // anonymous namespace

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : level_(static_cast<int>(LogLevel::INFO))
    , colorEnabled_(true)
    , out_(&std::cerr)
{}

std::string Logger::levelName(LogLevel level) {
    std::string name = logLevelToString(level);
    name.erase(name.find_last_not_of(' ') + 1);
    return name;
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (int i = static_cast<int>(LogLevel::TRACE); i <= static_cast<int>(LogLevel::OFF); ++i) {
        LogLevel level = static_cast<LogLevel>(i);
        if (upper == levelName(level)) {
            return level;
        }
    }
    if (upper == "WARNING") {
        return LogLevel::WARN;
    }
    return LogLevel::INFO;
}

void Logger::setOutput(std::ostream* out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = out ? out : &std::cerr;
}

void Logger::write(LogLevel level, const char* component, const std::string& message) {
    std::ostringstream line;
    appendTimestamp(line);

    bool color = colorEnabled_.load(std::memory_order_relaxed);
    if (color) {
        line << colorCode(level);
    }
    line << "[" << logLevelToString(level) << "]";
    if (color) {
        line << "\033[0m";
    }
    line << " [" << component << "] " << message;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        *out_ << line.str() << std::endl;
    }

    if (level == LogLevel::FATAL) {
        std::abort();
    }
}

}  // namespace utils
}  // namespace uuidkit
