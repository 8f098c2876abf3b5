/**
 * @file logger.hpp
 * @brief Thread-safe logging for cozyd.
 *
 * Leveled log lines with a component tag and a millisecond timestamp.
 * Messages use `{}` placeholders that are filled from the arguments in
 * order, e.g. `LOG_INFO("Session", "Connected to {}:{}", ip, port)`.
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#pragma once

#include "cozyd/utils/export.hpp"

#include <atomic>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace cozyd {
namespace utils {

/**
 * @enum LogLevel
 * @brief Logging severity levels, lowest first.
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
 * @class Logger
 * @brief Process-wide logger.
 *
 * Output goes to stderr unless redirected with setOutput(). Each line is
 * written under a mutex so lines from different threads never interleave.
 *
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_INFO("Discovery", "Cycle finished: {} devices", count);
 * @endcode
 */
class COZYD_UTILS_API Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    bool isEnabled(LogLevel level) const {
        return level != LogLevel::OFF &&
               static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Enable or disable ANSI colors on the level tag.
     */
    void setColorEnabled(bool enabled) {
        colorEnabled_.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief Redirect output. Pass nullptr to restore stderr.
     *
     * The stream must outlive every subsequent log call.
     */
    void setOutput(std::ostream* out) {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = out ? out : &std::cerr;
    }

    /**
     * @brief Upper-case name of a level ("TRACE" ... "FATAL", "OFF").
     */
    static std::string levelName(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO";
            case LogLevel::WARN:  return "WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            case LogLevel::OFF:   return "OFF";
        }
        return "?";
    }

    /**
     * @brief Parse a level name as accepted on the command line.
     * @param name Upper-case level name.
     * @param level Output level, untouched when the name is unknown.
     * @return True if the name was recognized.
     */
    static bool levelFromString(const std::string& name, LogLevel& level) {
        for (int i = static_cast<int>(LogLevel::TRACE);
             i <= static_cast<int>(LogLevel::OFF); ++i) {
            if (levelName(static_cast<LogLevel>(i)) == name) {
                level = static_cast<LogLevel>(i);
                return true;
            }
        }
        return false;
    }

    template<typename... Args>
    void log(LogLevel level, const char* component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }

        std::ostringstream line;
        writeTimestamp(line);

        const bool color = colorEnabled_.load(std::memory_order_relaxed);
        if (color) {
            line << colorCode(level);
        }
        line << "[" << std::left << std::setw(5) << levelName(level) << "]";
        if (color) {
            line << "\033[0m";
        }
        line << " [" << component << "] ";
        appendFormatted(line, format, std::forward<Args>(args)...);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            (*out_) << line.str() << std::endl;
        }

        if (level == LogLevel::FATAL) {
            std::abort();
        }
    }

private:
    Logger()
        : level_(static_cast<int>(LogLevel::INFO))
        , colorEnabled_(false)
        , out_(&std::cerr)
    {}
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static void writeTimestamp(std::ostringstream& os);

    static void appendFormatted(std::ostringstream& os, const char* format) {
        os << format;
    }

    template<typename T, typename... Args>
    static void appendFormatted(std::ostringstream& os, const char* format,
                                T&& value, Args&&... args) {
        for (; *format; ++format) {
            if (format[0] == '{' && format[1] == '}') {
                os << value;
                appendFormatted(os, format + 2, std::forward<Args>(args)...);
                return;
            }
            os << *format;
        }
        // More arguments than placeholders: the extras are dropped.
    }

    static const char* colorCode(LogLevel level);

    std::atomic<int> level_;
    std::atomic<bool> colorEnabled_;
    std::mutex mutex_;
    std::ostream* out_;
};

}  // namespace utils
}  // namespace cozyd

#define LOG_TRACE(component, ...) \
    ::cozyd::utils::Logger::instance().log(::cozyd::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::cozyd::utils::Logger::instance().log(::cozyd::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::cozyd::utils::Logger::instance().log(::cozyd::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::cozyd::utils::Logger::instance().log(::cozyd::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::cozyd::utils::Logger::instance().log(::cozyd::utils::LogLevel::ERROR, component, __VA_ARGS__)

#define LOG_FATAL(component, ...) \
    ::cozyd::utils::Logger::instance().log(::cozyd::utils::LogLevel::FATAL, component, __VA_ARGS__)
