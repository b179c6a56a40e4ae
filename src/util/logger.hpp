#ifndef PHIGUARD_UTIL_LOGGER_HPP
#define PHIGUARD_UTIL_LOGGER_HPP

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <mutex>
#include <memory>
#include <functional>
#include <iomanip>
#include <chrono>
#include <exception>
#include <ctime>

/**
 * @file logger.hpp
 * @brief A thread-safe logging utility for PhiGuard.
 *
 * Log lines go to stderr, and optionally to a file and/or a caller-supplied sink.
 * The sink receives the level and the bare message (no timestamp), which is what
 * tests use to assert that a warning was raised.
 *
 * Messages must never contain identifier text. Callers log offsets, categories
 * and counts only.
 *
 * Usage:
 *   - logger::info("Info message");
 *   - logger::setSink([](LogLevel lvl, const std::string &msg) { ... });
 *   - logger::enableFileOutput("phiguard.log");
 */

namespace phiguard {
namespace util {
namespace logger {

/**
 * @brief Enumeration of log levels.
 */
enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR,
    CRITICAL,
    OFF
};

using LogSink = std::function<void(LogLevel, const std::string &)>;

inline const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::DEBUG:    return "DEBUG";
    case LogLevel::INFO:     return "INFO";
    case LogLevel::WARN:     return "WARN";
    case LogLevel::ERROR:    return "ERROR";
    case LogLevel::CRITICAL: return "CRITICAL";
    case LogLevel::OFF:      break;
    }
    return "OFF";
}

/**
 * @brief A singleton logger class that supports:
 *  - Thread-safe logging
 *  - Level filtering (console and file)
 *  - Optional file output
 *  - An optional sink callback that sees every message regardless of console level
 */
class Logger {
public:
    /**
     * @brief Get the global Logger instance.
     */
    static Logger& getInstance()
    {
        static Logger instance;
        return instance;
    }

    /**
     * @brief Set the minimal log level. Messages below this level are not printed.
     */
    void setLogLevel(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        logLevel_ = level;
    }

    LogLevel getLogLevel() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return logLevel_;
    }

    /**
     * @brief Enable output to a file.
     * @param filename The file path to write logs into.
     * @param append If true, appends to existing file; otherwise overwrites.
     */
    void enableFileOutput(const std::string &filename, bool append = false)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
        }
        fileStream_ = std::make_unique<std::ofstream>(filename,
            append ? (std::ios::out | std::ios::app) : (std::ios::out | std::ios::trunc));
        if (!fileStream_->is_open()) {
            fileStream_.reset();
            std::cerr << "[Logger] Failed to open log file: " << filename << std::endl;
        }
    }

    void disableFileOutput()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
            fileStream_.reset();
        }
    }

    /**
     * @brief Install a sink that receives every message, including those below the
     *        console level. Pass an empty function to remove it.
     */
    void setSink(LogSink sink)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }

    void debug(const std::string &msg)    { log(LogLevel::DEBUG, msg); }
    void info(const std::string &msg)     { log(LogLevel::INFO, msg); }
    void warn(const std::string &msg)     { log(LogLevel::WARN, msg); }
    void error(const std::string &msg)    { log(LogLevel::ERROR, msg); }
    void critical(const std::string &msg) { log(LogLevel::CRITICAL, msg); }

private:
    Logger()
        : logLevel_(LogLevel::WARN)
    {
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string &msg)
    {
        // The sink runs unlocked so it may log itself; messages it emits skip the sink.
        static thread_local bool inSink = false;
        LogSink sink;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!inSink) {
                sink = sink_;
            }
        }
        if (sink) {
            struct Reentry
            {
                explicit Reentry(bool &flag) : flag_(flag) { flag_ = true; }
                ~Reentry() { flag_ = false; }
                bool &flag_;
            } reentry(inSink);
            try {
                sink(level, msg);
            } catch (const std::exception &e) {
                std::cerr << "[logger] sink threw: " << e.what() << '\n';
            }
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (level < logLevel_) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t_now);
#else
        localtime_r(&time_t_now, &tm_buf);
#endif
        std::ostringstream line;
        line << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "]["
             << levelName(level) << "] " << msg << '\n';

        // Console output goes to stderr; stdout belongs to whoever embeds the library.
        std::cerr << line.str();
        std::cerr.flush();

        if (fileStream_) {
            (*fileStream_) << line.str();
            fileStream_->flush();
        }
    }

    mutable std::mutex mutex_;
    LogLevel logLevel_;
    std::unique_ptr<std::ofstream> fileStream_;
    LogSink sink_;
};

// ----------------------------------------------------------------------------
//  Convenience free functions (shortcuts)
// ----------------------------------------------------------------------------
inline void setLogLevel(LogLevel level)
{
    Logger::getInstance().setLogLevel(level);
}

inline void enableFileOutput(const std::string &filename, bool append = false)
{
    Logger::getInstance().enableFileOutput(filename, append);
}

inline void disableFileOutput()
{
    Logger::getInstance().disableFileOutput();
}

inline void setSink(LogSink sink)
{
    Logger::getInstance().setSink(std::move(sink));
}

inline void debug(const std::string &msg)    { Logger::getInstance().debug(msg); }
inline void info(const std::string &msg)     { Logger::getInstance().info(msg); }
inline void warn(const std::string &msg)     { Logger::getInstance().warn(msg); }
inline void error(const std::string &msg)    { Logger::getInstance().error(msg); }
inline void critical(const std::string &msg) { Logger::getInstance().critical(msg); }

} // namespace logger
} // namespace util
} // namespace phiguard

#endif // PHIGUARD_UTIL_LOGGER_HPP
