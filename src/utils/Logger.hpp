/**
 * @file Logger.hpp
 * @brief Thread-safe, component-tagged logging for the trading core
 */

#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <memory>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <iostream>
#include <fmt/format.h>

namespace OptionsScalper {

/**
 * @enum LogLevel
 * @brief Defines the severity levels for logging
 */
enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

/**
 * @class LogSink
 * @brief Destination shared by every component logger of one process
 *
 * Owns the log file and the console switch. Writes are serialised by an
 * internal mutex so that lines from the tick thread and the reconciliation
 * loop never interleave.
 */
class LogSink {
public:
    /**
     * @brief Constructor
     * @param logFile Path to the log file, empty for console-only logging
     * @param consoleOutput Whether to output to console as well
     * @param minLevel Minimum log level to record
     */
    LogSink(const std::string& logFile, bool consoleOutput, LogLevel minLevel);

    /**
     * @brief Destructor, writes the session end marker
     */
    ~LogSink();

    /**
     * @brief Write one formatted line
     * @param level Severity
     * @param component Component tag, may be empty
     * @param message Already formatted message
     */
    void write(LogLevel level, const std::string& component, const std::string& message);

    bool isEnabled(LogLevel level) const { return level >= m_minLevel; }

    void setLevel(LogLevel level);
    LogLevel getLevel() const;
    void enableConsoleOutput(bool enable);
    void flush();

    /**
     * @brief Convert log level to string
     * @param level Log level
     * @return String representation of the log level
     */
    static std::string levelToString(LogLevel level);

    /**
     * @brief Parse a level name such as "DEBUG" (case-insensitive)
     * @return The level, or fallback if the name is unknown
     */
    static LogLevel levelFromString(const std::string& name, LogLevel fallback = LogLevel::INFO);

private:
    static std::string timestamp();

    std::ofstream m_logFile;    ///< Log file stream
    bool m_consoleOutput;       ///< Whether to output to console
    LogLevel m_minLevel;        ///< Minimum log level to record
    std::mutex m_mutex;         ///< Mutex for thread safety
};

/**
 * @class Logger
 * @brief Logging port injected into each component
 *
 * A Logger is a light handle over a shared LogSink plus a component tag.
 * Components receive their own instance through the constructor; there is
 * no process-wide logger.
 */
class Logger {
public:
    /**
     * @brief Construct a root logger with its own sink
     * @param logFile Path to the log file, empty for console-only logging
     * @param consoleOutput Whether to output to console as well
     * @param minLevel Minimum log level to record
     */
    Logger(const std::string& logFile, bool consoleOutput = true, LogLevel minLevel = LogLevel::INFO);

    /**
     * @brief Construct a component logger over an existing sink
     * @param sink Shared sink
     * @param component Component tag printed on every line
     */
    Logger(std::shared_ptr<LogSink> sink, std::string component);

    /**
     * @brief Derive a logger for a named component sharing this sink
     * @param component Component tag
     * @return New logger handle
     */
    std::shared_ptr<Logger> forComponent(const std::string& component) const;

    const std::string& getComponent() const { return m_component; }

    template<typename... Args>
    void trace(const std::string& format, Args&&... args) {
        log(LogLevel::TRACE, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(const std::string& format, Args&&... args) {
        log(LogLevel::DEBUG, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const std::string& format, Args&&... args) {
        log(LogLevel::INFO, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(const std::string& format, Args&&... args) {
        log(LogLevel::WARN, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(const std::string& format, Args&&... args) {
        log(LogLevel::ERROR, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void fatal(const std::string& format, Args&&... args) {
        log(LogLevel::FATAL, format, std::forward<Args>(args)...);
    }

    /**
     * @brief Set the minimum log level of the shared sink
     * @param level New minimum log level
     */
    void setLevel(LogLevel level);

    /**
     * @brief Get the current minimum log level
     * @return Current minimum log level
     */
    LogLevel getLevel() const;

    /**
     * @brief Enable or disable console output
     * @param enable Whether to enable console output
     */
    void enableConsoleOutput(bool enable);

    /**
     * @brief Flush the log file
     */
    void flush();

private:
    template<typename... Args>
    void log(LogLevel level, const std::string& format, Args&&... args) {
        if (!m_sink->isEnabled(level)) {
            return;
        }

        std::string message;
        try {
            message = fmt::format(fmt::runtime(format), std::forward<Args>(args)...);
        } catch (const std::exception& e) {
            message = format + " (Error formatting message: " + e.what() + ")";
        }

        m_sink->write(level, m_component, message);
    }

    std::shared_ptr<LogSink> m_sink;  ///< Shared output
    std::string m_component;          ///< Component tag
};

}  // namespace OptionsScalper
