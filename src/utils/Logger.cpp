/**
 * @file Logger.cpp
 * @brief Implementation of the LogSink and Logger classes
 */

#include "../utils/Logger.hpp"
#include <algorithm>
#include <cctype>

namespace OptionsScalper {

LogSink::LogSink(const std::string& logFile, bool consoleOutput, LogLevel minLevel)
    : m_consoleOutput(consoleOutput), m_minLevel(minLevel) {
    if (!logFile.empty()) {
        m_logFile.open(logFile, std::ios::app);
        if (!m_logFile.is_open()) {
            std::cerr << "Failed to open log file: " << logFile << std::endl;
        }
    }

    std::string line = timestamp() + " [INFO] Logger initialized. Session started.";
    if (m_logFile.is_open()) {
        m_logFile << line << std::endl;
    }
    if (m_consoleOutput) {
        std::cout << line << std::endl;
    }
}

LogSink::~LogSink() {
    std::string line = timestamp() + " [INFO] Session ended.";
    if (m_logFile.is_open()) {
        m_logFile << line << std::endl;
        m_logFile.close();
    }
    if (m_consoleOutput) {
        std::cout << line << std::endl;
    }
}

void LogSink::write(LogLevel level, const std::string& component, const std::string& message) {
    std::stringstream ss;
    ss << timestamp() << " [" << levelToString(level) << "] ";
    if (!component.empty()) {
        ss << "[" << component << "] ";
    }
    ss << message;

    std::string logLine = ss.str();

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_logFile.is_open()) {
        m_logFile << logLine << std::endl;
    }

    if (m_consoleOutput) {
        if (level >= LogLevel::ERROR) {
            std::cerr << logLine << std::endl;
        } else {
            std::cout << logLine << std::endl;
        }
    }
}

void LogSink::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_minLevel = level;
}

LogLevel LogSink::getLevel() const {
    return m_minLevel;
}

void LogSink::enableConsoleOutput(bool enable) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_consoleOutput = enable;
}

void LogSink::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_logFile.is_open()) {
        m_logFile.flush();
    }
}

std::string LogSink::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default:              return "UNKNOWN";
    }
}

LogLevel LogSink::levelFromString(const std::string& name, LogLevel fallback) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::TRACE;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO")  return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "FATAL") return LogLevel::FATAL;
    return fallback;
}

std::string LogSink::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&timeT, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

Logger::Logger(const std::string& logFile, bool consoleOutput, LogLevel minLevel)
    : m_sink(std::make_shared<LogSink>(logFile, consoleOutput, minLevel)) {
}

Logger::Logger(std::shared_ptr<LogSink> sink, std::string component)
    : m_sink(std::move(sink)), m_component(std::move(component)) {
}

std::shared_ptr<Logger> Logger::forComponent(const std::string& component) const {
    return std::make_shared<Logger>(m_sink, component);
}

void Logger::setLevel(LogLevel level) {
    m_sink->setLevel(level);
}

LogLevel Logger::getLevel() const {
    return m_sink->getLevel();
}

void Logger::enableConsoleOutput(bool enable) {
    m_sink->enableConsoleOutput(enable);
}

void Logger::flush() {
    m_sink->flush();
}

}  // namespace OptionsScalper
