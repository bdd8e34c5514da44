#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <sstream>

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERR = 4,     // ERROR collides with system macros
    NONE = 5     // No logging
};

class Logger {
public:
    static Logger& getInstance();

    // Initialize the logger
    void init(LogLevel level = LogLevel::INFO, bool enableConsoleLogging = true, const std::string& logFilePath = "");

    // Initialize from LOG_LEVEL / LOG_FILE / LOG_CONSOLE environment variables
    void initFromEnvironment(LogLevel defaultLevel = LogLevel::INFO);

    // Parse "TRACE", "DEBUG", "INFO", "WARNING", "ERROR" or "NONE" (case-insensitive)
    static LogLevel parseLogLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

    void setLogLevel(LogLevel level);

    bool isEnabled(LogLevel level) const;

    void log(LogLevel level, const std::string& message);

    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    // Close log file if open
    void close();

    ~Logger();

    LogLevel getLogLevel() const {
        return logLevel;
    }

private:
    Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string levelToString(LogLevel level) const;
    std::string currentTimestamp() const;

    LogLevel logLevel;
    bool logToConsole;
    bool logToFile;
    std::ofstream logFile;
    std::mutex mutex;
};

// Convenience macros for logging
#define LOG_TRACE(message) Logger::getInstance().trace(message)
#define LOG_DEBUG(message) Logger::getInstance().debug(message)
#define LOG_INFO(message) Logger::getInstance().info(message)
#define LOG_WARNING(message) Logger::getInstance().warning(message)
#define LOG_ERROR(message) Logger::getInstance().error(message)

// Stream-style logging macros
#define LOG_TRACE_STREAM(message) { if (Logger::getInstance().isEnabled(LogLevel::TRACE)) { std::stringstream ss; ss << message; Logger::getInstance().trace(ss.str()); } }
#define LOG_DEBUG_STREAM(message) { if (Logger::getInstance().isEnabled(LogLevel::DEBUG)) { std::stringstream ss; ss << message; Logger::getInstance().debug(ss.str()); } }
#define LOG_INFO_STREAM(message) { if (Logger::getInstance().isEnabled(LogLevel::INFO)) { std::stringstream ss; ss << message; Logger::getInstance().info(ss.str()); } }
#define LOG_WARNING_STREAM(message) { if (Logger::getInstance().isEnabled(LogLevel::WARNING)) { std::stringstream ss; ss << message; Logger::getInstance().warning(ss.str()); } }
#define LOG_ERROR_STREAM(message) { if (Logger::getInstance().isEnabled(LogLevel::ERR)) { std::stringstream ss; ss << message; Logger::getInstance().error(ss.str()); } }
