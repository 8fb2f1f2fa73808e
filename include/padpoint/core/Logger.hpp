#pragma once

#include <string>
#include <sstream>
#include <mutex>
#include <memory>
#include <chrono>
#include <fstream>

namespace padpoint {
namespace core {

/**
 * Logger severity levels
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5
};

/**
 * Parse a level name ("trace", "debug", "info", "warning", "error", "critical").
 * Returns false and leaves @p level untouched on an unknown name.
 */
bool parseLogLevel(const std::string& name, LogLevel& level);

/**
 * Simple thread-safe logger
 *
 * Console output is always available; file output is opened either explicitly
 * with setLogFile() or with an automatic timestamped name through
 * initializeWithTimestamp().
 */
class Logger {
public:
    /**
     * Get singleton instance
     */
    static Logger& getInstance();

    void setLevel(LogLevel level) { minLevel_ = level; }
    void setLogLevel(LogLevel level) { minLevel_ = level; }
    LogLevel getLevel() const { return minLevel_; }

    /**
     * Enable/disable console output
     */
    void setConsoleOutput(bool enable) { consoleOutput_ = enable; }

    /**
     * Open (append) a log file
     */
    bool setLogFile(const std::string& filename);

    void closeLogFile();

    /**
     * Initialize logger with automatic timestamped log file
     * Creates the log directory if needed and opens
     * log_padpoint_YYYY-MM-DD_HH-MM-SS.txt inside it.
     * @param logDirectory Directory for log files
     * @param level Minimum log level to capture
     * @return true if file logging is active, false if running console-only
     */
    bool initializeWithTimestamp(const std::string& logDirectory, LogLevel level = LogLevel::INFO);

    /**
     * Get current log file path, empty if no file logging
     */
    std::string getCurrentLogFile() const;

    void flush();

    void log(LogLevel level, const std::string& message,
             const std::string& file = "", int line = 0);

    void trace(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::TRACE, msg, file, line);
    }

    void debug(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::DEBUG, msg, file, line);
    }

    void info(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::INFO, msg, file, line);
    }

    void warning(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::WARNING, msg, file, line);
    }

    void error(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::ERROR, msg, file, line);
    }

    void critical(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::CRITICAL, msg, file, line);
    }

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string levelToString(LogLevel level) const;
    std::string getTimestamp() const;
    std::string formatMessage(LogLevel level, const std::string& message,
                              const std::string& source, int line) const;

    LogLevel minLevel_ = LogLevel::INFO;
    bool consoleOutput_ = true;
    std::string currentLogFile_;

    mutable std::mutex mutex_;
    std::ofstream logFile_;
};

#define LOG_TRACE(msg) padpoint::core::Logger::getInstance().trace(msg, __FILE__, __LINE__)
#define LOG_DEBUG(msg) padpoint::core::Logger::getInstance().debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) padpoint::core::Logger::getInstance().info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) padpoint::core::Logger::getInstance().warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) padpoint::core::Logger::getInstance().error(msg, __FILE__, __LINE__)
#define LOG_CRITICAL(msg) padpoint::core::Logger::getInstance().critical(msg, __FILE__, __LINE__)

// Stream-style logging, tagged with a component name
class LogStream {
public:
    LogStream(LogLevel level, const std::string& component = "")
        : level_(level), component_(component) {}

    ~LogStream() {
        if (component_.empty()) {
            Logger::getInstance().log(level_, stream_.str());
        } else {
            Logger::getInstance().log(level_, "[" + component_ + "] " + stream_.str());
        }
    }

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    LogLevel level_;
    std::string component_;
    std::ostringstream stream_;
};

#define PADPOINT_LOG_TRACE(component) \
    padpoint::core::LogStream(padpoint::core::LogLevel::TRACE, component)

#define PADPOINT_LOG_DEBUG(component) \
    padpoint::core::LogStream(padpoint::core::LogLevel::DEBUG, component)

#define PADPOINT_LOG_INFO(component) \
    padpoint::core::LogStream(padpoint::core::LogLevel::INFO, component)

#define PADPOINT_LOG_WARNING(component) \
    padpoint::core::LogStream(padpoint::core::LogLevel::WARNING, component)

#define PADPOINT_LOG_ERROR(component) \
    padpoint::core::LogStream(padpoint::core::LogLevel::ERROR, component)

#define PADPOINT_LOG_CRITICAL(component) \
    padpoint::core::LogStream(padpoint::core::LogLevel::CRITICAL, component)

} // namespace core
} // namespace padpoint
