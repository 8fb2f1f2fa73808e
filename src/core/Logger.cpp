#include "padpoint/core/Logger.hpp"
#include <iostream>
#include <iomanip>
#include <ctime>
#include <filesystem>
#include <system_error>
#include <algorithm>
#include <cctype>

namespace padpoint {
namespace core {

bool parseLogLevel(const std::string& name, LogLevel& level) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") { level = LogLevel::TRACE; return true; }
    if (lower == "debug") { level = LogLevel::DEBUG; return true; }
    if (lower == "info") { level = LogLevel::INFO; return true; }
    if (lower == "warning" || lower == "warn") { level = LogLevel::WARNING; return true; }
    if (lower == "error") { level = LogLevel::ERROR; return true; }
    if (lower == "critical") { level = LogLevel::CRITICAL; return true; }
    return false;
}

Logger::Logger() : minLevel_(LogLevel::INFO), consoleOutput_(true) {
}

Logger::~Logger() {
    closeLogFile();
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

bool Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (logFile_.is_open()) {
        logFile_.close();
    }

    logFile_.open(filename, std::ios::app);
    currentLogFile_ = logFile_.is_open() ? filename : std::string();
    return logFile_.is_open();
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
    currentLogFile_.clear();
}

bool Logger::initializeWithTimestamp(const std::string& logDirectory, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);

    minLevel_ = level;
    consoleOutput_ = true;

    std::error_code ec;
    std::filesystem::create_directories(logDirectory, ec);
    if (ec || !std::filesystem::is_directory(logDirectory)) {
        std::cerr << "[Logger] Warning: could not create log directory " << logDirectory
                  << " (" << ec.message() << "), file logging disabled" << std::endl;
        return false;
    }

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time_t, &local);
    std::ostringstream name;
    name << "log_padpoint_" << std::put_time(&local, "%Y-%m-%d_%H-%M-%S") << ".txt";

    std::filesystem::path path = std::filesystem::path(logDirectory) / name.str();

    if (logFile_.is_open()) {
        logFile_.close();
    }

    logFile_.open(path.string(), std::ios::out | std::ios::app);
    if (!logFile_.is_open()) {
        std::cerr << "[Logger] Error: failed to open log file " << path.string() << std::endl;
        currentLogFile_.clear();
        return false;
    }
    currentLogFile_ = path.string();

    logFile_ << "===========================================" << std::endl;
    logFile_ << "padpoint log" << std::endl;
    logFile_ << "Started: " << getTimestamp() << std::endl;
    logFile_ << "Log Level: " << levelToString(level) << std::endl;
    logFile_ << "===========================================" << std::endl;
    logFile_.flush();

    return true;
}

std::string Logger::getCurrentLogFile() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentLogFile_;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (consoleOutput_) {
        std::cout.flush();
        std::cerr.flush();
    }
    if (logFile_.is_open()) {
        logFile_.flush();
    }
}

void Logger::log(LogLevel level, const std::string& message, const std::string& file, int line) {
    if (level < minLevel_) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::string formatted = formatMessage(level, message, file, line);

    if (consoleOutput_) {
        if (level >= LogLevel::ERROR) {
            std::cerr << formatted << std::endl;
        } else {
            std::cout << formatted << std::endl;
        }
    }

    if (logFile_.is_open()) {
        logFile_ << formatted << std::endl;
    }
}

std::string Logger::levelToString(LogLevel level) const {
    switch (level) {
        case LogLevel::TRACE:    return "TRACE";
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::WARNING:  return "WARNING";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default:                 return "UNKNOWN";
    }
}

std::string Logger::getTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time_t, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string Logger::formatMessage(LogLevel level, const std::string& message,
                                  const std::string& source, int line) const {
    std::ostringstream oss;
    oss << "[" << getTimestamp() << "] [" << levelToString(level) << "] " << message;

    if (!source.empty() && line > 0) {
        oss << " (" << std::filesystem::path(source).filename().string() << ":" << line << ")";
    }

    return oss.str();
}

} // namespace core
} // namespace padpoint
