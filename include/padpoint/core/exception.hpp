#pragma once

#include "padpoint/core/types.hpp"
#include <stdexcept>
#include <string>

/**
 * @file exception.hpp
 * @brief Exception types for padpoint
 *
 * Exceptions are reserved for startup failures (configuration, device
 * access). The tick loop itself never throws for tracking problems.
 */

namespace padpoint {
namespace core {

/**
 * @brief Base exception class for all padpoint exceptions
 */
class Exception : public std::runtime_error {
public:
    /**
     * @brief Construct exception with result code and message
     * @param code Result code indicating error type
     * @param message Detailed error description
     * @param context Additional context information (usually file:line)
     */
    Exception(ResultCode code,
              const std::string& message,
              const std::string& context = "")
        : std::runtime_error(formatMessage(code, message, context))
        , result_code_(code)
        , message_(message)
        , context_(context) {}

    ResultCode getResultCode() const noexcept { return result_code_; }
    const std::string& getMessage() const noexcept { return message_; }
    const std::string& getContext() const noexcept { return context_; }

private:
    ResultCode result_code_;
    std::string message_;
    std::string context_;

    static std::string formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context);
};

/**
 * @brief Invalid or unreadable configuration; fatal at startup
 */
class ConfigException : public Exception {
public:
    ConfigException(const std::string& message,
                    const std::string& context = "")
        : Exception(ResultCode::ERROR_INVALID_CONFIG, message, context) {}
};

/**
 * @brief Input/output device failures (open, grab, uinput setup)
 */
class DeviceException : public Exception {
public:
    DeviceException(ResultCode code,
                    const std::string& message,
                    const std::string& context = "")
        : Exception(code, message, context) {}
};

/**
 * @brief File I/O related exceptions
 */
class FileException : public Exception {
public:
    FileException(ResultCode code,
                  const std::string& message,
                  const std::string& context = "")
        : Exception(code, message, context) {}
};

/**
 * @brief Convert result code to string representation
 */
std::string resultCodeToString(ResultCode code);

#define PADPOINT_THROW(ExceptionType, message) \
    throw ExceptionType(message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define PADPOINT_THROW_CODE(ExceptionType, code, message) \
    throw ExceptionType(code, message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

} // namespace core
} // namespace padpoint
