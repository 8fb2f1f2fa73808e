#include "padpoint/core/exception.hpp"
#include <sstream>

namespace padpoint {
namespace core {

std::string Exception::formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context) {
    std::ostringstream oss;
    oss << "[" << resultCodeToString(code) << "] " << message;
    if (!context.empty()) {
        oss << " (Context: " << context << ")";
    }
    return oss.str();
}

std::string resultCodeToString(ResultCode code) {
    switch (code) {
        case ResultCode::SUCCESS:
            return "SUCCESS";
        case ResultCode::ERROR_GENERIC:
            return "ERROR_GENERIC";
        case ResultCode::ERROR_INVALID_PARAMETER:
            return "ERROR_INVALID_PARAMETER";
        case ResultCode::ERROR_INVALID_CONFIG:
            return "ERROR_INVALID_CONFIG";
        case ResultCode::ERROR_DEVICE_NOT_FOUND:
            return "ERROR_DEVICE_NOT_FOUND";
        case ResultCode::ERROR_DEVICE_ACCESS_DENIED:
            return "ERROR_DEVICE_ACCESS_DENIED";
        case ResultCode::ERROR_DEVICE_UNSUPPORTED:
            return "ERROR_DEVICE_UNSUPPORTED";
        case ResultCode::ERROR_DEVICE_IO:
            return "ERROR_DEVICE_IO";
        case ResultCode::ERROR_FILE_NOT_FOUND:
            return "ERROR_FILE_NOT_FOUND";
        case ResultCode::ERROR_FILE_IO:
            return "ERROR_FILE_IO";
        case ResultCode::ERROR_THREAD_FAILURE:
            return "ERROR_THREAD_FAILURE";
        default:
            return "UNKNOWN_ERROR";
    }
}

} // namespace core
} // namespace padpoint
