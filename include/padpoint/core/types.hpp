/**
 * @file types.hpp
 * @brief Common type definitions for padpoint
 */

#ifndef PADPOINT_CORE_TYPES_HPP
#define PADPOINT_CORE_TYPES_HPP

#include <chrono>

namespace padpoint {
namespace core {

/**
 * @brief Result codes carried by padpoint exceptions
 */
enum class ResultCode {
    SUCCESS = 0,
    ERROR_GENERIC,
    ERROR_INVALID_PARAMETER,
    ERROR_INVALID_CONFIG,
    ERROR_DEVICE_NOT_FOUND,
    ERROR_DEVICE_ACCESS_DENIED,
    ERROR_DEVICE_UNSUPPORTED,
    ERROR_DEVICE_IO,
    ERROR_FILE_NOT_FOUND,
    ERROR_FILE_IO,
    ERROR_THREAD_FAILURE
};

/// Monotonic clock used for every tick and contact timestamp
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

} // namespace core
} // namespace padpoint

#endif // PADPOINT_CORE_TYPES_HPP
