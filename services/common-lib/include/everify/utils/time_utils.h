/**
 * @file time_utils.h
 * @brief Time and date utilities
 *
 * @version 1.0.0
 * @date 2026-10-04
 */

#pragma once

#include <string>
#include <chrono>
#include <cstdint>

namespace everify {
namespace utils {

/**
 * @brief Format time_point as ISO 8601 string (UTC)
 *
 * @param tp std::chrono time_point
 * @param includeMilliseconds Include milliseconds in output
 * @return ISO 8601 string (e.g., "2026-10-04T12:34:56Z")
 */
std::string formatIso8601(
    const std::chrono::system_clock::time_point& tp,
    bool includeMilliseconds = false
);

/**
 * @brief Current time as time_point
 */
inline std::chrono::system_clock::time_point now() {
    return std::chrono::system_clock::now();
}

/**
 * @brief Current Unix timestamp (seconds)
 */
int64_t nowUnix();

std::chrono::system_clock::time_point fromUnixTimestamp(int64_t timestamp);

int64_t toUnixTimestamp(const std::chrono::system_clock::time_point& tp);

/**
 * @brief Seconds elapsed since a steady_clock start point
 */
inline double elapsedSeconds(const std::chrono::steady_clock::time_point& start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // namespace utils
} // namespace everify
