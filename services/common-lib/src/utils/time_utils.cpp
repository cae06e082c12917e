/**
 * @file time_utils.cpp
 * @brief Time utilities implementation
 */

#include "everify/utils/time_utils.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace everify {
namespace utils {

std::string formatIso8601(const std::chrono::system_clock::time_point& tp, bool includeMilliseconds) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);

    struct tm tmTime;
    if (!gmtime_r(&t, &tmTime)) {
        return "";
    }

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << (tmTime.tm_year + 1900) << '-'
        << std::setw(2) << (tmTime.tm_mon + 1) << '-'
        << std::setw(2) << tmTime.tm_mday << 'T'
        << std::setw(2) << tmTime.tm_hour << ':'
        << std::setw(2) << tmTime.tm_min << ':'
        << std::setw(2) << tmTime.tm_sec;

    if (includeMilliseconds) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch()).count() % 1000;
        if (ms < 0) ms += 1000;
        oss << '.' << std::setw(3) << ms;
    }
    oss << 'Z';
    return oss.str();
}

int64_t nowUnix() {
    return toUnixTimestamp(std::chrono::system_clock::now());
}

std::chrono::system_clock::time_point fromUnixTimestamp(int64_t timestamp) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(timestamp));
}

int64_t toUnixTimestamp(const std::chrono::system_clock::time_point& tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

} // namespace utils
} // namespace everify
