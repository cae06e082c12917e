/**
 * @file string_utils.cpp
 * @brief String manipulation utilities implementation
 */

#include "everify/utils/string_utils.h"

#include <algorithm>
#include <cctype>

namespace everify {
namespace utils {

std::string toLowerCase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string trim(const std::string& str) {
    const char* whitespace = " \t\r\n\f\v";
    size_t first = str.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t pos;
    while ((pos = str.find(delimiter, start)) != std::string::npos) {
        parts.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    parts.push_back(str.substr(start));
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string result;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) result += delimiter;
        result += parts[i];
    }
    return result;
}

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool endsWithIgnoreCase(const std::string& str, const std::string& suffix) {
    return endsWith(toLowerCase(str), toLowerCase(suffix));
}

std::string toHex(const unsigned char* data, size_t length) {
    static const char digits[] = "0123456789abcdef";
    std::string result;
    result.reserve(length * 2);
    for (size_t i = 0; i < length; i++) {
        result += digits[data[i] >> 4];
        result += digits[data[i] & 0x0f];
    }
    return result;
}

bool parseBool(const std::string& value, bool& result) {
    std::string v = toLowerCase(trim(value));
    if (v == "true" || v == "1" || v == "yes" || v == "on") {
        result = true;
        return true;
    }
    if (v == "false" || v == "0" || v == "no" || v == "off") {
        result = false;
        return true;
    }
    return false;
}

} // namespace utils
} // namespace everify
