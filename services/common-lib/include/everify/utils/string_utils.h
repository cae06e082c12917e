/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * Common string operations used by the verifier engine, CLI and API service.
 *
 * @version 1.0.0
 * @date 2026-10-04
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace everify {
namespace utils {

/**
 * @brief Convert ASCII letters to lowercase
 */
std::string toLowerCase(const std::string& str);

/**
 * @brief Trim whitespace from both ends
 */
std::string trim(const std::string& str);

/**
 * @brief Split string by delimiter (empty parts kept)
 */
std::vector<std::string> split(const std::string& str, char delimiter);

/**
 * @brief Join strings with delimiter
 */
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

bool startsWith(const std::string& str, const std::string& prefix);

bool endsWith(const std::string& str, const std::string& suffix);

/**
 * @brief Case-insensitive suffix check (file extensions)
 */
bool endsWithIgnoreCase(const std::string& str, const std::string& suffix);

/**
 * @brief Convert binary data to lowercase hex string
 */
std::string toHex(const unsigned char* data, size_t length);

/**
 * @brief Parse a boolean flag value
 *
 * Accepts true/false, 1/0, yes/no, on/off (case-insensitive).
 *
 * @param value Input string
 * @param result Parsed value, untouched on failure
 * @return false if the value is not a recognized boolean
 */
bool parseBool(const std::string& value, bool& result);

} // namespace utils
} // namespace everify
