/**
 * @file file_utils.h
 * @brief File name and file content helpers
 *
 * @date 2026-10-04
 */

#pragma once

#include <string>

namespace everify {
namespace utils {

/**
 * @brief Sanitize filename to prevent path traversal
 *
 * Only alphanumerics, dash, underscore and dot survive; everything else
 * becomes '_'. Result is limited to 255 characters.
 *
 * @throws std::runtime_error if the result contains ".." or is empty
 */
std::string sanitizeFilename(const std::string& filename);

/**
 * @brief Read a whole file as bytes
 * @throws std::runtime_error if the file cannot be opened or read
 */
std::string readFileContent(const std::string& path);

/**
 * @brief Write bytes to a file, replacing it
 * @throws std::runtime_error if the file cannot be written
 */
void writeFileContent(const std::string& path, const std::string& content);

} // namespace utils
} // namespace everify
