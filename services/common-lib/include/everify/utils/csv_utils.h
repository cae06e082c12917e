/**
 * @file csv_utils.h
 * @brief RFC 4180 CSV output helpers
 *
 * @date 2026-10-04
 */

#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace everify {
namespace utils {

/**
 * @brief Quote a field when it contains a comma, quote, CR or LF
 *
 * Embedded quotes are doubled: say "hi" -> "say ""hi""".
 */
std::string escapeCsvField(const std::string& field);

/**
 * @brief Format one record terminated by CRLF
 */
std::string formatCsvRow(const std::vector<std::string>& fields);

/**
 * @brief Write one record to a stream
 */
void writeCsvRow(std::ostream& out, const std::vector<std::string>& fields);

} // namespace utils
} // namespace everify
