/**
 * @file csv_utils.cpp
 * @brief RFC 4180 CSV output helpers implementation
 */

#include "everify/utils/csv_utils.h"

namespace everify {
namespace utils {

std::string escapeCsvField(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }

    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') {
            quoted += "\"\"";
        } else {
            quoted += c;
        }
    }
    quoted += '"';
    return quoted;
}

std::string formatCsvRow(const std::vector<std::string>& fields) {
    std::string row;
    for (size_t i = 0; i < fields.size(); i++) {
        if (i > 0) row += ',';
        row += escapeCsvField(fields[i]);
    }
    row += "\r\n";
    return row;
}

void writeCsvRow(std::ostream& out, const std::vector<std::string>& fields) {
    out << formatCsvRow(fields);
}

} // namespace utils
} // namespace everify
