/**
 * @file file_utils.cpp
 * @brief File name and file content helpers implementation
 */

#include "everify/utils/file_utils.h"

#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace everify {
namespace utils {

std::string sanitizeFilename(const std::string& filename) {
    std::string sanitized;

    for (char c : filename) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.') {
            sanitized += c;
        } else {
            sanitized += '_';
        }
    }

    if (sanitized.find("..") != std::string::npos) {
        throw std::runtime_error("Invalid filename: contains '..'");
    }
    if (sanitized.length() > 255) {
        sanitized = sanitized.substr(0, 255);
    }
    if (sanitized.empty()) {
        throw std::runtime_error("Invalid filename: empty after sanitization");
    }

    return sanitized;
}

std::string readFileContent(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open file: " + path);
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error("read error: " + path);
    }
    return ss.str();
}

void writeFileContent(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot create file: " + path);
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        throw std::runtime_error("write error: " + path);
    }
}

} // namespace utils
} // namespace everify
