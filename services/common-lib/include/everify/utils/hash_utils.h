/**
 * @file hash_utils.h
 * @brief SHA-256 digests (OpenSSL EVP)
 *
 * @date 2026-10-04
 */

#pragma once

#include <string>

namespace everify {
namespace utils {

/**
 * @brief SHA-256 of a byte string as lowercase hex
 * @throws std::runtime_error if the digest cannot be computed
 */
std::string sha256Hex(const std::string& data);

/**
 * @brief SHA-256 of a file's contents as lowercase hex
 * @throws std::runtime_error if the file cannot be read
 */
std::string sha256FileHex(const std::string& path);

} // namespace utils
} // namespace everify
