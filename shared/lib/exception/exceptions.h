/**
 * @file exceptions.h
 * @brief Standard Exception Hierarchy
 *
 * Exception types shared by the verification engine, the CLI and the API service.
 *
 * @date 2026-10-02
 */

#pragma once

#include <stdexcept>
#include <string>

namespace common {

/**
 * @brief Base exception for all email verifier errors
 */
class VerifierException : public std::runtime_error {
public:
    explicit VerifierException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Cache database operation failed
 */
class DatabaseException : public VerifierException {
public:
    explicit DatabaseException(const std::string& message)
        : VerifierException("Database error: " + message) {}
};

/**
 * @brief DNS resolver could not be initialized or queried
 */
class DnsException : public VerifierException {
public:
    explicit DnsException(const std::string& message)
        : VerifierException("DNS error: " + message) {}
};

/**
 * @brief SMTP transport failure (connect, send, receive)
 */
class SmtpException : public VerifierException {
public:
    explicit SmtpException(const std::string& message)
        : VerifierException("SMTP error: " + message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public VerifierException {
public:
    explicit ConfigException(const std::string& message)
        : VerifierException("Configuration error: " + message) {}
};

/**
 * @brief Input path missing or unreadable
 */
class InputException : public VerifierException {
public:
    explicit InputException(const std::string& message)
        : VerifierException("Input error: " + message) {}
};

/**
 * @brief Report could not be written
 */
class ReportException : public VerifierException {
public:
    explicit ReportException(const std::string& message)
        : VerifierException("Report error: " + message) {}
};

/**
 * @brief Connection pool exhausted
 */
class PoolExhaustedException : public VerifierException {
public:
    explicit PoolExhaustedException(const std::string& poolType)
        : VerifierException(poolType + " connection pool exhausted") {}
};

} // namespace common
