/**
 * @file syntax_validator.h
 * @brief Address syntax validation (RFC 5321 limits, RFC 5322 dot-atom)
 *
 * Deliberately narrower than RFC 5322: quoted local parts, comments and
 * IP-literal domains are rejected because no real mailbox list uses them.
 */

#pragma once

#include <cstddef>
#include <string>
#include "types.h"

namespace everify::verification {

/**
 * @brief Stateless address syntax validator
 *
 * Usage:
 * @code
 *   auto result = SyntaxValidator::validate("john.doe@example.com");
 *   if (!result.valid) spdlog::debug("{}", result.message);
 * @endcode
 */
class SyntaxValidator {
public:
    static constexpr size_t MAX_ADDRESS_LENGTH = 254;
    static constexpr size_t MAX_LOCAL_PART = 64;
    static constexpr size_t MAX_DOMAIN_PART = 253;
    static constexpr size_t MAX_LABEL_LENGTH = 63;

    /**
     * @brief Validate an address
     * @param email Address, already trimmed
     * @return Result with localPart/domain split on success, message on failure
     */
    static SyntaxCheckResult validate(const std::string& email);

    static bool isValid(const std::string& email) { return validate(email).valid; }

    /**
     * @brief RFC 5322 atext (letters, digits and !#$%&'*+-/=?^_`{|}~)
     */
    static bool isAtext(unsigned char c);

    /**
     * @brief Check local part as dot-atom
     * @param message Set to the failure reason
     */
    static bool validateLocalPart(const std::string& local, std::string& message);

    /**
     * @brief Check domain as a hostname with an alphabetic TLD
     * @param message Set to the failure reason
     */
    static bool validateDomain(const std::string& domain, std::string& message);
};

} // namespace everify::verification
