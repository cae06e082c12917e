/**
 * @file syntax_validator.cpp
 * @brief Address syntax validation implementation
 */

#include "everify/verification/syntax_validator.h"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace everify::verification {

namespace {

bool isAsciiAlpha(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool isAsciiAlnum(unsigned char c) {
    return isAsciiAlpha(c) || (c >= '0' && c <= '9');
}

SyntaxCheckResult fail(const std::string& message) {
    SyntaxCheckResult result;
    result.valid = false;
    result.message = message;
    return result;
}

} // anonymous namespace

bool SyntaxValidator::isAtext(unsigned char c) {
    if (isAsciiAlnum(c)) {
        return true;
    }
    static const char specials[] = "!#$%&'*+-/=?^_`{|}~";
    return c != '\0' && std::strchr(specials, c) != nullptr;
}

bool SyntaxValidator::validateLocalPart(const std::string& local, std::string& message) {
    if (local.empty()) {
        message = "local part is empty";
        return false;
    }
    if (local.size() > MAX_LOCAL_PART) {
        message = "local part exceeds " + std::to_string(MAX_LOCAL_PART) + " characters";
        return false;
    }
    if (local.front() == '"') {
        message = "quoted local part is not supported";
        return false;
    }
    if (local.front() == '.' || local.back() == '.') {
        message = "local part starts or ends with a dot";
        return false;
    }

    for (size_t i = 0; i < local.size(); i++) {
        unsigned char c = static_cast<unsigned char>(local[i]);
        if (c == '.') {
            if (local[i + 1] == '.') {
                message = "local part contains consecutive dots";
                return false;
            }
            continue;
        }
        if (!isAtext(c)) {
            message = "invalid character in local part";
            return false;
        }
    }
    return true;
}

bool SyntaxValidator::validateDomain(const std::string& domain, std::string& message) {
    if (domain.empty()) {
        message = "domain is empty";
        return false;
    }
    if (domain.front() == '[') {
        message = "IP-literal domain is not supported";
        return false;
    }
    if (domain.size() > MAX_DOMAIN_PART) {
        message = "domain exceeds " + std::to_string(MAX_DOMAIN_PART) + " characters";
        return false;
    }

    size_t labelCount = 0;
    size_t start = 0;
    std::string lastLabel;

    while (start <= domain.size()) {
        size_t dot = domain.find('.', start);
        size_t end = (dot == std::string::npos) ? domain.size() : dot;
        size_t len = end - start;

        if (len == 0) {
            message = "domain contains an empty label";
            return false;
        }
        if (len > MAX_LABEL_LENGTH) {
            message = "domain label exceeds " + std::to_string(MAX_LABEL_LENGTH) + " characters";
            return false;
        }
        if (domain[start] == '-' || domain[end - 1] == '-') {
            message = "domain label starts or ends with a hyphen";
            return false;
        }
        for (size_t i = start; i < end; i++) {
            unsigned char c = static_cast<unsigned char>(domain[i]);
            if (!isAsciiAlnum(c) && c != '-') {
                message = "invalid character in domain";
                return false;
            }
        }

        labelCount++;
        lastLabel = domain.substr(start, len);

        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }

    if (labelCount < 2) {
        message = "domain needs at least two labels";
        return false;
    }
    if (lastLabel.size() < 2 ||
        !std::all_of(lastLabel.begin(), lastLabel.end(),
                     [](unsigned char c) { return isAsciiAlpha(c); })) {
        message = "top-level domain must be alphabetic with at least two letters";
        return false;
    }
    return true;
}

SyntaxCheckResult SyntaxValidator::validate(const std::string& email) {
    if (email.empty()) {
        return fail("address is empty");
    }
    if (email.size() > MAX_ADDRESS_LENGTH) {
        return fail("address exceeds " + std::to_string(MAX_ADDRESS_LENGTH) + " characters");
    }

    size_t at = email.find('@');
    if (at == std::string::npos) {
        return fail("missing @");
    }
    if (email.find('@', at + 1) != std::string::npos) {
        return fail("more than one @");
    }

    std::string local = email.substr(0, at);
    std::string domain = email.substr(at + 1);
    std::string message;

    if (!validateLocalPart(local, message)) {
        return fail(message);
    }
    if (!validateDomain(domain, message)) {
        return fail(message);
    }

    SyntaxCheckResult result;
    result.valid = true;
    result.localPart = local;
    result.domain = domain;
    return result;
}

} // namespace everify::verification
