/**
 * @file types.h
 * @brief Common types for the email verification library
 *
 * Shared enums and result structs used across extraction, syntax checking,
 * MX resolution, SMTP probing and classification.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace everify::verification {

/// @brief Final verdict for an address
enum class Verdict {
    GOOD,   ///< Deliverable as far as the checks can tell
    RISKY,  ///< Disposable provider or inconclusive SMTP answer
    BAD     ///< Invalid syntax, no MX or mailbox rejected
};

/// @brief Why the verdict was reached
enum class Reason {
    INVALID,       ///< Syntax check failed
    DISPOSABLE,    ///< Registered domain is a disposable provider
    NO_MX,         ///< Domain has no usable MX record
    SMTP_ACTIVE,   ///< Deep check: RCPT TO accepted
    SMTP_REJECT,   ///< Deep check: mailbox permanently rejected
    SMTP_UNKNOWN,  ///< Deep check: no definitive answer
    SYNTAX_MX      ///< Standard check passed (syntax + MX)
};

/// @brief Mailbox activity as observed by the checks
enum class ActiveStatus {
    ACTIVE,
    INACTIVE,
    UNKNOWN
};

/// @brief Outcome of one DNS MX lookup
enum class MxLookupStatus {
    OK,                 ///< One or more MX hosts
    NULL_MX,            ///< RFC 7505 "MX 0 ." (domain accepts no mail)
    DOMAIN_NOT_FOUND,   ///< Domain does not exist
    NO_RECORDS,         ///< Domain exists but publishes no MX
    TIMEOUT,            ///< Resolver timed out
    SERVER_FAILURE,     ///< Upstream server failure
    ERROR               ///< Malformed answer or resolver failure
};

/// @brief Outcome of an SMTP RCPT TO probe
enum class SmtpProbeStatus {
    ACCEPTED,   ///< 2xx on RCPT TO
    REJECTED,   ///< 550, 551 or 553 on RCPT TO
    UNKNOWN     ///< Any other reply, timeout or transport failure
};

/// @brief Syntax validation result
struct SyntaxCheckResult {
    bool valid = false;
    std::string message;    ///< Empty when valid
    std::string localPart;
    std::string domain;
};

/// @brief MX lookup result; hosts ordered by preference then name
struct MxLookupResult {
    std::string domain;
    std::vector<std::string> hosts;
    MxLookupStatus status = MxLookupStatus::ERROR;
    std::string message;

    bool hasHosts() const { return !hosts.empty(); }
};

/// @brief SMTP probe outcome
struct SmtpProbeOutcome {
    SmtpProbeStatus status = SmtpProbeStatus::UNKNOWN;
    int replyCode = 0;      ///< RCPT TO reply code, 0 if never reached
    std::string host;       ///< MX host that gave the answer
    std::string message;
};

/// @brief Classification result for one address
struct VerificationResult {
    std::string email;
    Verdict verdict = Verdict::BAD;
    Reason reason = Reason::INVALID;
    ActiveStatus activeStatus = ActiveStatus::UNKNOWN;
    std::string mxDomain;       ///< Domain whose MX was consulted
    std::string sourceFile;     ///< Basename of the input file
    bool fromCache = false;
    int64_t checkedAt = 0;      ///< Epoch seconds
};

// --- String conversion ---

inline std::string verdictToString(Verdict v) {
    switch (v) {
        case Verdict::GOOD:  return "good";
        case Verdict::RISKY: return "risky";
        case Verdict::BAD:   return "bad";
    }
    return "bad";
}

inline std::string reasonToString(Reason r) {
    switch (r) {
        case Reason::INVALID:      return "invalid";
        case Reason::DISPOSABLE:   return "disposable";
        case Reason::NO_MX:        return "no-mx";
        case Reason::SMTP_ACTIVE:  return "smtp-active";
        case Reason::SMTP_REJECT:  return "smtp-reject";
        case Reason::SMTP_UNKNOWN: return "smtp-unknown";
        case Reason::SYNTAX_MX:    return "syntax+mx";
    }
    return "invalid";
}

inline std::string activeStatusToString(ActiveStatus s) {
    switch (s) {
        case ActiveStatus::ACTIVE:   return "active";
        case ActiveStatus::INACTIVE: return "inactive";
        case ActiveStatus::UNKNOWN:  return "unknown";
    }
    return "unknown";
}

inline std::string mxLookupStatusToString(MxLookupStatus s) {
    switch (s) {
        case MxLookupStatus::OK:       return "OK";
        case MxLookupStatus::NULL_MX:  return "NULL_MX";
        case MxLookupStatus::DOMAIN_NOT_FOUND: return "NXDOMAIN";
        case MxLookupStatus::NO_RECORDS:  return "NO_DATA";
        case MxLookupStatus::TIMEOUT:  return "TIMEOUT";
        case MxLookupStatus::SERVER_FAILURE: return "SERVFAIL";
        case MxLookupStatus::ERROR:    return "ERROR";
    }
    return "ERROR";
}

inline std::string smtpProbeStatusToString(SmtpProbeStatus s) {
    switch (s) {
        case SmtpProbeStatus::ACCEPTED: return "ACCEPTED";
        case SmtpProbeStatus::REJECTED: return "REJECTED";
        case SmtpProbeStatus::UNKNOWN:  return "UNKNOWN";
    }
    return "UNKNOWN";
}

// --- Parsing (cache rows) ---

inline std::optional<Verdict> parseVerdict(const std::string& s) {
    if (s == "good")  return Verdict::GOOD;
    if (s == "risky") return Verdict::RISKY;
    if (s == "bad")   return Verdict::BAD;
    return std::nullopt;
}

inline std::optional<Reason> parseReason(const std::string& s) {
    if (s == "invalid")      return Reason::INVALID;
    if (s == "disposable")   return Reason::DISPOSABLE;
    if (s == "no-mx")        return Reason::NO_MX;
    if (s == "smtp-active")  return Reason::SMTP_ACTIVE;
    if (s == "smtp-reject")  return Reason::SMTP_REJECT;
    if (s == "smtp-unknown") return Reason::SMTP_UNKNOWN;
    if (s == "syntax+mx")    return Reason::SYNTAX_MX;
    return std::nullopt;
}

inline std::optional<ActiveStatus> parseActiveStatus(const std::string& s) {
    if (s == "active")   return ActiveStatus::ACTIVE;
    if (s == "inactive") return ActiveStatus::INACTIVE;
    if (s == "unknown")  return ActiveStatus::UNKNOWN;
    return std::nullopt;
}

} // namespace everify::verification
