/**
 * @file providers.h
 * @brief Provider interfaces for infrastructure abstraction
 *
 * These interfaces decouple the classifier from DNS, SMTP and the cache.
 * Implementations:
 *   - MxResolver / MxTable (mx_resolver.h)
 *   - SmtpProber (smtp_client.h)
 *   - adapters::CacheResultProvider in the verifier engine
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "types.h"

namespace everify::verification {

/**
 * @brief MX lookup interface
 */
class IMxProvider {
public:
    virtual ~IMxProvider() = default;

    /**
     * @brief Look up MX hosts for a domain
     * @param domain Lowercase domain name
     * @return Lookup result; failures are reported through status, never thrown
     */
    virtual MxLookupResult lookup(const std::string& domain) = 0;
};

/**
 * @brief SMTP mailbox probe interface
 */
class ISmtpProber {
public:
    virtual ~ISmtpProber() = default;

    /**
     * @brief Ask the domain's mail exchangers whether the mailbox exists
     * @param email Normalized address
     * @param mxHosts MX hosts in preference order
     */
    virtual SmtpProbeOutcome probe(
        const std::string& email,
        const std::vector<std::string>& mxHosts) = 0;
};

/**
 * @brief Verification result cache interface
 *
 * Implementations must not throw: failures are logged and reported as a miss.
 */
class IResultCache {
public:
    virtual ~IResultCache() = default;

    /**
     * @brief Find a fresh cached result
     * @return Cached result with fromCache=true, or nullopt on miss/expiry/failure
     */
    virtual std::optional<VerificationResult> find(const std::string& email) = 0;

    /**
     * @brief Store (upsert) a freshly computed result
     */
    virtual void store(const VerificationResult& result) = 0;
};

} // namespace everify::verification
