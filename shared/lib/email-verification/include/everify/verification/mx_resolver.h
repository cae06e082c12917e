/**
 * @file mx_resolver.h
 * @brief DNS MX resolution (system resolver, res_nquery)
 *
 * Each thread keeps its own resolver state, so lookups run in parallel
 * without sharing the global _res structure.
 */

#pragma once

#include <map>
#include <string>
#include <vector>
#include "types.h"
#include "providers.h"

namespace everify::verification {

struct MxResolverOptions {
    int timeoutSec = 3;  ///< Per-try timeout (RES_TIMEOUT)
    int attempts = 1;    ///< Tries per nameserver (RES_DFLRETRY)
};

/**
 * @brief Live MX resolver
 *
 * Usage:
 * @code
 *   MxResolver resolver({3, 1});
 *   MxLookupResult r = resolver.resolve("example.com");
 *   for (const auto& host : r.hosts) { ... }
 * @endcode
 */
class MxResolver : public IMxProvider {
public:
    explicit MxResolver(MxResolverOptions options = {});

    MxLookupResult lookup(const std::string& domain) override { return resolve(domain); }

    /**
     * @brief Query MX records for a domain
     *
     * Never throws for DNS failures; the status field carries them.
     */
    MxLookupResult resolve(const std::string& domain);

    /**
     * @brief Parse a raw DNS answer into an MxLookupResult
     *
     * Hosts are lowercased, stripped of the trailing dot and ordered by
     * preference then name. A null MX ("0 .") alone yields NULL_MX.
     */
    static MxLookupResult parseAnswer(
        const std::string& domain,
        const unsigned char* answer,
        int length);

private:
    MxResolverOptions options_;
};

/**
 * @brief Read-only MX lookup table produced by resolveAll()
 *
 * Domains missing from the table report ERROR; nothing is resolved lazily.
 */
class MxTable : public IMxProvider {
public:
    MxTable() = default;
    explicit MxTable(std::map<std::string, MxLookupResult> entries)
        : entries_(std::move(entries)) {}

    MxLookupResult lookup(const std::string& domain) override;

    size_t size() const { return entries_.size(); }
    bool contains(const std::string& domain) const { return entries_.count(domain) > 0; }

    /// @brief Number of domains with at least one MX host
    size_t resolvedCount() const;

private:
    std::map<std::string, MxLookupResult> entries_;
};

/**
 * @brief Resolve unique domains in parallel
 *
 * Runs at most min(workers, domains.size()) threads. Duplicate and empty
 * domains are skipped.
 *
 * @param provider Underlying lookup (must be thread-safe)
 * @param domains Domains to resolve
 * @param workers Maximum thread count (values < 1 are treated as 1)
 */
MxTable resolveAll(IMxProvider& provider, const std::vector<std::string>& domains, int workers);

} // namespace everify::verification
