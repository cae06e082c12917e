/**
 * @file cache_result_provider.h
 * @brief IResultCache adapter for the database-backed verification cache
 *
 * Bridges everify::verification::IResultCache to VerificationCacheRepository.
 * Database failures are logged and reported as a miss or a skipped write.
 */

#pragma once

#include <atomic>
#include <everify/verification/providers.h>
#include "../repositories/verification_cache_repository.h"

namespace adapters {

class CacheResultProvider : public everify::verification::IResultCache {
public:
    explicit CacheResultProvider(repositories::VerificationCacheRepository* cacheRepo);

    std::optional<everify::verification::VerificationResult> find(const std::string& email) override;

    void store(const everify::verification::VerificationResult& result) override;

    /// @brief Number of lookups or writes that failed since construction
    int failureCount() const { return failures_.load(); }

private:
    repositories::VerificationCacheRepository* cacheRepo_;
    std::atomic<int> failures_{0};
};

} // namespace adapters
