/**
 * @file cache_result_provider.cpp
 * @brief IResultCache adapter implementation
 */

#include "cache_result_provider.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace adapters {

CacheResultProvider::CacheResultProvider(repositories::VerificationCacheRepository* cacheRepo)
    : cacheRepo_(cacheRepo)
{
    if (!cacheRepo_) {
        throw std::invalid_argument("CacheResultProvider: cacheRepo cannot be nullptr");
    }
}

std::optional<everify::verification::VerificationResult> CacheResultProvider::find(const std::string& email) {
    try {
        return cacheRepo_->find(email);
    } catch (const std::exception& e) {
        failures_++;
        spdlog::warn("[CacheResultProvider] Lookup for {} failed, treating as miss: {}", email, e.what());
        return std::nullopt;
    }
}

void CacheResultProvider::store(const everify::verification::VerificationResult& result) {
    try {
        cacheRepo_->save(result);
    } catch (const std::exception& e) {
        failures_++;
        spdlog::warn("[CacheResultProvider] Write for {} skipped: {}", result.email, e.what());
    }
}

} // namespace adapters
