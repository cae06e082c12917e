#pragma once

/**
 * @file verification_cache_repository.h
 * @brief Repository for the cache table (previous verification results)
 *
 * Uses IQueryExecutor for database-agnostic operation (SQLite + PostgreSQL).
 * Placeholders are $1..$N for both backends.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <json/json.h>
#include "i_query_executor.h"
#include <everify/verification/types.h>

namespace repositories {

class VerificationCacheRepository {
public:
    /**
     * @param executor Query executor (non-owning)
     * @param ttlDays Entries older than this are treated as misses (0 = never expire)
     * @throws std::invalid_argument if executor is nullptr or ttlDays is negative
     */
    explicit VerificationCacheRepository(common::IQueryExecutor* executor, int ttlDays = 0);
    ~VerificationCacheRepository();

    /**
     * @brief Create the cache table and index if missing
     * @throws common::DatabaseException
     */
    void ensureSchema();

    /**
     * @brief Find a fresh entry for a normalized address
     * @return Result with fromCache=true, or nullopt on miss, expiry or an unreadable row
     * @throws common::DatabaseException
     */
    std::optional<everify::verification::VerificationResult> find(const std::string& email);

    /**
     * @brief Insert or replace the entry for result.email
     * @throws common::DatabaseException
     */
    void save(const everify::verification::VerificationResult& result);

    /**
     * @brief Delete expired entries (no-op when TTL is 0)
     * @return Number of deleted rows
     * @throws common::DatabaseException
     */
    int purgeExpired();

    /**
     * @brief Total number of entries, fresh or not
     * @throws common::DatabaseException
     */
    int count();

    int ttlDays() const { return ttlDays_; }

private:
    common::IQueryExecutor* executor_;
    int ttlDays_;

    int64_t expiryCutoff() const;
    std::optional<everify::verification::VerificationResult> rowToResult(const Json::Value& row);
    static int64_t toInt64(const Json::Value& val);
};

} // namespace repositories
