#pragma once

#include <string>
#include <vector>
#include <memory>
#include <json/json.h>

/**
 * @file i_query_executor.h
 * @brief Query Executor Interface - Database-agnostic query execution
 *
 * Repositories talk to the cache database through this interface only.
 * Both backends accept positional placeholders ($1, $2, ...) and return
 * rows as a JSON array of objects keyed by column name.
 *
 * Parameter convention: an empty string is bound as SQL NULL.
 *
 * @date 2026-10-03
 */

namespace common {

class IDbConnectionPool;

/**
 * @brief Query Executor Interface
 */
class IQueryExecutor {
public:
    virtual ~IQueryExecutor() = default;

    /**
     * @brief Execute SELECT query and return results as JSON array
     *
     * Example result:
     * [
     *   {"email": "a@example.com", "verdict": "valid", "last_checked": 1760000000}
     * ]
     *
     * @throws DatabaseException on query execution failure
     */
    virtual Json::Value executeQuery(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) = 0;

    /**
     * @brief Execute INSERT/UPDATE/DELETE/DDL command
     * @return Number of affected rows
     * @throws DatabaseException on command execution failure
     */
    virtual int executeCommand(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) = 0;

    /**
     * @brief Execute query and return single scalar value
     *
     * Example: executeScalar("SELECT COUNT(*) FROM cache") -> 42
     *
     * @throws DatabaseException if query fails, returns no rows or more than one column
     */
    virtual Json::Value executeScalar(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) = 0;

    /**
     * @brief Get database type (for diagnostic purposes)
     * @return "sqlite" or "postgres"
     */
    virtual std::string getDatabaseType() const = 0;
};

/**
 * @brief Create the executor matching the pool's database type
 * @throws std::invalid_argument if pool is nullptr
 * @throws DatabaseException if pool type is unsupported
 */
std::unique_ptr<IQueryExecutor> createQueryExecutor(IDbConnectionPool* pool);

} // namespace common
