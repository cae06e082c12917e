/**
 * @file db_connection_pool_factory.h
 * @brief Cache Database Connection Pool Factory (Strategy Pattern)
 *
 * Creates the SQLite or PostgreSQL pool selected by configuration.
 *
 * @date 2026-10-03
 */

#pragma once

#include "db_connection_interface.h"
#include <string>
#include <memory>
#include <vector>

namespace common {

/**
 * @brief Connection pool configuration
 */
struct DbPoolConfig {
    std::string dbType = "sqlite";   // "sqlite" or "postgres"

    size_t minSize = 1;
    size_t maxSize = 8;
    int acquireTimeoutSec = 10;

    // SQLite settings
    std::string sqlitePath = "email_cache_v3.db";
    int sqliteBusyTimeoutMs = 5000;

    // PostgreSQL settings
    std::string pgHost = "localhost";
    int pgPort = 5432;
    std::string pgDatabase = "email_verifier";
    std::string pgUser = "verifier";
    std::string pgPassword;

    /**
     * @brief Build libpq connection string
     */
    std::string buildPostgresConnString() const;
};

/**
 * @brief Connection Pool Factory
 *
 * Usage Example:
 * @code
 * DbPoolConfig config;
 * config.sqlitePath = "cache.db";
 * auto pool = DbConnectionPoolFactory::create(config);
 * if (pool->initialize()) {
 *     auto executor = createQueryExecutor(pool.get());
 * }
 * @endcode
 */
class DbConnectionPoolFactory {
public:
    /**
     * @brief Create connection pool based on config
     *
     * Supported database types:
     * - "sqlite", "sqlite3" → SQLite pool
     * - "postgres", "postgresql", "pg" → PostgreSQL pool
     *
     * @throws ConfigException if the type is unsupported
     */
    static std::shared_ptr<IDbConnectionPool> create(const DbPoolConfig& config);

    static bool isSupported(const std::string& dbType);

    static std::vector<std::string> getSupportedTypes();

    /**
     * @brief "postgresql"/"pg" → "postgres", "sqlite3" → "sqlite", others lowercased
     */
    static std::string normalizeDbType(const std::string& dbType);
};

} // namespace common
