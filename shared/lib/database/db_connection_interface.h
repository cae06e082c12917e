/**
 * @file db_connection_interface.h
 * @brief Connection pool interface shared by the cache backends
 *
 * Backends: SqliteConnectionPool (default) and PgConnectionPool. Each backend
 * hands out its own RAII connection handle; callers that only need SQL go
 * through IQueryExecutor (see createQueryExecutor()).
 *
 * @date 2026-10-02
 */

#pragma once

#include <cstddef>
#include <string>

namespace common {

class IDbConnectionPool {
public:
    struct Stats {
        size_t availableConnections;   ///< Idle, ready to hand out
        size_t totalConnections;       ///< Idle + checked out
        size_t maxConnections;
    };

    virtual ~IDbConnectionPool() = default;

    /**
     * @brief Open the initial connections
     * @return false if the backend cannot be reached (details logged)
     */
    virtual bool initialize() = 0;

    virtual Stats getStats() const = 0;

    /// @brief Close idle connections and wake waiters; later acquires throw
    virtual void shutdown() = 0;

    /// @return "sqlite" or "postgres"
    virtual std::string getDatabaseType() const = 0;

    /// @brief Human-readable target for logs (never includes credentials)
    virtual std::string describe() const = 0;

protected:
    IDbConnectionPool() = default;
};

} // namespace common
