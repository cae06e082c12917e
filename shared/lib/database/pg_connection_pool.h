/**
 * @file pg_connection_pool.h
 * @brief PostgreSQL Connection Pool for the shared verification cache
 *
 * Thread-safe pool used when several verifier instances share one cache.
 * - Configurable pool size (min/max connections)
 * - Acquire timeout
 * - Health check on acquire and release
 *
 * @date 2026-10-03
 */

#pragma once

#include "db_connection_interface.h"
#include <libpq-fe.h>
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <memory>
#include <chrono>
#include <atomic>

namespace common {

class PgConnectionPool;

/**
 * @brief RAII handle for a pooled PostgreSQL connection
 *
 * Returns the connection to its pool when destroyed.
 */
class PgConnection {
private:
    PGconn* conn_;
    PgConnectionPool* pool_;  // Non-owning
    bool released_;

public:
    PgConnection(PGconn* conn, PgConnectionPool* pool)
        : conn_(conn), pool_(pool), released_(false) {}

    ~PgConnection();

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    PgConnection(PgConnection&& other) noexcept
        : conn_(other.conn_), pool_(other.pool_), released_(other.released_) {
        other.conn_ = nullptr;
        other.released_ = true;
    }

    PgConnection& operator=(PgConnection&& other) noexcept {
        if (this != &other) {
            if (!released_ && conn_) {
                release();
            }
            conn_ = other.conn_;
            pool_ = other.pool_;
            released_ = other.released_;
            other.conn_ = nullptr;
            other.released_ = true;
        }
        return *this;
    }

    PGconn* get() const { return conn_; }

    bool isValid() const {
        return conn_ != nullptr && !released_;
    }

    void release();
};

/**
 * @brief PostgreSQL Connection Pool
 */
class PgConnectionPool : public IDbConnectionPool {
private:
    std::string connString_;
    size_t minSize_;
    size_t maxSize_;
    std::chrono::seconds acquireTimeout_;

    std::queue<PGconn*> idle_;
    std::atomic<size_t> totalConnections_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    bool shutdown_;

    friend class PgConnection;

public:
    /**
     * @param connString libpq connection string
     * @param minSize Connections opened by initialize()
     * @param maxSize Upper bound on open connections
     * @param acquireTimeoutSec Seconds acquire() waits for a free connection
     * @throws std::invalid_argument if minSize > maxSize or maxSize == 0
     */
    explicit PgConnectionPool(
        const std::string& connString,
        size_t minSize = 1,
        size_t maxSize = 8,
        int acquireTimeoutSec = 5
    );

    ~PgConnectionPool() override;

    PgConnectionPool(const PgConnectionPool&) = delete;
    PgConnectionPool& operator=(const PgConnectionPool&) = delete;

    bool initialize() override;

    /**
     * @brief Acquire connection from pool
     * @throws PoolExhaustedException on timeout
     * @throws DatabaseException on shutdown or connection failure
     */
    PgConnection acquire();

    Stats getStats() const override;

    void shutdown() override;

    std::string getDatabaseType() const override {
        return "postgres";
    }

    /// @brief "postgres:user@host:port/dbname" parsed from the connection string
    std::string describe() const override;

private:
    PGconn* createConnection();
    bool isConnectionHealthy(PGconn* conn);
    void releaseConnection(PGconn* conn);
};

} // namespace common
