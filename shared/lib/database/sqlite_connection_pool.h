/**
 * @file sqlite_connection_pool.h
 * @brief SQLite Connection Pool (default cache backend)
 *
 * Each connection is opened with SQLITE_OPEN_FULLMUTEX, a busy timeout
 * and WAL journaling so that verification workers can share one cache file.
 * A ":memory:" database is private to its connection, so the pool is
 * limited to one connection in that case.
 *
 * @date 2026-10-03
 */

#pragma once

#include "db_connection_interface.h"
#include <sqlite3.h>
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <memory>
#include <chrono>

namespace common {

class SqliteConnectionPool;

/**
 * @brief RAII handle for a pooled SQLite connection
 */
class SqliteConnection {
private:
    sqlite3* db_;
    SqliteConnectionPool* pool_;  // Non-owning

public:
    SqliteConnection(sqlite3* db, SqliteConnectionPool* pool)
        : db_(db), pool_(pool) {}

    ~SqliteConnection() { release(); }

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    SqliteConnection(SqliteConnection&& other) noexcept
        : db_(other.db_), pool_(other.pool_) {
        other.db_ = nullptr;
    }

    SqliteConnection& operator=(SqliteConnection&& other) noexcept {
        if (this != &other) {
            release();
            db_ = other.db_;
            pool_ = other.pool_;
            other.db_ = nullptr;
        }
        return *this;
    }

    sqlite3* get() const { return db_; }

    bool isValid() const { return db_ != nullptr; }

    /// @brief Return the connection to its pool early (idempotent)
    void release();
};

/**
 * @brief SQLite Connection Pool
 */
class SqliteConnectionPool : public IDbConnectionPool {
private:
    std::string path_;
    size_t maxSize_;
    int busyTimeoutMs_;
    std::chrono::seconds acquireTimeout_;

    std::queue<sqlite3*> idle_;
    size_t totalConnections_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool shutdown_;

    friend class SqliteConnection;

public:
    /**
     * @param path Database file path or ":memory:"
     * @param maxSize Upper bound on open connections
     * @param busyTimeoutMs sqlite3_busy_timeout for each connection
     * @param acquireTimeoutSec Seconds acquire() waits for a free connection
     * @throws std::invalid_argument if path is empty or maxSize == 0
     */
    explicit SqliteConnectionPool(
        const std::string& path,
        size_t maxSize = 4,
        int busyTimeoutMs = 5000,
        int acquireTimeoutSec = 10
    );

    ~SqliteConnectionPool() override;

    SqliteConnectionPool(const SqliteConnectionPool&) = delete;
    SqliteConnectionPool& operator=(const SqliteConnectionPool&) = delete;

    /**
     * @brief Open the first connection (creates the file if missing)
     */
    bool initialize() override;

    /**
     * @throws PoolExhaustedException on timeout
     * @throws DatabaseException on shutdown or open failure
     */
    SqliteConnection acquire();

    Stats getStats() const override;

    void shutdown() override;

    std::string getDatabaseType() const override { return "sqlite"; }

    std::string describe() const override { return "sqlite:" + path_; }

    const std::string& getPath() const { return path_; }

private:
    sqlite3* openConnection();
    void releaseConnection(sqlite3* db);
};

} // namespace common
