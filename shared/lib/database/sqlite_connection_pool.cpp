/**
 * @file sqlite_connection_pool.cpp
 * @brief SQLite Connection Pool implementation
 */

#include "sqlite_connection_pool.h"
#include "../exception/exceptions.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace common {

// --- SqliteConnection ---

void SqliteConnection::release() {
    if (!db_) {
        return;
    }
    if (pool_) {
        pool_->releaseConnection(db_);
    } else {
        sqlite3_close_v2(db_);
    }
    db_ = nullptr;
}

// --- SqliteConnectionPool ---

SqliteConnectionPool::SqliteConnectionPool(
    const std::string& path,
    size_t maxSize,
    int busyTimeoutMs,
    int acquireTimeoutSec)
    : path_(path)
    , maxSize_(maxSize)
    , busyTimeoutMs_(busyTimeoutMs)
    , acquireTimeout_(acquireTimeoutSec)
    , totalConnections_(0)
    , shutdown_(false)
{
    if (path_.empty()) {
        throw std::invalid_argument("SqliteConnectionPool: path cannot be empty");
    }
    if (maxSize_ == 0) {
        throw std::invalid_argument("SqliteConnectionPool: maxSize must be positive");
    }
    if (path_ == ":memory:" && maxSize_ > 1) {
        spdlog::debug("[SqliteConnectionPool] In-memory database, pool limited to one connection");
        maxSize_ = 1;
    }
}

SqliteConnectionPool::~SqliteConnectionPool() {
    shutdown();
}

bool SqliteConnectionPool::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (totalConnections_ > 0) {
        return true;
    }

    sqlite3* db = openConnection();
    if (!db) {
        return false;
    }
    idle_.push(db);
    totalConnections_ = 1;

    spdlog::info("[SqliteConnectionPool] Opened cache database: {} (max connections: {})",
                 path_, maxSize_);
    return true;
}

SqliteConnection SqliteConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + acquireTimeout_;

    while (true) {
        if (shutdown_) {
            throw DatabaseException("SQLite pool is shut down");
        }

        if (!idle_.empty()) {
            sqlite3* db = idle_.front();
            idle_.pop();
            return SqliteConnection(db, this);
        }

        if (totalConnections_ < maxSize_) {
            totalConnections_++;
            lock.unlock();
            sqlite3* db = openConnection();
            lock.lock();

            if (!db) {
                totalConnections_--;
                throw DatabaseException("failed to open SQLite database: " + path_);
            }
            return SqliteConnection(db, this);
        }

        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
            throw PoolExhaustedException("SQLite");
        }
    }
}

IDbConnectionPool::Stats SqliteConnectionPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Stats{idle_.size(), totalConnections_, maxSize_};
}

void SqliteConnectionPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        return;
    }
    shutdown_ = true;

    while (!idle_.empty()) {
        sqlite3_close_v2(idle_.front());
        idle_.pop();
    }
    totalConnections_ = 0;
    cv_.notify_all();
}

sqlite3* SqliteConnectionPool::openConnection() {
    sqlite3* db = nullptr;
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;

    int rc = sqlite3_open_v2(path_.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        spdlog::error("[SqliteConnectionPool] Cannot open {}: {}",
                      path_, db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
        if (db) {
            sqlite3_close_v2(db);
        }
        return nullptr;
    }

    sqlite3_busy_timeout(db, busyTimeoutMs_);

    if (path_ != ":memory:") {
        char* errmsg = nullptr;
        if (sqlite3_exec(db, "PRAGMA journal_mode=WAL", nullptr, nullptr, &errmsg) != SQLITE_OK) {
            spdlog::warn("[SqliteConnectionPool] WAL not enabled: {}", errmsg ? errmsg : "unknown");
            sqlite3_free(errmsg);
        }
    }

    return db;
}

void SqliteConnectionPool::releaseConnection(sqlite3* db) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        sqlite3_close_v2(db);
        return;
    }

    idle_.push(db);
    cv_.notify_one();
}

} // namespace common
