/**
 * @file pg_connection_pool.cpp
 * @brief PostgreSQL Connection Pool implementation
 */

#include "pg_connection_pool.h"
#include "../exception/exceptions.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace common {

// --- PgConnection ---

PgConnection::~PgConnection() {
    if (!released_ && conn_) {
        release();
    }
}

void PgConnection::release() {
    if (released_ || !conn_) {
        return;
    }

    if (pool_) {
        pool_->releaseConnection(conn_);
    }

    conn_ = nullptr;
    released_ = true;
}

// --- PgConnectionPool ---

PgConnectionPool::PgConnectionPool(
    const std::string& connString,
    size_t minSize,
    size_t maxSize,
    int acquireTimeoutSec)
    : connString_(connString)
    , minSize_(minSize)
    , maxSize_(maxSize)
    , acquireTimeout_(acquireTimeoutSec)
    , totalConnections_(0)
    , shutdown_(false)
{
    if (maxSize == 0) {
        throw std::invalid_argument("PgConnectionPool: maxSize must be positive");
    }
    if (minSize > maxSize) {
        throw std::invalid_argument("PgConnectionPool: minSize cannot exceed maxSize");
    }

    spdlog::debug("[PgConnectionPool] Created: min={}, max={}, timeout={}s",
                  minSize_, maxSize_, acquireTimeoutSec);
}

PgConnectionPool::~PgConnectionPool() {
    shutdown();
}

bool PgConnectionPool::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    for (size_t i = 0; i < minSize_; i++) {
        PGconn* conn = createConnection();
        if (!conn) {
            spdlog::error("[PgConnectionPool] Failed to open connection {}/{}", i + 1, minSize_);
            return false;
        }
        idle_.push(conn);
        totalConnections_++;
    }

    spdlog::info("[PgConnectionPool] Initialized with {} connections", totalConnections_.load());
    return true;
}

PgConnection PgConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + acquireTimeout_;

    while (true) {
        if (shutdown_) {
            throw DatabaseException("PostgreSQL pool is shut down");
        }

        if (!idle_.empty()) {
            PGconn* conn = idle_.front();
            idle_.pop();

            if (isConnectionHealthy(conn)) {
                return PgConnection(conn, this);
            }

            spdlog::warn("[PgConnectionPool] Dropping unhealthy idle connection");
            PQfinish(conn);
            totalConnections_--;
            continue;
        }

        if (totalConnections_ < maxSize_) {
            totalConnections_++;
            lock.unlock();
            PGconn* conn = createConnection();
            lock.lock();

            if (!conn) {
                totalConnections_--;
                throw DatabaseException("failed to open PostgreSQL connection");
            }
            spdlog::debug("[PgConnectionPool] Opened connection (total: {})", totalConnections_.load());
            return PgConnection(conn, this);
        }

        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
            spdlog::warn("[PgConnectionPool] Timed out after {}s waiting for a connection",
                         acquireTimeout_.count());
            throw PoolExhaustedException("PostgreSQL");
        }
    }
}

std::string PgConnectionPool::describe() const {
    char* errmsg = nullptr;
    PQconninfoOption* options = PQconninfoParse(connString_.c_str(), &errmsg);
    if (!options) {
        if (errmsg) {
            PQfreemem(errmsg);
        }
        return "postgres:<invalid connection string>";
    }

    std::string host = "localhost", port = "5432", dbname, user;
    for (PQconninfoOption* opt = options; opt->keyword; ++opt) {
        if (!opt->val) {
            continue;
        }
        std::string key = opt->keyword;
        if (key == "host") host = opt->val;
        else if (key == "port") port = opt->val;
        else if (key == "dbname") dbname = opt->val;
        else if (key == "user") user = opt->val;
    }
    PQconninfoFree(options);

    return "postgres:" + (user.empty() ? "" : user + "@") + host + ":" + port + "/" + dbname;
}

IDbConnectionPool::Stats PgConnectionPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Stats{idle_.size(), totalConnections_.load(), maxSize_};
}

void PgConnectionPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        return;
    }
    shutdown_ = true;

    while (!idle_.empty()) {
        PQfinish(idle_.front());
        idle_.pop();
    }
    totalConnections_ = 0;

    cv_.notify_all();
    spdlog::debug("[PgConnectionPool] Shut down");
}

PGconn* PgConnectionPool::createConnection() {
    PGconn* conn = PQconnectdb(connString_.c_str());

    if (PQstatus(conn) != CONNECTION_OK) {
        spdlog::error("[PgConnectionPool] Connection failed: {}", PQerrorMessage(conn));
        PQfinish(conn);
        return nullptr;
    }
    return conn;
}

bool PgConnectionPool::isConnectionHealthy(PGconn* conn) {
    if (!conn || PQstatus(conn) != CONNECTION_OK) {
        return false;
    }

    PGresult* res = PQexec(conn, "SELECT 1");
    bool ok = res && PQresultStatus(res) == PGRES_TUPLES_OK;
    if (res) {
        PQclear(res);
    }
    return ok;
}

void PgConnectionPool::releaseConnection(PGconn* conn) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        PQfinish(conn);
        return;
    }

    if (PQstatus(conn) == CONNECTION_OK) {
        idle_.push(conn);
    } else {
        spdlog::warn("[PgConnectionPool] Released connection is broken, closing");
        PQfinish(conn);
        totalConnections_--;
    }

    cv_.notify_one();
}

} // namespace common
