#pragma once

#include "i_query_executor.h"
#include "sqlite_connection_pool.h"
#include <sqlite3.h>

/**
 * @file sqlite_query_executor.h
 * @brief SQLite Query Executor
 *
 * Binds $1..$N through sqlite3_bind_parameter_index, so the same SQL text
 * runs on both cache backends.
 *
 * @date 2026-10-03
 */

namespace common {

class SqliteQueryExecutor : public IQueryExecutor {
public:
    /**
     * @param pool SQLite connection pool (non-owning)
     * @throws std::invalid_argument if pool is nullptr
     */
    explicit SqliteQueryExecutor(SqliteConnectionPool* pool);

    ~SqliteQueryExecutor() override = default;

    Json::Value executeQuery(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) override;

    int executeCommand(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) override;

    Json::Value executeScalar(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) override;

    std::string getDatabaseType() const override { return "sqlite"; }

private:
    SqliteConnectionPool* pool_;

    /**
     * @brief Prepare statement and bind parameters
     * @return Statement owned by the caller (sqlite3_finalize)
     * @throws DatabaseException on prepare/bind failure
     */
    sqlite3_stmt* prepare(sqlite3* db, const std::string& query,
                          const std::vector<std::string>& params);

    static Json::Value columnToJson(sqlite3_stmt* stmt, int col);
};

} // namespace common
