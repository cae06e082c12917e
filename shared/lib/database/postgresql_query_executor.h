#pragma once

#include "i_query_executor.h"
#include "pg_connection_pool.h"
#include <libpq-fe.h>

/**
 * @file postgresql_query_executor.h
 * @brief PostgreSQL Query Executor
 *
 * Executes parameterized statements through PQexecParams on a pooled connection.
 *
 * @date 2026-10-03
 */

namespace common {

class PostgreSQLQueryExecutor : public IQueryExecutor {
public:
    /**
     * @param pool PostgreSQL connection pool (non-owning)
     * @throws std::invalid_argument if pool is nullptr
     */
    explicit PostgreSQLQueryExecutor(PgConnectionPool* pool);

    ~PostgreSQLQueryExecutor() override = default;

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

    std::string getDatabaseType() const override { return "postgres"; }

private:
    PgConnectionPool* pool_;

    /**
     * @brief Run statement on an acquired connection
     * @return Result owned by the caller (PQclear)
     * @throws DatabaseException on failure
     */
    PGresult* run(PgConnection& conn, const std::string& query,
                  const std::vector<std::string>& params);

    /**
     * @brief Convert a single cell using the column type OID
     */
    static Json::Value cellToJson(PGresult* res, int row, int col);

    static Json::Value pgResultToJson(PGresult* res);
};

} // namespace common
