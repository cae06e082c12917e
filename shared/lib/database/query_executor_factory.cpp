#include "i_query_executor.h"
#include "db_connection_interface.h"
#include "postgresql_query_executor.h"
#include "sqlite_query_executor.h"
#include "../exception/exceptions.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

/**
 * @file query_executor_factory.cpp
 * @brief Query Executor Factory Implementation
 *
 * @date 2026-10-03
 */

namespace common {

std::unique_ptr<IQueryExecutor> createQueryExecutor(IDbConnectionPool* pool)
{
    if (!pool) {
        throw std::invalid_argument("createQueryExecutor: pool cannot be nullptr");
    }

    std::string dbType = pool->getDatabaseType();
    spdlog::debug("[QueryExecutorFactory] Creating executor for database type: {}", dbType);

    if (dbType == "sqlite") {
        auto sqlitePool = dynamic_cast<SqliteConnectionPool*>(pool);
        if (!sqlitePool) {
            throw DatabaseException("pool reports sqlite but is not a SqliteConnectionPool");
        }
        return std::make_unique<SqliteQueryExecutor>(sqlitePool);
    }
    if (dbType == "postgres") {
        auto pgPool = dynamic_cast<PgConnectionPool*>(pool);
        if (!pgPool) {
            throw DatabaseException("pool reports postgres but is not a PgConnectionPool");
        }
        return std::make_unique<PostgreSQLQueryExecutor>(pgPool);
    }

    throw DatabaseException("unsupported database type: " + dbType);
}

} // namespace common
