#include "sqlite_query_executor.h"
#include "../exception/exceptions.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace common {

// ============================================================================
// Constructor
// ============================================================================

SqliteQueryExecutor::SqliteQueryExecutor(SqliteConnectionPool* pool)
    : pool_(pool)
{
    if (!pool_) {
        throw std::invalid_argument("SqliteQueryExecutor: pool cannot be nullptr");
    }
    spdlog::debug("[SqliteQueryExecutor] Initialized ({})", pool_->getPath());
}

// ============================================================================
// Public Interface Implementation
// ============================================================================

Json::Value SqliteQueryExecutor::executeQuery(
    const std::string& query,
    const std::vector<std::string>& params)
{
    auto conn = pool_->acquire();
    sqlite3_stmt* stmt = prepare(conn.get(), query, params);

    Json::Value array = Json::arrayValue;
    int cols = sqlite3_column_count(stmt);

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Json::Value row(Json::objectValue);
        for (int c = 0; c < cols; ++c) {
            row[sqlite3_column_name(stmt, c)] = columnToJson(stmt, c);
        }
        array.append(row);
    }

    if (rc != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(conn.get());
        sqlite3_finalize(stmt);
        spdlog::error("[SqliteQueryExecutor] Query failed: {}", error);
        throw DatabaseException(error);
    }

    sqlite3_finalize(stmt);
    return array;
}

int SqliteQueryExecutor::executeCommand(
    const std::string& query,
    const std::vector<std::string>& params)
{
    auto conn = pool_->acquire();
    sqlite3_stmt* stmt = prepare(conn.get(), query, params);

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        // RETURNING rows are ignored
    }

    if (rc != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(conn.get());
        sqlite3_finalize(stmt);
        spdlog::error("[SqliteQueryExecutor] Command failed: {}", error);
        throw DatabaseException(error);
    }

    sqlite3_finalize(stmt);
    int affected = sqlite3_changes(conn.get());
    spdlog::debug("[SqliteQueryExecutor] Command executed, affected rows: {}", affected);
    return affected;
}

Json::Value SqliteQueryExecutor::executeScalar(
    const std::string& query,
    const std::vector<std::string>& params)
{
    auto conn = pool_->acquire();
    sqlite3_stmt* stmt = prepare(conn.get(), query, params);

    if (sqlite3_column_count(stmt) != 1) {
        sqlite3_finalize(stmt);
        throw DatabaseException("scalar query must return exactly one column");
    }

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        throw DatabaseException("scalar query returned no rows");
    }
    if (rc != SQLITE_ROW) {
        std::string error = sqlite3_errmsg(conn.get());
        sqlite3_finalize(stmt);
        throw DatabaseException(error);
    }

    Json::Value value = columnToJson(stmt, 0);
    sqlite3_finalize(stmt);
    return value;
}

// ============================================================================
// Private Implementation
// ============================================================================

sqlite3_stmt* SqliteQueryExecutor::prepare(
    sqlite3* db,
    const std::string& query,
    const std::vector<std::string>& params)
{
    spdlog::trace("[SqliteQueryExecutor] Query: {} (params: {})", query, params.size());

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, query.c_str(), static_cast<int>(query.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        spdlog::error("[SqliteQueryExecutor] Prepare failed: {}", error);
        throw DatabaseException(error);
    }

    for (size_t i = 0; i < params.size(); ++i) {
        std::string name = "$" + std::to_string(i + 1);
        int index = sqlite3_bind_parameter_index(stmt, name.c_str());
        if (index == 0) {
            // Placeholder not used by this statement
            continue;
        }

        rc = params[i].empty()
            ? sqlite3_bind_null(stmt, index)
            : sqlite3_bind_text(stmt, index, params[i].c_str(),
                                static_cast<int>(params[i].size()), SQLITE_TRANSIENT);
        if (rc != SQLITE_OK) {
            sqlite3_finalize(stmt);
            throw DatabaseException("failed to bind parameter " + name);
        }
    }

    return stmt;
}

Json::Value SqliteQueryExecutor::columnToJson(sqlite3_stmt* stmt, int col)
{
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_NULL:
            return Json::nullValue;
        case SQLITE_INTEGER:
            return Json::Value(static_cast<Json::Int64>(sqlite3_column_int64(stmt, col)));
        case SQLITE_FLOAT:
            return Json::Value(sqlite3_column_double(stmt, col));
        default: {
            const unsigned char* text = sqlite3_column_text(stmt, col);
            int len = sqlite3_column_bytes(stmt, col);
            return Json::Value(std::string(reinterpret_cast<const char*>(text), len));
        }
    }
}

} // namespace common
