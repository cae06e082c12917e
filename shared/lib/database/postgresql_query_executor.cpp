#include "postgresql_query_executor.h"
#include "../exception/exceptions.h"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <cstdlib>

namespace common {

namespace {

// PostgreSQL type OIDs (pg_type.h)
constexpr Oid OID_BOOL = 16;
constexpr Oid OID_INT8 = 20;
constexpr Oid OID_INT4 = 23;
constexpr Oid OID_FLOAT4 = 700;
constexpr Oid OID_FLOAT8 = 701;

} // anonymous namespace

// ============================================================================
// Constructor
// ============================================================================

PostgreSQLQueryExecutor::PostgreSQLQueryExecutor(PgConnectionPool* pool)
    : pool_(pool)
{
    if (!pool_) {
        throw std::invalid_argument("PostgreSQLQueryExecutor: pool cannot be nullptr");
    }
    spdlog::debug("[PostgreSQLQueryExecutor] Initialized");
}

// ============================================================================
// Public Interface Implementation
// ============================================================================

Json::Value PostgreSQLQueryExecutor::executeQuery(
    const std::string& query,
    const std::vector<std::string>& params)
{
    auto conn = pool_->acquire();
    PGresult* res = run(conn, query, params);

    Json::Value result = pgResultToJson(res);
    PQclear(res);
    return result;
}

int PostgreSQLQueryExecutor::executeCommand(
    const std::string& query,
    const std::vector<std::string>& params)
{
    auto conn = pool_->acquire();
    PGresult* res = run(conn, query, params);

    const char* affected = PQcmdTuples(res);
    int rows = (affected && affected[0] != '\0') ? std::atoi(affected) : 0;
    PQclear(res);

    spdlog::debug("[PostgreSQLQueryExecutor] Command executed, affected rows: {}", rows);
    return rows;
}

Json::Value PostgreSQLQueryExecutor::executeScalar(
    const std::string& query,
    const std::vector<std::string>& params)
{
    auto conn = pool_->acquire();
    PGresult* res = run(conn, query, params);

    if (PQntuples(res) == 0) {
        PQclear(res);
        throw DatabaseException("scalar query returned no rows");
    }
    if (PQnfields(res) != 1) {
        PQclear(res);
        throw DatabaseException("scalar query must return exactly one column");
    }

    Json::Value value = cellToJson(res, 0, 0);
    PQclear(res);
    return value;
}

// ============================================================================
// Private Implementation
// ============================================================================

PGresult* PostgreSQLQueryExecutor::run(
    PgConnection& conn,
    const std::string& query,
    const std::vector<std::string>& params)
{
    spdlog::trace("[PostgreSQLQueryExecutor] Query: {} (params: {})", query, params.size());

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& param : params) {
        values.push_back(param.empty() ? nullptr : param.c_str());
    }

    PGresult* res = PQexecParams(
        conn.get(),
        query.c_str(),
        static_cast<int>(params.size()),
        nullptr,          // infer parameter types
        values.data(),
        nullptr,          // text parameters
        nullptr,
        0                 // text results
    );

    if (!res) {
        throw DatabaseException(std::string("PQexecParams returned null: ") + PQerrorMessage(conn.get()));
    }

    ExecStatusType status = PQresultStatus(res);
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        std::string error = PQerrorMessage(conn.get());
        PQclear(res);
        spdlog::error("[PostgreSQLQueryExecutor] Query failed: {}", error);
        throw DatabaseException(error);
    }

    return res;
}

Json::Value PostgreSQLQueryExecutor::cellToJson(PGresult* res, int row, int col)
{
    if (PQgetisnull(res, row, col)) {
        return Json::nullValue;
    }

    const char* value = PQgetvalue(res, row, col);
    switch (PQftype(res, col)) {
        case OID_INT4:
        case OID_INT8:
            return Json::Value(static_cast<Json::Int64>(std::atoll(value)));
        case OID_FLOAT4:
        case OID_FLOAT8:
            return Json::Value(std::atof(value));
        case OID_BOOL:
            return Json::Value(value[0] == 't');
        default:
            return Json::Value(value);
    }
}

Json::Value PostgreSQLQueryExecutor::pgResultToJson(PGresult* res)
{
    Json::Value array = Json::arrayValue;

    int rows = PQntuples(res);
    int cols = PQnfields(res);

    for (int i = 0; i < rows; ++i) {
        Json::Value row(Json::objectValue);
        for (int j = 0; j < cols; ++j) {
            row[PQfname(res, j)] = cellToJson(res, i, j);
        }
        array.append(row);
    }

    return array;
}

} // namespace common
