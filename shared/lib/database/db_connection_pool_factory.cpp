/**
 * @file db_connection_pool_factory.cpp
 * @brief Connection Pool Factory Implementation
 */

#include "db_connection_pool_factory.h"
#include "pg_connection_pool.h"
#include "sqlite_connection_pool.h"
#include "../exception/exceptions.h"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <spdlog/spdlog.h>

namespace common {

std::string DbPoolConfig::buildPostgresConnString() const {
    std::ostringstream oss;
    oss << "host=" << pgHost
        << " port=" << pgPort
        << " dbname=" << pgDatabase
        << " user=" << pgUser;
    if (!pgPassword.empty()) {
        oss << " password=" << pgPassword;
    }
    oss << " connect_timeout=5";
    return oss.str();
}

std::shared_ptr<IDbConnectionPool> DbConnectionPoolFactory::create(const DbPoolConfig& config) {
    std::string type = normalizeDbType(config.dbType);

    if (type == "sqlite") {
        spdlog::debug("[DbConnectionPoolFactory] SQLite pool: {}", config.sqlitePath);
        return std::make_shared<SqliteConnectionPool>(
            config.sqlitePath,
            config.maxSize,
            config.sqliteBusyTimeoutMs,
            config.acquireTimeoutSec
        );
    }
    if (type == "postgres") {
        spdlog::debug("[DbConnectionPoolFactory] PostgreSQL pool: {}:{}/{}",
                      config.pgHost, config.pgPort, config.pgDatabase);
        return std::make_shared<PgConnectionPool>(
            config.buildPostgresConnString(),
            config.minSize,
            config.maxSize,
            config.acquireTimeoutSec
        );
    }

    throw ConfigException("unsupported cache database type: " + config.dbType);
}

bool DbConnectionPoolFactory::isSupported(const std::string& dbType) {
    std::string type = normalizeDbType(dbType);
    return type == "sqlite" || type == "postgres";
}

std::vector<std::string> DbConnectionPoolFactory::getSupportedTypes() {
    return {"sqlite", "sqlite3", "postgres", "postgresql", "pg"};
}

std::string DbConnectionPoolFactory::normalizeDbType(const std::string& dbType) {
    std::string lower = dbType;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "postgres" || lower == "postgresql" || lower == "pg") {
        return "postgres";
    }
    if (lower == "sqlite" || lower == "sqlite3") {
        return "sqlite";
    }
    return lower;
}

} // namespace common
