/**
 * @file test_sqlite_query_executor.cpp
 * @brief Unit tests for the SQLite pool, executor and factories
 */

#include <gtest/gtest.h>
#include "db_connection_pool_factory.h"
#include "i_query_executor.h"
#include "pg_connection_pool.h"
#include "sqlite_connection_pool.h"
#include "sqlite_query_executor.h"
#include "exception/exceptions.h"

#include <memory>

using namespace common;

class SqliteQueryExecutorTest : public ::testing::Test {
protected:
    std::unique_ptr<SqliteConnectionPool> pool;
    std::unique_ptr<SqliteQueryExecutor> executor;

    void SetUp() override {
        pool = std::make_unique<SqliteConnectionPool>(":memory:");
        ASSERT_TRUE(pool->initialize());
        executor = std::make_unique<SqliteQueryExecutor>(pool.get());
        executor->executeCommand(
            "CREATE TABLE item (name TEXT PRIMARY KEY NOT NULL, note TEXT, qty INTEGER, ratio REAL)");
    }
};

TEST_F(SqliteQueryExecutorTest, NullPoolThrows) {
    EXPECT_THROW(SqliteQueryExecutor(nullptr), std::invalid_argument);
}

TEST_F(SqliteQueryExecutorTest, InsertAndSelectWithPlaceholders) {
    EXPECT_EQ(executor->executeCommand(
        "INSERT INTO item (name, note, qty, ratio) VALUES ($1, $2, $3, $4)",
        {"alpha", "first", "3", "0.5"}), 1);

    Json::Value rows = executor->executeQuery("SELECT * FROM item WHERE name = $1", {"alpha"});
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0]["name"].asString(), "alpha");
    EXPECT_EQ(rows[0]["note"].asString(), "first");
    // Type affinity turns the bound text into numbers
    EXPECT_TRUE(rows[0]["qty"].isIntegral());
    EXPECT_EQ(rows[0]["qty"].asInt64(), 3);
    EXPECT_DOUBLE_EQ(rows[0]["ratio"].asDouble(), 0.5);
}

TEST_F(SqliteQueryExecutorTest, EmptyParameterBindsNull) {
    executor->executeCommand("INSERT INTO item (name, note) VALUES ($1, $2)", {"beta", ""});
    Json::Value rows = executor->executeQuery("SELECT note FROM item WHERE name = $1", {"beta"});
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_TRUE(rows[0]["note"].isNull());
}

TEST_F(SqliteQueryExecutorTest, ReusedPlaceholder) {
    executor->executeCommand("INSERT INTO item (name, note) VALUES ($1, $1)", {"gamma"});
    Json::Value rows = executor->executeQuery("SELECT note FROM item");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0]["note"].asString(), "gamma");
}

TEST_F(SqliteQueryExecutorTest, UpsertReportsAffectedRows) {
    const std::string upsert =
        "INSERT INTO item (name, qty) VALUES ($1, $2) "
        "ON CONFLICT (name) DO UPDATE SET qty = excluded.qty";
    EXPECT_EQ(executor->executeCommand(upsert, {"delta", "1"}), 1);
    EXPECT_EQ(executor->executeCommand(upsert, {"delta", "2"}), 1);
    EXPECT_EQ(executor->executeScalar("SELECT qty FROM item WHERE name = $1", {"delta"}).asInt64(), 2);
}

TEST_F(SqliteQueryExecutorTest, ScalarErrors) {
    EXPECT_THROW(executor->executeScalar("SELECT qty FROM item WHERE name = $1", {"none"}),
                 DatabaseException);
    EXPECT_THROW(executor->executeScalar("SELECT name, qty FROM item"), DatabaseException);
    EXPECT_EQ(executor->executeScalar("SELECT COUNT(*) FROM item").asInt64(), 0);
}

TEST_F(SqliteQueryExecutorTest, SqlErrorsThrowDatabaseException) {
    EXPECT_THROW(executor->executeQuery("SELECT * FROM missing_table"), DatabaseException);
    EXPECT_THROW(executor->executeCommand("INSERT INTO item (name) VALUES ($1)", {""}),
                 DatabaseException);
}

TEST_F(SqliteQueryExecutorTest, InMemoryPoolKeepsSingleConnection) {
    auto stats = pool->getStats();
    EXPECT_EQ(stats.maxConnections, 1u);
    EXPECT_EQ(executor->getDatabaseType(), "sqlite");
    EXPECT_EQ(pool->describe(), "sqlite::memory:");
}

TEST_F(SqliteQueryExecutorTest, ShutdownPoolRejectsQueries) {
    pool->shutdown();
    EXPECT_THROW(executor->executeQuery("SELECT 1"), DatabaseException);
}

// --- Factories ---

TEST(DbConnectionPoolFactoryTest, SupportedTypes) {
    EXPECT_TRUE(DbConnectionPoolFactory::isSupported("sqlite"));
    EXPECT_TRUE(DbConnectionPoolFactory::isSupported("SQLite3"));
    EXPECT_TRUE(DbConnectionPoolFactory::isSupported("postgresql"));
    EXPECT_TRUE(DbConnectionPoolFactory::isSupported("pg"));
    EXPECT_FALSE(DbConnectionPoolFactory::isSupported("oracle"));
}

TEST(DbConnectionPoolFactoryTest, UnsupportedTypeThrows) {
    DbPoolConfig config;
    config.dbType = "mysql";
    EXPECT_THROW(DbConnectionPoolFactory::create(config), ConfigException);
}

TEST(DbConnectionPoolFactoryTest, PostgresConnString) {
    DbPoolConfig config;
    config.pgHost = "db";
    config.pgPort = 6543;
    config.pgDatabase = "cache";
    config.pgUser = "u";
    EXPECT_EQ(config.buildPostgresConnString(), "host=db port=6543 dbname=cache user=u connect_timeout=5");

    config.pgPassword = "p";
    EXPECT_NE(config.buildPostgresConnString().find(" password=p"), std::string::npos);

    // describe() parses the string without connecting and hides the password
    PgConnectionPool pool(config.buildPostgresConnString());
    EXPECT_EQ(pool.describe(), "postgres:u@db:6543/cache");
}

TEST(DbConnectionPoolFactoryTest, SqlitePoolAndExecutor) {
    DbPoolConfig config;
    config.sqlitePath = ":memory:";

    auto pool = DbConnectionPoolFactory::create(config);
    ASSERT_NE(pool, nullptr);
    EXPECT_EQ(pool->getDatabaseType(), "sqlite");
    ASSERT_TRUE(pool->initialize());

    auto executor = createQueryExecutor(pool.get());
    EXPECT_EQ(executor->getDatabaseType(), "sqlite");
    EXPECT_EQ(executor->executeScalar("SELECT 1 + 1").asInt64(), 2);
}

TEST(DbConnectionPoolFactoryTest, NullPoolForExecutorThrows) {
    EXPECT_THROW(createQueryExecutor(nullptr), std::invalid_argument);
}
