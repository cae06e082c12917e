/**
 * @file test_app_config.cpp
 * @brief Unit tests for AppConfig layering and validation
 */

#include <gtest/gtest.h>
#include "../src/infrastructure/app_config.h"
#include "../src/infrastructure/service_container.h"
#include "../src/services/verification_service.h"
#include "config/config_manager.h"
#include "exception/exceptions.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class AppConfigTest : public ::testing::Test {
protected:
    std::string dir;

    void SetUp() override {
        char tmpl[] = "/tmp/everify_config_XXXXXX";
        ASSERT_NE(mkdtemp(tmpl), nullptr);
        dir = tmpl;
        common::ConfigManager::getInstance().clear();
    }

    void TearDown() override {
        unsetenv("EV_WORKERS");
        unsetenv("EV_PREMIUM");
        unsetenv("EV_CACHE_TTL_DAYS");
        unsetenv("EV_SMTP_DEEP_TIMEOUT");
        unsetenv("EV_CACHE_PG_HOST");
        unsetenv("workers");
        unsetenv("helo_domain");
        common::ConfigManager::getInstance().clear();
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string writeConfig(const std::string& json) {
        std::string path = dir + "/config.json";
        std::ofstream(path) << json;
        return path;
    }
};

TEST_F(AppConfigTest, Defaults) {
    AppConfig config;
    EXPECT_EQ(config.workers, 50);
    EXPECT_FALSE(config.premium);
    EXPECT_EQ(config.layout, "combined");
    EXPECT_EQ(config.dnsTimeoutSec, 3);
    EXPECT_EQ(config.smtpTimeoutSec, 6);
    EXPECT_EQ(config.smtpDeepTimeoutSec, 8);
    EXPECT_EQ(config.smtpPort, 25);
    EXPECT_EQ(config.heloDomain, "example.com");
    EXPECT_EQ(config.mailFrom, "verify@example.com");
    EXPECT_TRUE(config.cacheEnabled);
    EXPECT_EQ(config.cacheType, "sqlite");
    EXPECT_EQ(config.cachePath, "email_cache_v3.db");
    EXPECT_NO_THROW(config.validate());
}

TEST_F(AppConfigTest, EnvironmentOverridesDefaults) {
    setenv("EV_WORKERS", "12", 1);
    setenv("EV_PREMIUM", "yes", 1);
    setenv("EV_CACHE_TTL_DAYS", "0", 1);
    setenv("EV_SMTP_DEEP_TIMEOUT", "15", 1);
    setenv("EV_CACHE_PG_HOST", "db.internal", 1);

    AppConfig config = AppConfig::fromEnvironment();
    EXPECT_EQ(config.workers, 12);
    EXPECT_TRUE(config.premium);
    EXPECT_EQ(config.cacheTtlDays, 0);
    EXPECT_EQ(config.smtpDeepTimeoutSec, 15);
    EXPECT_EQ(config.cachePgHost, "db.internal");
}

TEST_F(AppConfigTest, InvalidIntegerKeepsDefault) {
    setenv("EV_WORKERS", "many", 1);
    AppConfig config = AppConfig::fromEnvironment();
    EXPECT_EQ(config.workers, 50);
}

TEST_F(AppConfigTest, ParseIntClamped) {
    EXPECT_EQ(AppConfig::parseIntClamped("70000", 25, 1, 65535), 65535);
    EXPECT_EQ(AppConfig::parseIntClamped("0", 25, 1, 65535), 1);
    EXPECT_EQ(AppConfig::parseIntClamped("x", 25, 1, 65535), 25);
}

TEST_F(AppConfigTest, ConfigFileOverridesEnvironment) {
    setenv("EV_WORKERS", "12", 1);
    AppConfig config = AppConfig::fromEnvironment();

    config.applyConfigFile(writeConfig(R"({
        "workers": 8,
        "layout": "per-file",
        "helo_domain": "verifier.test",
        "cache": { "enabled": false, "type": "postgres", "ttl_days": 90, "pg_port": 6543 },
        "api": { "port": 9090 }
    })"));

    EXPECT_EQ(config.workers, 8);
    EXPECT_EQ(config.layout, "per-file");
    EXPECT_EQ(config.heloDomain, "verifier.test");
    EXPECT_FALSE(config.cacheEnabled);
    EXPECT_EQ(config.cacheType, "postgres");
    EXPECT_EQ(config.cacheTtlDays, 90);
    EXPECT_EQ(config.cachePgPort, 6543);
    EXPECT_EQ(config.apiPort, 9090);
    EXPECT_NO_THROW(config.validate());
}

TEST_F(AppConfigTest, ConfigFileKeysDoNotReadPlainEnvironment) {
    setenv("workers", "3", 1);
    setenv("helo_domain", "from-env.test", 1);

    AppConfig config;
    config.applyConfigFile(writeConfig(R"({ "layout": "per-file" })"));

    EXPECT_EQ(config.workers, 50);
    EXPECT_EQ(config.heloDomain, "example.com");
    EXPECT_EQ(config.layout, "per-file");
    EXPECT_FALSE(common::ConfigManager::getInstance().find("workers").has_value());
}

TEST_F(AppConfigTest, MissingOrBrokenConfigFileThrows) {
    AppConfig config;
    EXPECT_THROW(config.applyConfigFile(dir + "/absent.json"), common::ConfigException);
    EXPECT_THROW(config.applyConfigFile(writeConfig("{ not json")), common::ConfigException);
}

TEST_F(AppConfigTest, ValidateRejectsBadValues) {
    AppConfig config;
    config.workers = 0;
    EXPECT_THROW(config.validate(), common::ConfigException);

    config = AppConfig();
    config.layout = "xml";
    EXPECT_THROW(config.validate(), common::ConfigException);

    config = AppConfig();
    config.cacheType = "oracle";
    EXPECT_THROW(config.validate(), common::ConfigException);

    config = AppConfig();
    config.logLevel = "loud";
    EXPECT_THROW(config.validate(), common::ConfigException);
}

TEST_F(AppConfigTest, ConversionsCarrySettings) {
    AppConfig config;
    config.cacheType = "postgresql";
    config.smtpPort = 2525;
    config.dnsTimeoutSec = 5;

    EXPECT_EQ(config.toDbPoolConfig().dbType, "postgres");
    EXPECT_EQ(config.toSmtpProbeOptions().port, 2525);
    EXPECT_EQ(config.toSmtpProbeOptions().connectTimeoutSec, 6);
    EXPECT_EQ(config.toSmtpProbeOptions().ioTimeoutSec, 6);
    EXPECT_EQ(config.toMxResolverOptions().timeoutSec, 5);
}

TEST_F(AppConfigTest, PremiumUsesDeepSmtpTimeoutForConnectAndReplies) {
    AppConfig config;
    config.premium = true;
    config.smtpTimeoutSec = 6;
    config.smtpDeepTimeoutSec = 8;

    auto options = config.toSmtpProbeOptions();
    EXPECT_EQ(options.connectTimeoutSec, 8);
    EXPECT_EQ(options.ioTimeoutSec, 8);

    // Deep jobs started by the API use the deep timeout regardless of the default mode
    config.premium = false;
    EXPECT_EQ(config.toSmtpProbeOptions(true).connectTimeoutSec, 8);
    EXPECT_EQ(config.toSmtpProbeOptions(false).connectTimeoutSec, 6);
}

// --- ServiceContainer ---

TEST_F(AppConfigTest, ContainerWithSqliteCache) {
    AppConfig config;
    config.cachePath = dir + "/cache.db";

    infrastructure::ServiceContainer container;
    ASSERT_TRUE(container.initialize(config));
    EXPECT_TRUE(container.cacheAvailable());
    EXPECT_NE(container.verificationService(), nullptr);
    EXPECT_NE(container.cacheRepository(), nullptr);
    EXPECT_TRUE(fs::exists(config.cachePath));
}

TEST_F(AppConfigTest, ContainerWithoutCache) {
    AppConfig config;
    config.cacheEnabled = false;

    infrastructure::ServiceContainer container;
    ASSERT_TRUE(container.initialize(config));
    EXPECT_FALSE(container.cacheAvailable());
    EXPECT_EQ(container.cacheProvider(), nullptr);
    EXPECT_NE(container.verificationService(), nullptr);
}

TEST_F(AppConfigTest, ContainerContinuesWhenCacheCannotOpen) {
    AppConfig config;
    config.cachePath = dir + "/missing-dir/cache.db";

    infrastructure::ServiceContainer container;
    ASSERT_TRUE(container.initialize(config));
    EXPECT_FALSE(container.cacheAvailable());
}

TEST_F(AppConfigTest, ContainerFailsOnMissingDisposableFile) {
    AppConfig config;
    config.cacheEnabled = false;
    config.disposableDomainsFile = dir + "/absent.txt";

    infrastructure::ServiceContainer container;
    EXPECT_FALSE(container.initialize(config));
}
