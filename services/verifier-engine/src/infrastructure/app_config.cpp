/**
 * @file app_config.cpp
 * @brief Application configuration loading and validation
 */

#include "app_config.h"
#include "config/config_manager.h"
#include "exception/exceptions.h"
#include "logging/logger.h"
#include "../services/report_writer.h"

#include <algorithm>
#include <cctype>
#include <limits>
#include <utility>
#include <spdlog/spdlog.h>

using common::ConfigManager;

namespace {

void readString(const ConfigManager& cm, const std::string& key, std::string& target) {
    if (auto val = cm.find(key)) target = *val;
}

void readInt(const ConfigManager& cm, const std::string& key, int& target, int minVal, int maxVal) {
    if (auto val = cm.find(key)) target = AppConfig::parseIntClamped(*val, target, minVal, maxVal);
}

void readBool(const ConfigManager& cm, const std::string& key, bool& target) {
    if (cm.has(key)) target = cm.getBool(key, target);
}

/// @brief Read every setting from ConfigManager using a key naming scheme
template <typename KeyFn>
void overlay(AppConfig& c, const ConfigManager& cm, KeyFn key) {
    readInt(cm, key("workers"), c.workers, std::numeric_limits<int>::min(), 100000);
    readInt(cm, key("mx_workers"), c.mxWorkers, 1, 1000);
    readBool(cm, key("premium"), c.premium);
    readString(cm, key("layout"), c.layout);
    readString(cm, key("disposable_domains_file"), c.disposableDomainsFile);

    readInt(cm, key("dns_timeout_sec"), c.dnsTimeoutSec, 1, 60);
    readInt(cm, key("smtp_timeout_sec"), c.smtpTimeoutSec, 1, 300);
    readInt(cm, key("smtp_deep_timeout_sec"), c.smtpDeepTimeoutSec, 1, 300);
    readInt(cm, key("smtp_port"), c.smtpPort, 1, 65535);
    readString(cm, key("helo_domain"), c.heloDomain);
    readString(cm, key("mail_from"), c.mailFrom);

    readBool(cm, key("cache.enabled"), c.cacheEnabled);
    readString(cm, key("cache.type"), c.cacheType);
    readString(cm, key("cache.path"), c.cachePath);
    readInt(cm, key("cache.ttl_days"), c.cacheTtlDays, 0, 36500);
    readString(cm, key("cache.pg_host"), c.cachePgHost);
    readInt(cm, key("cache.pg_port"), c.cachePgPort, 1, 65535);
    readString(cm, key("cache.pg_db"), c.cachePgDb);
    readString(cm, key("cache.pg_user"), c.cachePgUser);
    readString(cm, key("cache.pg_password"), c.cachePgPassword);

    readString(cm, key("log_level"), c.logLevel);
    readString(cm, key("log_file"), c.logFile);

    readInt(cm, key("api.port"), c.apiPort, 1, 65535);
    readInt(cm, key("api.threads"), c.apiThreads, 1, 128);
    readString(cm, key("api.upload_dir"), c.apiUploadDir);
    readString(cm, key("api.output_dir"), c.apiOutputDir);
}

/// @brief "cache.pg_host" -> "EV_CACHE_PG_HOST"
std::string envKey(const std::string& key) {
    static const std::pair<const char*, const char*> renamed[] = {
        {"dns_timeout_sec", ConfigManager::EV_DNS_TIMEOUT},
        {"smtp_timeout_sec", ConfigManager::EV_SMTP_TIMEOUT},
        {"smtp_deep_timeout_sec", ConfigManager::EV_SMTP_DEEP_TIMEOUT},
        {"disposable_domains_file", ConfigManager::EV_DISPOSABLE_FILE},
    };
    for (const auto& [from, to] : renamed) {
        if (key == from) return to;
    }

    std::string env = "EV_";
    for (char c : key) {
        env += (c == '.') ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return env;
}

} // anonymous namespace

int AppConfig::parseIntClamped(const std::string& val, int defaultVal, int minVal, int maxVal) {
    try {
        int v = std::stoi(val);
        return std::clamp(v, minVal, maxVal);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer config value '{}', using default {}", val, defaultVal);
        return defaultVal;
    }
}

AppConfig AppConfig::fromEnvironment() {
    AppConfig config;
    overlay(config, ConfigManager::getInstance(), envKey);
    return config;
}

void AppConfig::applyConfigFile(const std::string& path) {
    ConfigManager& cm = ConfigManager::getInstance();
    cm.loadFromFile(path);
    overlay(*this, cm, [](const std::string& key) { return key; });
}

void AppConfig::validate() const {
    if (workers <= 0) {
        throw common::ConfigException("workers must be a positive number, got " + std::to_string(workers));
    }
    if (!services::parseReportLayout(layout)) {
        throw common::ConfigException("layout must be 'combined' or 'per-file', got '" + layout + "'");
    }
    if (cacheEnabled && !common::DbConnectionPoolFactory::isSupported(cacheType)) {
        throw common::ConfigException("unsupported cache.type '" + cacheType + "'");
    }
    if (cacheEnabled && cacheTtlDays < 0) {
        throw common::ConfigException("cache.ttl_days cannot be negative");
    }
    if (!common::Logger::isValidLevel(logLevel)) {
        throw common::ConfigException("unknown log level '" + logLevel + "'");
    }
    if (heloDomain.empty() || mailFrom.empty()) {
        throw common::ConfigException("helo_domain and mail_from must not be empty");
    }
}

common::DbPoolConfig AppConfig::toDbPoolConfig() const {
    common::DbPoolConfig pool;
    pool.dbType = common::DbConnectionPoolFactory::normalizeDbType(cacheType);
    pool.sqlitePath = cachePath;
    pool.pgHost = cachePgHost;
    pool.pgPort = cachePgPort;
    pool.pgDatabase = cachePgDb;
    pool.pgUser = cachePgUser;
    pool.pgPassword = cachePgPassword;
    pool.maxSize = static_cast<size_t>(std::clamp(workers, 1, 16));
    return pool;
}

everify::verification::MxResolverOptions AppConfig::toMxResolverOptions() const {
    everify::verification::MxResolverOptions options;
    options.timeoutSec = dnsTimeoutSec;
    return options;
}

everify::verification::SmtpProbeOptions AppConfig::toSmtpProbeOptions() const {
    return toSmtpProbeOptions(premium);
}

everify::verification::SmtpProbeOptions AppConfig::toSmtpProbeOptions(bool deep) const {
    everify::verification::SmtpProbeOptions options;
    options.port = smtpPort;
    const int timeoutSec = deep ? smtpDeepTimeoutSec : smtpTimeoutSec;
    options.connectTimeoutSec = timeoutSec;
    options.ioTimeoutSec = timeoutSec;
    options.heloDomain = heloDomain;
    options.mailFrom = mailFrom;
    return options;
}
