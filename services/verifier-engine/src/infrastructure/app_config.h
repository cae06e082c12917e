#pragma once

/**
 * @file app_config.h
 * @brief Application configuration
 *
 * Layering: built-in defaults, then EV_* environment variables, then the
 * JSON config file, then command-line flags (applied by the caller).
 */

#include <string>
#include "db_connection_pool_factory.h"
#include <everify/verification/mx_resolver.h>
#include <everify/verification/smtp_client.h>

struct AppConfig {
    // Engine
    int workers = 50;
    int mxWorkers = 20;
    bool premium = false;
    std::string layout = "combined";           // "combined" or "per-file"
    std::string disposableDomainsFile;         // Extra disposable domains, one per line

    // DNS / SMTP
    int dnsTimeoutSec = 3;
    int smtpTimeoutSec = 6;                    // Connect and reply timeout, standard mode
    int smtpDeepTimeoutSec = 8;                // Connect and reply timeout, premium mode
    int smtpPort = 25;
    std::string heloDomain = "example.com";
    std::string mailFrom = "verify@example.com";

    // Cache
    bool cacheEnabled = true;
    std::string cacheType = "sqlite";
    std::string cachePath = "email_cache_v3.db";
    int cacheTtlDays = 30;                     // 0 = entries never expire
    std::string cachePgHost = "localhost";
    int cachePgPort = 5432;
    std::string cachePgDb = "email_verifier";
    std::string cachePgUser = "verifier";
    std::string cachePgPassword;

    // Logging
    std::string logLevel = "info";
    std::string logFile;

    // HTTP API
    int apiPort = 8080;
    int apiThreads = 4;
    std::string apiUploadDir = "uploads";
    std::string apiOutputDir = "output";

    /**
     * @brief Parse an integer and clamp it to [minVal, maxVal]
     *
     * Unparseable values yield defaultVal with a warning.
     */
    static int parseIntClamped(const std::string& val, int defaultVal, int minVal, int maxVal);

    /**
     * @brief Defaults overlaid with EV_* environment variables
     */
    static AppConfig fromEnvironment();

    /**
     * @brief Overlay values from a JSON config file
     *
     * Keys: workers, mx_workers, premium, layout, dns_timeout_sec,
     * smtp_timeout_sec, smtp_deep_timeout_sec, smtp_port, helo_domain,
     * mail_from, disposable_domains_file, cache.{enabled,type,path,ttl_days,
     * pg_host,pg_port,pg_db,pg_user,pg_password}, log_level, log_file,
     * api.{port,threads,upload_dir,output_dir}.
     *
     * @throws common::ConfigException if the file is missing or not valid JSON
     */
    void applyConfigFile(const std::string& path);

    /**
     * @brief Check value ranges and enumerations
     * @throws common::ConfigException on the first invalid value
     */
    void validate() const;

    common::DbPoolConfig toDbPoolConfig() const;
    everify::verification::MxResolverOptions toMxResolverOptions() const;
    everify::verification::SmtpProbeOptions toSmtpProbeOptions() const;
    /// Timeouts follow the mode: smtpDeepTimeoutSec when deep, smtpTimeoutSec otherwise
    everify::verification::SmtpProbeOptions toSmtpProbeOptions(bool deep) const;
};
