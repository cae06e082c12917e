/**
 * @file config_manager.h
 * @brief Centralized Configuration Management
 *
 * Provides unified access to environment variables and the JSON config file.
 * Features:
 * - Environment variable access with defaults
 * - JSON config file loading (nested objects flattened to "a.b" keys)
 * - Type-safe configuration retrieval
 * - Thread-safe singleton pattern
 *
 * Lookup order: values set explicitly or loaded from file, then environment.
 *
 * @date 2026-10-02
 */

#pragma once

#include <string>
#include <map>
#include <optional>
#include <mutex>
#include <memory>

namespace Json {
class Value;
}

namespace common {

/**
 * @brief Configuration Manager (Singleton)
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    ConfigManager();

    void flatten(const std::string& prefix, const Json::Value& node);

public:
    /**
     * @brief Get singleton instance
     */
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get integer configuration value (default on parse failure)
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Get boolean configuration value
     *
     * Accepts true/false, 1/0, yes/no, on/off (case-insensitive).
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Get value only if present
     *
     * Loaded keys win. Keys starting with EV_ fall back to the environment.
     */
    std::optional<std::string> find(const std::string& key) const;

    /**
     * @brief Check if configuration key exists
     */
    bool has(const std::string& key) const;

    /**
     * @brief Set configuration value
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Remove all explicitly set values (environment is untouched)
     */
    void clear();

    /**
     * @brief Load recognized EV_* variables from environment
     */
    void loadFromEnvironment();

    /**
     * @brief Load JSON config file
     *
     * Scalars are stored as strings; arrays are stored comma-joined.
     *
     * @param path Path to JSON file
     * @throws ConfigException if file cannot be read or parsed
     */
    void loadFromFile(const std::string& path);

    /**
     * @brief Get environment variable
     */
    static std::string getEnv(const std::string& key, const std::string& defaultValue = "");

    /// @name Predefined Environment Keys

    // Engine
    static constexpr const char* EV_WORKERS = "EV_WORKERS";
    static constexpr const char* EV_MX_WORKERS = "EV_MX_WORKERS";
    static constexpr const char* EV_PREMIUM = "EV_PREMIUM";
    static constexpr const char* EV_LAYOUT = "EV_LAYOUT";
    static constexpr const char* EV_DNS_TIMEOUT = "EV_DNS_TIMEOUT";
    static constexpr const char* EV_SMTP_TIMEOUT = "EV_SMTP_TIMEOUT";
    static constexpr const char* EV_SMTP_DEEP_TIMEOUT = "EV_SMTP_DEEP_TIMEOUT";
    static constexpr const char* EV_SMTP_PORT = "EV_SMTP_PORT";
    static constexpr const char* EV_HELO_DOMAIN = "EV_HELO_DOMAIN";
    static constexpr const char* EV_MAIL_FROM = "EV_MAIL_FROM";
    static constexpr const char* EV_DISPOSABLE_FILE = "EV_DISPOSABLE_FILE";

    // Cache
    static constexpr const char* EV_CACHE_ENABLED = "EV_CACHE_ENABLED";
    static constexpr const char* EV_CACHE_TYPE = "EV_CACHE_TYPE";
    static constexpr const char* EV_CACHE_PATH = "EV_CACHE_PATH";
    static constexpr const char* EV_CACHE_TTL_DAYS = "EV_CACHE_TTL_DAYS";
    static constexpr const char* EV_CACHE_PG_HOST = "EV_CACHE_PG_HOST";
    static constexpr const char* EV_CACHE_PG_PORT = "EV_CACHE_PG_PORT";
    static constexpr const char* EV_CACHE_PG_DB = "EV_CACHE_PG_DB";
    static constexpr const char* EV_CACHE_PG_USER = "EV_CACHE_PG_USER";
    static constexpr const char* EV_CACHE_PG_PASSWORD = "EV_CACHE_PG_PASSWORD";

    // Service
    static constexpr const char* EV_CONFIG_FILE = "EV_CONFIG_FILE";
    static constexpr const char* EV_API_PORT = "EV_API_PORT";
    static constexpr const char* EV_API_THREADS = "EV_API_THREADS";
    static constexpr const char* EV_API_UPLOAD_DIR = "EV_API_UPLOAD_DIR";
    static constexpr const char* EV_API_OUTPUT_DIR = "EV_API_OUTPUT_DIR";
    static constexpr const char* EV_LOG_LEVEL = "EV_LOG_LEVEL";
    static constexpr const char* EV_LOG_FILE = "EV_LOG_FILE";
};

} // namespace common
