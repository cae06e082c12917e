/**
 * @file config_manager.cpp
 * @brief Implementation of Configuration Manager
 */

#include "config_manager.h"
#include "../exception/exceptions.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <json/json.h>
#include <spdlog/spdlog.h>

namespace common {

std::unique_ptr<ConfigManager> ConfigManager::instance_ = nullptr;
std::once_flag ConfigManager::initFlag_;

ConfigManager::ConfigManager() {
    loadFromEnvironment();
}

ConfigManager& ConfigManager::getInstance() {
    std::call_once(initFlag_, []() {
        instance_.reset(new ConfigManager());
    });
    return *instance_;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    auto value = find(key);
    return value ? *value : defaultValue;
}

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    std::string value = getString(key);
    if (value.empty()) {
        return defaultValue;
    }

    try {
        return std::stoi(value);
    } catch (const std::exception& e) {
        spdlog::warn("Failed to parse integer config '{}': {} (using default: {})",
                     key, e.what(), defaultValue);
        return defaultValue;
    }
}

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    std::string value = getString(key);
    if (value.empty()) {
        return defaultValue;
    }

    std::string lowerValue = value;
    std::transform(lowerValue.begin(), lowerValue.end(), lowerValue.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lowerValue == "true" || lowerValue == "1" || lowerValue == "yes" || lowerValue == "on") {
        return true;
    } else if (lowerValue == "false" || lowerValue == "0" || lowerValue == "no" || lowerValue == "off") {
        return false;
    }

    spdlog::warn("Invalid boolean config '{}': {} (using default: {})",
                 key, value, defaultValue);
    return defaultValue;
}

std::optional<std::string> ConfigManager::find(const std::string& key) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = config_.find(key);
        if (it != config_.end()) {
            return it->second;
        }
    }

    // Only EV_* names fall through to the process environment
    if (key.compare(0, 3, "EV_") != 0) {
        return std::nullopt;
    }
    const char* env = std::getenv(key.c_str());
    if (env) {
        return std::string(env);
    }
    return std::nullopt;
}

bool ConfigManager::has(const std::string& key) const {
    return find(key).has_value();
}

void ConfigManager::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_[key] = value;
}

void ConfigManager::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.clear();
}

void ConfigManager::loadFromEnvironment() {
    static const char* const keys[] = {
        EV_WORKERS, EV_MX_WORKERS, EV_PREMIUM, EV_LAYOUT,
        EV_DNS_TIMEOUT, EV_SMTP_TIMEOUT, EV_SMTP_DEEP_TIMEOUT, EV_SMTP_PORT,
        EV_HELO_DOMAIN, EV_MAIL_FROM, EV_DISPOSABLE_FILE,
        EV_CACHE_ENABLED, EV_CACHE_TYPE, EV_CACHE_PATH, EV_CACHE_TTL_DAYS,
        EV_CACHE_PG_HOST, EV_CACHE_PG_PORT, EV_CACHE_PG_DB, EV_CACHE_PG_USER,
        EV_CACHE_PG_PASSWORD,
        EV_CONFIG_FILE, EV_API_PORT, EV_API_THREADS, EV_API_UPLOAD_DIR, EV_API_OUTPUT_DIR,
        EV_LOG_LEVEL, EV_LOG_FILE
    };

    size_t loaded = 0;
    for (const char* key : keys) {
        if (const char* env = std::getenv(key)) {
            set(key, env);
            loaded++;
        }
    }

    spdlog::debug("Configuration loaded from environment ({} keys)", loaded);
}

void ConfigManager::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigException("cannot open config file: " + path);
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, in, &root, &errors)) {
        throw ConfigException("invalid JSON in " + path + ": " + errors);
    }
    if (!root.isObject()) {
        throw ConfigException("config root must be a JSON object: " + path);
    }

    flatten("", root);
    spdlog::info("Configuration loaded from file: {}", path);
}

void ConfigManager::flatten(const std::string& prefix, const Json::Value& node) {
    for (const auto& name : node.getMemberNames()) {
        const Json::Value& child = node[name];
        std::string key = prefix.empty() ? name : prefix + "." + name;

        if (child.isObject()) {
            flatten(key, child);
        } else if (child.isArray()) {
            std::string joined;
            for (Json::ArrayIndex i = 0; i < child.size(); i++) {
                if (i > 0) joined += ",";
                joined += child[i].asString();
            }
            set(key, joined);
        } else if (child.isBool()) {
            set(key, child.asBool() ? "true" : "false");
        } else if (!child.isNull()) {
            set(key, child.asString());
        }
    }
}

std::string ConfigManager::getEnv(const std::string& key, const std::string& defaultValue) {
    const char* env = std::getenv(key.c_str());
    return env ? std::string(env) : defaultValue;
}

} // namespace common
