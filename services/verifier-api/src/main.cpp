/**
 * @file main.cpp
 * @brief email-verifier-api HTTP service entry point
 *
 * Accepts list uploads, runs verification jobs in the background and
 * serves progress and reports.
 *
 * @date 2026-10-09
 */

#include <drogon/drogon.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "config/config_manager.h"
#include "exception/exceptions.h"
#include "handlers/verifier_handler.h"
#include "infrastructure/app_config.h"
#include "infrastructure/service_container.h"
#include "job_manager.h"
#include "logging/logger.h"
#include "verifier_api.h"
#include "repositories/verification_cache_repository.h"

namespace {

void printBanner() {
    std::cout << R"(
  _____                 _ _  __     __        _  __ _
 | ____|_ __ ___   __ _(_) | \ \   / /__ _ __(_)/ _(_) ___ _ __
 |  _| | '_ ` _ \ / _` | | |  \ \ / / _ \ '__| | |_| |/ _ \ '__|
 | |___| | | | | | (_| | | |   \ V /  __/ |  | |  _| |  __/ |
 |_____|_| |_| |_|\__,_|_|_|    \_/ \___|_|  |_|_| |_|\___|_|
)" << std::endl;
    std::cout << "  Email Verifier API Service v1.0.0" << std::endl;
    std::cout << std::endl;
}

Json::Value checkCache(infrastructure::ServiceContainer& container) {
    Json::Value result;
    if (!container.cacheAvailable()) {
        result["status"] = "DISABLED";
        return result;
    }
    try {
        result["status"] = "UP";
        result["entries"] = static_cast<Json::Int64>(container.cacheRepository()->count());
    } catch (const std::exception& e) {
        spdlog::warn("[Health] Cache check failed: {}", e.what());
        result["status"] = "DOWN";
    }
    return result;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    printBanner();

    AppConfig config;
    try {
        config = AppConfig::fromEnvironment();
        std::string configFile = argc > 1
            ? argv[1]
            : common::ConfigManager::getEnv(common::ConfigManager::EV_CONFIG_FILE);
        if (!configFile.empty()) {
            config.applyConfigFile(configFile);
        }
        config.validate();
    } catch (const common::ConfigException& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    common::Logger::initialize("email-verifier-api", config.logLevel,
                               !config.logFile.empty(), config.logFile);

    spdlog::info("Starting Email Verifier API...");
    spdlog::info("Uploads: {}, Output: {}", config.apiUploadDir, config.apiOutputDir);

    std::error_code ec;
    std::filesystem::create_directories(config.apiUploadDir, ec);
    std::filesystem::create_directories(config.apiOutputDir, ec);
    if (ec) {
        spdlog::critical("Cannot create working directories: {}", ec.message());
        return 1;
    }

    infrastructure::ServiceContainer container;
    if (!container.initialize(config)) {
        spdlog::critical("Failed to initialize services");
        return 1;
    }

    try {
        api::JobManager jobManager(container.verificationService(), config.apiOutputDir);

        api::VerifierApi verifierApi(
            &jobManager,
            config.apiUploadDir,
            [&container]() { return checkCache(container); });
        handlers::VerifierHandler verifierHandler(&verifierApi);

        auto& app = drogon::app();

        app.setLogLevel(trantor::Logger::kInfo)
           .addListener("0.0.0.0", static_cast<uint16_t>(config.apiPort))
           .setThreadNum(static_cast<size_t>(config.apiThreads))
           .setClientMaxBodySize(100 * 1024 * 1024)  // 100MB max upload
           .setUploadPath(config.apiUploadDir);

        // CORS on every response
        app.registerPreSendingAdvice([](const drogon::HttpRequestPtr& /* req */,
                                         const drogon::HttpResponsePtr& resp) {
            resp->addHeader("Access-Control-Allow-Origin", "*");
            resp->addHeader("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            resp->addHeader("Access-Control-Allow-Headers", "*");
        });

        // CORS preflight
        app.registerHandler(
            "/{path}",
            [](const drogon::HttpRequestPtr& /* req */,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback,
               const std::string& /* path */) {
                auto resp = drogon::HttpResponse::newHttpResponse();
                resp->setStatusCode(drogon::k204NoContent);
                callback(resp);
            },
            {drogon::Options}
        );

        verifierHandler.registerRoutes(app);

        spdlog::info("Server starting on http://0.0.0.0:{}", config.apiPort);
        app.run();

        spdlog::info("Server stopped, waiting for running jobs");
        jobManager.waitAll();
    } catch (const std::exception& e) {
        spdlog::error("Application error: {}", e.what());
        common::Logger::flush();
        return 1;
    }

    common::Logger::flush();
    return 0;
}
