/**
 * @file main.cpp
 * @brief email-verifier command-line entry point
 *
 * Usage: email-verifier --input <file|folder> --output <folder> [--premium]
 *
 * @date 2026-10-07
 */

#include "cli_options.h"
#include "config/config_manager.h"
#include "exception/exceptions.h"
#include "infrastructure/app_config.h"
#include "infrastructure/service_container.h"
#include "logging/logger.h"
#include "services/verification_service.h"

#include <iomanip>
#include <iostream>
#include <spdlog/spdlog.h>

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_RUN = 1;
constexpr int EXIT_USAGE = 2;

void printBanner(const AppConfig& config, const cli::CliOptions& options) {
    std::cout << "=================================================\n"
              << "  Email Verifier v" << cli::VERSION << "\n"
              << "=================================================\n"
              << "Input   : " << options.input << "\n"
              << "Output  : " << options.output << "\n"
              << "Mode    : " << (config.premium ? "Premium (syntax + MX + SMTP)" : "Standard (syntax + MX)") << "\n"
              << "Workers : " << config.workers << "\n"
              << "Cache   : " << (config.cacheEnabled ? config.cacheType + " (" + config.cachePath + ")" : "disabled") << "\n"
              << std::endl;
}

/// @brief Progress line, printed at most every 1% plus the final count
services::ProgressCallback makeProgressPrinter() {
    return [lastPercent = -1](size_t done, size_t total) mutable {
        int percent = total == 0 ? 100 : static_cast<int>(done * 100 / total);
        if (percent == lastPercent && done != total) {
            return;
        }
        lastPercent = percent;
        std::cout << "\rProgress: " << done << "/" << total << " (" << percent << "%)" << std::flush;
        if (done == total) {
            std::cout << std::endl;
        }
    };
}

void printSummary(const services::VerificationSummary& summary) {
    std::cout << "Verified " << summary.totalEmails << " address(es) from "
              << summary.filesScanned << " file(s): "
              << summary.good << " good, " << summary.risky << " risky, " << summary.bad << " bad"
              << " (" << summary.cacheHits << " from cache) in "
              << std::fixed << std::setprecision(1) << summary.durationSec << "s\n";
    for (const auto& path : summary.reportPaths) {
        std::cout << "Report  : " << path << "\n";
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // Step 1: Command line
    cli::CliOptions options;
    try {
        options = cli::parseCommandLine(argc, argv);
    } catch (const cli::UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << cli::usage(argv[0]);
        return EXIT_USAGE;
    }

    if (options.help) {
        std::cout << cli::usage(argv[0]);
        return EXIT_OK;
    }
    if (options.version) {
        std::cout << "email-verifier " << cli::VERSION << std::endl;
        return EXIT_OK;
    }
    if (!cli::checkInputExists(options, std::cerr)) {
        return EXIT_FAILURE_RUN;
    }

    // Step 2: Configuration (defaults -> environment -> config file -> flags)
    AppConfig config;
    try {
        config = AppConfig::fromEnvironment();
        std::string configFile = options.configFile.empty()
            ? common::ConfigManager::getEnv(common::ConfigManager::EV_CONFIG_FILE)
            : options.configFile;
        if (!configFile.empty()) {
            config.applyConfigFile(configFile);
        }
        cli::applyOverrides(options, config);
        config.validate();
    } catch (const common::ConfigException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE_RUN;
    }

    common::Logger::initialize("email-verifier", config.logLevel, !config.logFile.empty(), config.logFile);

    printBanner(config, options);

    // Step 3: Services
    infrastructure::ServiceContainer container;
    if (!container.initialize(config)) {
        std::cerr << "Error: initialization failed (see log)" << std::endl;
        return EXIT_FAILURE_RUN;
    }

    // Step 4: Run
    services::VerificationRequest request;
    request.inputPath = options.input;
    request.outputDir = options.output;
    request.workers = config.workers;
    request.deep = config.premium;
    request.layout = services::parseReportLayout(config.layout).value_or(services::ReportLayout::COMBINED);
    request.onProgress = makeProgressPrinter();

    try {
        services::VerificationSummary summary = container.verificationService()->run(request);
        printSummary(summary);
    } catch (const common::VerifierException& e) {
        spdlog::error("Verification failed: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        common::Logger::flush();
        return EXIT_FAILURE_RUN;
    } catch (const std::exception& e) {
        spdlog::critical("Unexpected error: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        common::Logger::flush();
        return EXIT_FAILURE_RUN;
    }

    common::Logger::flush();
    return EXIT_OK;
}
