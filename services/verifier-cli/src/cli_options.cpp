/**
 * @file cli_options.cpp
 * @brief Command-line parsing implementation
 */

#include "cli_options.h"
#include "infrastructure/app_config.h"
#include "logging/logger.h"
#include "services/report_writer.h"

#include <filesystem>
#include <sstream>

namespace cli {

namespace {

int parseWorkers(const std::string& value) {
    size_t pos = 0;
    int n = 0;
    try {
        n = std::stoi(value, &pos);
    } catch (const std::exception&) {
        throw UsageError("--workers expects a number, got '" + value + "'");
    }
    if (pos != value.size()) {
        throw UsageError("--workers expects a number, got '" + value + "'");
    }
    if (n <= 0) {
        throw UsageError("--workers must be greater than 0");
    }
    return n;
}

} // anonymous namespace

CliOptions parseCommandLine(int argc, const char* const argv[]) {
    CliOptions options;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        std::string inlineValue;
        bool hasInlineValue = false;

        if (arg.rfind("--", 0) == 0) {
            size_t eq = arg.find('=');
            if (eq != std::string::npos) {
                inlineValue = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
                hasInlineValue = true;
            }
        }

        auto takeValue = [&]() -> std::string {
            if (hasInlineValue) {
                return inlineValue;
            }
            if (i + 1 >= argc) {
                throw UsageError(arg + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--input" || arg == "-i") {
            options.input = takeValue();
        } else if (arg == "--output" || arg == "-o") {
            options.output = takeValue();
        } else if (arg == "--workers" || arg == "-w") {
            options.workers = parseWorkers(takeValue());
        } else if (arg == "--premium") {
            options.premium = true;
        } else if (arg == "--config") {
            options.configFile = takeValue();
        } else if (arg == "--cache-db") {
            options.cacheDb = takeValue();
        } else if (arg == "--no-cache") {
            options.noCache = true;
        } else if (arg == "--layout") {
            options.layout = takeValue();
            if (!services::parseReportLayout(options.layout)) {
                throw UsageError("--layout must be 'combined' or 'per-file'");
            }
        } else if (arg == "--log-level") {
            options.logLevel = takeValue();
            if (!common::Logger::isValidLevel(options.logLevel)) {
                throw UsageError("unknown log level '" + options.logLevel + "'");
            }
        } else if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--version") {
            options.version = true;
        } else {
            throw UsageError("unknown argument '" + arg + "'");
        }
    }

    if (options.help || options.version) {
        return options;
    }
    if (options.input.empty()) {
        throw UsageError("--input is required");
    }
    if (options.output.empty()) {
        throw UsageError("--output is required");
    }
    return options;
}

void applyOverrides(const CliOptions& options, AppConfig& config) {
    if (options.workers) config.workers = *options.workers;
    if (options.premium) config.premium = true;
    if (!options.cacheDb.empty()) {
        config.cachePath = options.cacheDb;
        config.cacheEnabled = true;
    }
    if (options.noCache) config.cacheEnabled = false;
    if (!options.layout.empty()) config.layout = options.layout;
    if (!options.logLevel.empty()) config.logLevel = options.logLevel;
}

bool checkInputExists(const CliOptions& options, std::ostream& err) {
    std::error_code ec;
    if (std::filesystem::exists(options.input, ec)) {
        return true;
    }
    err << "[ERROR] Input path not found: " << options.input << std::endl;
    return false;
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " --input PATH --output DIR [options]\n"
        << "\n"
        << "  -i, --input PATH      Input file or folder (.txt, .text, .csv)\n"
        << "  -o, --output DIR      Output folder for the CSV report\n"
        << "  -w, --workers N       Parallel verification workers (default: 50)\n"
        << "      --premium         Deep check: probe mailboxes over SMTP\n"
        << "      --config FILE     JSON configuration file\n"
        << "      --cache-db PATH   SQLite cache file (default: email_cache_v3.db)\n"
        << "      --no-cache        Do not read or write the verification cache\n"
        << "      --layout L        combined (default) or per-file\n"
        << "      --log-level L     trace, debug, info, warn, error, critical, off\n"
        << "  -h, --help            Show this help\n"
        << "      --version         Show version\n"
        << "\n"
        << "Exit codes: 0 success, 1 input/configuration/runtime failure, 2 usage error\n";
    return out.str();
}

} // namespace cli
