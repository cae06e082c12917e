#pragma once

/**
 * @file cli_options.h
 * @brief Command-line parsing for the email-verifier executable
 *
 * Flags accept both "--flag value" and "--flag=value".
 */

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

struct AppConfig;

namespace cli {

constexpr const char* VERSION = "1.0.0";

struct CliOptions {
    std::string input;
    std::string output;
    std::optional<int> workers;
    bool premium = false;
    std::string configFile;
    std::string cacheDb;
    bool noCache = false;
    std::string layout;
    std::string logLevel;
    bool help = false;
    bool version = false;
};

/**
 * @brief Malformed command line (exit code 2)
 */
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Parse argv
 *
 * --input and --output are required unless --help or --version is given.
 *
 * @throws UsageError on unknown flags, missing values or invalid numbers
 */
CliOptions parseCommandLine(int argc, const char* const argv[]);

/**
 * @brief Apply flags on top of environment and config file values
 */
void applyOverrides(const CliOptions& options, AppConfig& config);

/**
 * @brief Confirm the input path exists before anything else is printed
 *
 * Writes "[ERROR] Input path not found: <path>" to err when it does not.
 */
bool checkInputExists(const CliOptions& options, std::ostream& err);

std::string usage(const std::string& program);

} // namespace cli
