#pragma once

/**
 * @file verification_service.h
 * @brief Verification run orchestration
 *
 * Pipeline: collect input files -> extract and deduplicate addresses ->
 * resolve MX of unique domains in parallel -> classify in parallel ->
 * write the CSV report.
 *
 * @date 2026-10-06
 */

#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <everify/verification/domain_policy.h>
#include <everify/verification/providers.h>
#include <everify/verification/types.h>
#include "report_writer.h"

namespace services {

/// @brief Called after each classification with (done, total)
using ProgressCallback = std::function<void(size_t done, size_t total)>;

struct VerificationRequest {
    std::string inputPath;      ///< File or directory
    std::string outputDir;      ///< Created if missing
    int workers = 50;           ///< Classification threads (must be > 0)
    bool deep = false;          ///< SMTP probing (premium)
    ReportLayout layout = ReportLayout::COMBINED;
    ProgressCallback onProgress;
};

struct VerificationSummary {
    size_t filesScanned = 0;
    size_t totalEmails = 0;
    size_t good = 0;
    size_t risky = 0;
    size_t bad = 0;
    size_t cacheHits = 0;
    size_t domainsResolved = 0;
    double durationSec = 0.0;
    bool deep = false;
    std::vector<std::string> reportPaths;
    std::vector<everify::verification::VerificationResult> results;  ///< Sorted by email
};

struct VerificationServiceOptions {
    int mxWorkers = 20;     ///< Upper bound on parallel MX lookups
};

/**
 * @brief Runs one verification over an input file or folder
 *
 * Providers are non-owning. The SMTP prober may be nullptr, in which case
 * deep requests are refused.
 */
class VerificationService {
public:
    /**
     * @throws std::invalid_argument if mxResolver or policy is nullptr
     */
    VerificationService(
        everify::verification::IMxProvider* mxResolver,
        everify::verification::ISmtpProber* smtpProber,
        everify::verification::IResultCache* cache,
        const everify::verification::DomainPolicy* policy,
        VerificationServiceOptions options = {});

    /**
     * @brief Execute a verification run
     * @throws common::ConfigException if workers <= 0 or deep is requested without a prober
     * @throws common::InputException if the input path is missing or unreadable
     * @throws common::ReportException if the output directory or report cannot be written
     */
    VerificationSummary run(const VerificationRequest& request);

    /**
     * @brief Extract addresses from all files, first file wins on duplicates
     * @return (email, sourceFile) pairs in first-seen order
     */
    static std::vector<std::pair<std::string, std::string>> collectAddresses(
        const std::vector<std::string>& names,
        const std::vector<std::string>& contents);

private:
    everify::verification::IMxProvider* mxResolver_;
    everify::verification::ISmtpProber* smtpProber_;
    everify::verification::IResultCache* cache_;
    const everify::verification::DomainPolicy* policy_;
    VerificationServiceOptions options_;

    std::vector<std::string> domainsToResolve(
        const std::vector<std::pair<std::string, std::string>>& addresses) const;
};

} // namespace services
