/**
 * @file verification_service.cpp
 * @brief Verification run orchestration implementation
 *
 * @date 2026-10-06
 */

#include "verification_service.h"
#include "input_collector.h"
#include "exception/exceptions.h"

#include <everify/verification/email_classifier.h>
#include <everify/verification/email_extractor.h>
#include <everify/verification/mx_resolver.h>
#include <everify/verification/syntax_validator.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <filesystem>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

using namespace everify::verification;

namespace services {

VerificationService::VerificationService(
    IMxProvider* mxResolver,
    ISmtpProber* smtpProber,
    IResultCache* cache,
    const DomainPolicy* policy,
    VerificationServiceOptions options)
    : mxResolver_(mxResolver)
    , smtpProber_(smtpProber)
    , cache_(cache)
    , policy_(policy)
    , options_(options)
{
    if (!mxResolver_) {
        throw std::invalid_argument("VerificationService: mxResolver cannot be nullptr");
    }
    if (!policy_) {
        throw std::invalid_argument("VerificationService: policy cannot be nullptr");
    }
}

VerificationSummary VerificationService::run(const VerificationRequest& request) {
    auto startTime = std::chrono::steady_clock::now();

    if (request.workers <= 0) {
        throw common::ConfigException("workers must be a positive number, got " +
                                      std::to_string(request.workers));
    }
    if (request.deep && !smtpProber_) {
        throw common::ConfigException("deep verification requested but SMTP probing is not configured");
    }

    spdlog::info("[VerificationService] Run started: input={}, output={}, workers={}, mode={}",
                 request.inputPath, request.outputDir, request.workers,
                 request.deep ? "deep" : "standard");

    // Step 1: Input files
    std::vector<InputFile> files = InputCollector::collect(request.inputPath);

    // Step 2: Output directory
    std::error_code ec;
    fs::create_directories(request.outputDir, ec);
    if (ec || !fs::is_directory(request.outputDir, ec)) {
        throw common::ReportException("cannot create output directory " + request.outputDir +
                                      (ec ? ": " + ec.message() : ""));
    }

    // Step 3: Extraction with cross-file deduplication
    std::vector<std::string> names;
    std::vector<std::string> contents;
    names.reserve(files.size());
    contents.reserve(files.size());
    for (const auto& file : files) {
        names.push_back(file.name);
        contents.push_back(InputCollector::readFile(file));
    }
    auto addresses = collectAddresses(names, contents);
    contents.clear();

    spdlog::info("[VerificationService] {} unique address(es) in {} file(s)",
                 addresses.size(), files.size());

    // Step 4: MX resolution of unique domains
    std::vector<std::string> domains = domainsToResolve(addresses);
    MxTable mxTable = resolveAll(*mxResolver_, domains, options_.mxWorkers);
    spdlog::info("[VerificationService] MX resolved for {}/{} domain(s)",
                 mxTable.resolvedCount(), mxTable.size());

    // Step 5: Parallel classification
    EmailClassifier classifier(&mxTable, request.deep ? smtpProber_ : nullptr,
                               cache_, policy_, ClassifierOptions{request.deep});

    const size_t total = addresses.size();
    std::vector<VerificationResult> results(total);
    std::atomic<size_t> next{0};
    std::atomic<size_t> done{0};
    std::atomic<bool> failed{false};
    std::exception_ptr firstError;
    std::mutex progressMutex;
    std::mutex errorMutex;

    auto worker = [&]() {
        size_t i;
        while (!failed.load() && (i = next.fetch_add(1)) < total) {
            try {
                results[i] = classifier.classify(addresses[i].first, addresses[i].second);
            } catch (const std::exception& e) {
                spdlog::error("[VerificationService] Classification of {} failed: {}",
                              addresses[i].first, e.what());
                std::lock_guard<std::mutex> lock(errorMutex);
                if (!firstError) {
                    firstError = std::current_exception();
                }
                failed = true;
                return;
            }

            size_t finished = ++done;
            if (request.onProgress) {
                std::lock_guard<std::mutex> lock(progressMutex);
                request.onProgress(finished, total);
            }
        }
    };

    size_t threadCount = std::min(static_cast<size_t>(request.workers), total);
    std::vector<std::thread> threads;
    threads.reserve(threadCount);
    for (size_t t = 0; t < threadCount; t++) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) {
        t.join();
    }

    if (firstError) {
        std::rethrow_exception(firstError);
    }

    // Step 6: Report
    std::sort(results.begin(), results.end(),
              [](const VerificationResult& a, const VerificationResult& b) { return a.email < b.email; });

    ReportWriter writer(request.outputDir);

    VerificationSummary summary;
    summary.reportPaths = writer.write(results, request.layout, names);
    summary.filesScanned = files.size();
    summary.totalEmails = total;
    summary.domainsResolved = mxTable.resolvedCount();
    summary.deep = request.deep;

    for (const auto& r : results) {
        switch (r.verdict) {
            case Verdict::GOOD:  summary.good++; break;
            case Verdict::RISKY: summary.risky++; break;
            case Verdict::BAD:   summary.bad++; break;
        }
        if (r.fromCache) summary.cacheHits++;
    }
    summary.results = std::move(results);
    summary.durationSec = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - startTime).count();

    spdlog::info("[VerificationService] Run finished: total={}, good={}, risky={}, bad={}, "
                 "cache_hits={}, duration={:.2f}s",
                 summary.totalEmails, summary.good, summary.risky, summary.bad,
                 summary.cacheHits, summary.durationSec);

    return summary;
}

std::vector<std::pair<std::string, std::string>> VerificationService::collectAddresses(
    const std::vector<std::string>& names,
    const std::vector<std::string>& contents)
{
    std::vector<std::pair<std::string, std::string>> addresses;
    std::unordered_set<std::string> seen;

    for (size_t f = 0; f < contents.size() && f < names.size(); f++) {
        size_t found = 0;
        for (auto& email : extractEmails(contents[f])) {
            found++;
            if (seen.insert(email).second) {
                addresses.emplace_back(std::move(email), names[f]);
            }
        }
        spdlog::debug("[VerificationService] {}: {} address(es)", names[f], found);
    }
    return addresses;
}

std::vector<std::string> VerificationService::domainsToResolve(
    const std::vector<std::pair<std::string, std::string>>& addresses) const
{
    std::set<std::string> domains;
    for (const auto& entry : addresses) {
        SyntaxCheckResult syntax = SyntaxValidator::validate(entry.first);
        if (!syntax.valid || policy_->isDisposable(syntax.domain)) {
            continue;
        }
        domains.insert(syntax.domain);
    }
    return std::vector<std::string>(domains.begin(), domains.end());
}

} // namespace services
