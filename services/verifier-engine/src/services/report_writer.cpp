/**
 * @file report_writer.cpp
 * @brief CSV report output implementation
 */

#include "report_writer.h"
#include "exception/exceptions.h"
#include <everify/utils/csv_utils.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

using everify::verification::VerificationResult;

namespace services {

std::string reportLayoutToString(ReportLayout layout) {
    switch (layout) {
        case ReportLayout::COMBINED: return "combined";
        case ReportLayout::PER_FILE: return "per-file";
    }
    return "combined";
}

std::optional<ReportLayout> parseReportLayout(const std::string& value) {
    if (value == "combined") return ReportLayout::COMBINED;
    if (value == "per-file" || value == "per_file") return ReportLayout::PER_FILE;
    return std::nullopt;
}

namespace {

std::vector<const VerificationResult*> sortedByEmail(const std::vector<VerificationResult>& results) {
    std::vector<const VerificationResult*> sorted;
    sorted.reserve(results.size());
    for (const auto& r : results) {
        sorted.push_back(&r);
    }
    std::sort(sorted.begin(), sorted.end(),
              [](const VerificationResult* a, const VerificationResult* b) { return a->email < b->email; });
    return sorted;
}

std::ofstream openReport(const std::string& path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw common::ReportException("cannot create " + path);
    }
    return out;
}

void closeReport(std::ofstream& out, const std::string& path) {
    out.close();
    if (!out) {
        throw common::ReportException("write failed for " + path);
    }
}

} // anonymous namespace

ReportWriter::ReportWriter(std::string outputDir) : outputDir_(std::move(outputDir)) {}

std::vector<std::string> ReportWriter::write(
    const std::vector<VerificationResult>& results,
    ReportLayout layout,
    const std::vector<std::string>& inputNames)
{
    if (layout == ReportLayout::PER_FILE) {
        return writePerFile(results, inputNames);
    }
    return { writeCombined(results) };
}

std::string ReportWriter::writeCombined(const std::vector<VerificationResult>& results) {
    std::string path = pathFor(COMBINED_FILENAME);
    std::error_code ec;
    if (fs::exists(path, ec)) {
        spdlog::info("[ReportWriter] {} exists, writing {}", COMBINED_FILENAME, COMBINED_FALLBACK_FILENAME);
        path = pathFor(COMBINED_FALLBACK_FILENAME);
    }

    std::ofstream out = openReport(path);
    everify::utils::writeCsvRow(out, {"email", "verdict", "reason", "active_status"});
    for (const VerificationResult* r : sortedByEmail(results)) {
        everify::utils::writeCsvRow(out, {
            r->email,
            everify::verification::verdictToString(r->verdict),
            everify::verification::reasonToString(r->reason),
            everify::verification::activeStatusToString(r->activeStatus)
        });
    }
    closeReport(out, path);

    spdlog::info("[ReportWriter] Wrote {} rows to {}", results.size(), path);
    return path;
}

std::vector<std::string> ReportWriter::writePerFile(
    const std::vector<VerificationResult>& results,
    const std::vector<std::string>& inputNames)
{
    std::map<std::string, std::vector<const VerificationResult*>> bySource;
    for (const auto& name : inputNames) {
        bySource[name];
    }
    for (const VerificationResult* r : sortedByEmail(results)) {
        bySource[r->sourceFile].push_back(r);
    }

    std::vector<std::string> paths;
    for (const auto& [source, rows] : bySource) {
        std::string path = pathFor(perFileReportName(source));
        std::ofstream out = openReport(path);
        everify::utils::writeCsvRow(out, {"filename", "email", "verdict", "active_status", "reason"});
        for (const VerificationResult* r : rows) {
            everify::utils::writeCsvRow(out, {
                source,
                r->email,
                everify::verification::verdictToString(r->verdict),
                everify::verification::activeStatusToString(r->activeStatus),
                everify::verification::reasonToString(r->reason)
            });
        }
        closeReport(out, path);
        spdlog::debug("[ReportWriter] Wrote {} rows to {}", rows.size(), path);
        paths.push_back(path);
    }

    spdlog::info("[ReportWriter] Wrote {} per-file report(s) to {}", paths.size(), outputDir_);
    return paths;
}

std::string ReportWriter::perFileReportName(const std::string& inputName) {
    std::string base = fs::path(inputName).filename().string();
    if (base.empty()) {
        base = "input";
    }
    return base + PER_FILE_SUFFIX;
}

std::string ReportWriter::pathFor(const std::string& filename) const {
    return (fs::path(outputDir_) / filename).string();
}

} // namespace services
