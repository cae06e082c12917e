#pragma once

/**
 * @file report_writer.h
 * @brief CSV report output (combined or per input file)
 *
 * Rows are sorted by email. Fields are quoted per RFC 4180.
 */

#include <optional>
#include <string>
#include <vector>
#include <everify/verification/types.h>

namespace services {

enum class ReportLayout {
    COMBINED,   ///< verified_results.csv
    PER_FILE    ///< <input basename>.emails.csv
};

std::string reportLayoutToString(ReportLayout layout);

/**
 * @brief Parse "combined" or "per-file"
 */
std::optional<ReportLayout> parseReportLayout(const std::string& value);

class ReportWriter {
public:
    static constexpr const char* COMBINED_FILENAME = "verified_results.csv";
    static constexpr const char* COMBINED_FALLBACK_FILENAME = "verified_results_new.csv";
    static constexpr const char* PER_FILE_SUFFIX = ".emails.csv";

    /**
     * @param outputDir Existing output directory
     */
    explicit ReportWriter(std::string outputDir);

    /**
     * @brief Write reports in the given layout
     * @param results Classification results (any order)
     * @param inputNames Input file basenames (per-file layout writes one report each)
     * @return Paths of the written reports
     * @throws common::ReportException on I/O failure
     */
    std::vector<std::string> write(
        const std::vector<everify::verification::VerificationResult>& results,
        ReportLayout layout,
        const std::vector<std::string>& inputNames);

    /**
     * @brief Header email,verdict,reason,active_status
     *
     * Goes to verified_results.csv, or verified_results_new.csv (overwritten)
     * when the former already exists.
     */
    std::string writeCombined(const std::vector<everify::verification::VerificationResult>& results);

    /**
     * @brief Header filename,email,verdict,active_status,reason; one file per input
     */
    std::vector<std::string> writePerFile(
        const std::vector<everify::verification::VerificationResult>& results,
        const std::vector<std::string>& inputNames);

    static std::string perFileReportName(const std::string& inputName);

private:
    std::string outputDir_;

    std::string pathFor(const std::string& filename) const;
};

} // namespace services
