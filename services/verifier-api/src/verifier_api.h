#pragma once

/**
 * @file verifier_api.h
 * @brief Request handling behind the HTTP routes, independent of the web framework
 *
 * Each operation returns the HTTP status and JSON body to send. Error
 * bodies have the form {"error": "<message>"}.
 *
 * @date 2026-10-18
 */

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

namespace api {

class JobManager;

struct ApiResponse {
    int status = 200;
    Json::Value body;
    /// Set when the response is a file download instead of a JSON body
    std::optional<std::filesystem::path> file;

    static ApiResponse json(Json::Value body);
    static ApiResponse error(int status, const std::string& message);
};

struct UploadedFile {
    std::string fileName;
    std::string content;
};

class VerifierApi {
public:
    /**
     * @param jobManager Job manager (non-owning pointer)
     * @param uploadDir Root folder for uploaded files
     * @param checkCache Function returning cache health, may be empty
     * @throws std::invalid_argument if jobManager is nullptr
     */
    VerifierApi(JobManager* jobManager,
                std::string uploadDir,
                std::function<Json::Value()> checkCache = nullptr);

    ApiResponse root() const;
    ApiResponse health() const;

    /**
     * @brief Save the first file under <uploadDir>/<job_id>/ and start a job
     * @param premiumParam Raw "premium" query value; empty means standard mode
     * @param files Files from the multipart body
     */
    ApiResponse upload(const std::string& premiumParam, const std::vector<UploadedFile>& files);

    ApiResponse progress(const std::string& jobId) const;

    /// @brief Locate the job's report; 404 when the job folder or the report is missing
    ApiResponse download(const std::string& jobId) const;

private:
    JobManager* jobManager_;
    std::string uploadDir_;
    std::function<Json::Value()> checkCache_;
};

} // namespace api
