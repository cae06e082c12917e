/**
 * @file verifier_api.cpp
 * @brief Upload, progress and download request handling
 */

#include "verifier_api.h"
#include "job_manager.h"

#include <everify/utils/file_utils.h>
#include <everify/utils/hash_utils.h>
#include <everify/utils/string_utils.h>
#include <everify/utils/time_utils.h>

#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace api {

ApiResponse ApiResponse::json(Json::Value body) {
    ApiResponse response;
    response.body = std::move(body);
    return response;
}

ApiResponse ApiResponse::error(int status, const std::string& message) {
    ApiResponse response;
    response.status = status;
    response.body["error"] = message;
    return response;
}

VerifierApi::VerifierApi(JobManager* jobManager,
                         std::string uploadDir,
                         std::function<Json::Value()> checkCache)
    : jobManager_(jobManager),
      uploadDir_(std::move(uploadDir)),
      checkCache_(std::move(checkCache))
{
    if (!jobManager_) {
        throw std::invalid_argument("VerifierApi: jobManager cannot be nullptr");
    }
}

ApiResponse VerifierApi::root() const {
    Json::Value result;
    result["message"] = "Email Verifier API is running";
    result["endpoints"].append("POST /upload?premium=true|false");
    result["endpoints"].append("GET /progress/{job_id}");
    result["endpoints"].append("GET /download/{job_id}");
    return ApiResponse::json(result);
}

ApiResponse VerifierApi::health() const {
    Json::Value result;
    result["status"] = "UP";
    result["service"] = "email-verifier-api";
    result["version"] = "1.0.0";
    result["timestamp"] = everify::utils::formatIso8601(everify::utils::now());
    if (checkCache_) {
        result["cache"] = checkCache_();
    }
    return ApiResponse::json(result);
}

ApiResponse VerifierApi::upload(const std::string& premiumParam, const std::vector<UploadedFile>& files) {
    bool premium = false;
    if (!premiumParam.empty() && !everify::utils::parseBool(premiumParam, premium)) {
        return ApiResponse::error(400, "premium must be true or false");
    }
    if (files.empty() || files.front().fileName.empty()) {
        return ApiResponse::error(400, "No file uploaded");
    }
    const UploadedFile& file = files.front();

    std::string safeName;
    try {
        safeName = everify::utils::sanitizeFilename(file.fileName);
    } catch (const std::exception& e) {
        spdlog::warn("[VerifierApi] Rejected file name '{}': {}", file.fileName, e.what());
        return ApiResponse::error(400, "Invalid file name");
    }

    try {
        std::string jobId = JobManager::generateJobId();
        fs::path jobUploadDir = fs::path(uploadDir_) / jobId;
        fs::create_directories(jobUploadDir);
        fs::create_directories(jobManager_->jobOutputDir(jobId));

        std::string inputPath = (jobUploadDir / safeName).string();
        everify::utils::writeFileContent(inputPath, file.content);
        std::string fileHash = everify::utils::sha256Hex(file.content);

        spdlog::info("[VerifierApi] Upload {} ({} bytes, sha256 {}) -> job {}",
                     safeName, file.content.size(), fileHash, jobId);

        jobManager_->start(jobId, inputPath, premium);

        Json::Value result;
        result["job_id"] = jobId;
        result["status"] = "started";
        result["file_hash"] = fileHash;
        return ApiResponse::json(result);
    } catch (const std::exception& e) {
        spdlog::error("[VerifierApi] Upload failed: {}", e.what());
        return ApiResponse::error(500, "Internal server error");
    }
}

ApiResponse VerifierApi::progress(const std::string& jobId) const {
    auto status = jobManager_->getStatus(jobId);
    if (!status) {
        return ApiResponse::error(404, "Job not found");
    }
    return ApiResponse::json(status->toJson());
}

ApiResponse VerifierApi::download(const std::string& jobId) const {
    std::error_code ec;
    if (!JobManager::isValidJobId(jobId) || !fs::is_directory(jobManager_->jobOutputDir(jobId), ec)) {
        return ApiResponse::error(404, "Job not found");
    }

    auto report = jobManager_->findReport(jobId);
    if (!report) {
        return ApiResponse::error(404, "No result file found");
    }

    ApiResponse response;
    response.file = *report;
    return response;
}

} // namespace api
