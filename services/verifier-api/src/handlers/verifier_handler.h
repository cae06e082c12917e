#pragma once

#include <drogon/HttpAppFramework.h>
#include <functional>
#include <string>

namespace api {
class VerifierApi;
}

namespace handlers {

/**
 * @brief Email verification endpoints
 *
 * - GET /                      - Welcome message
 * - GET /api/health            - Service health check
 * - POST /upload?premium=bool  - Upload a list and start a job
 * - GET /progress/{job_id}     - Job progress
 * - GET /download/{job_id}     - Job report (CSV)
 *
 * Request decoding only; the work is done by api::VerifierApi.
 */
class VerifierHandler {
public:
    /**
     * @param verifierApi Request logic (non-owning pointer)
     * @throws std::invalid_argument if verifierApi is nullptr
     */
    explicit VerifierHandler(api::VerifierApi* verifierApi);

    void registerRoutes(drogon::HttpAppFramework& app);

private:
    api::VerifierApi* api_;

    void handleRoot(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    void handleHealth(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    /**
     * @brief POST /upload - Save the first multipart file and start verification
     *
     * The file lands in <uploadDir>/<job_id>/<sanitized name>.
     */
    void handleUpload(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    void handleProgress(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& jobId);

    void handleDownload(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& jobId);
};

} // namespace handlers
