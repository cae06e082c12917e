/**
 * @file verifier_handler.cpp
 * @brief Email verification endpoint implementations
 */

#include "verifier_handler.h"
#include "handler_utils.h"
#include "../verifier_api.h"

#include <drogon/MultiPart.h>
#include <stdexcept>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace handlers {

VerifierHandler::VerifierHandler(api::VerifierApi* verifierApi)
    : api_(verifierApi)
{
    if (!api_) {
        throw std::invalid_argument("VerifierHandler: verifierApi cannot be nullptr");
    }
}

void VerifierHandler::registerRoutes(drogon::HttpAppFramework& app) {
    // GET /
    app.registerHandler(
        "/",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleRoot(req, std::move(callback));
        },
        {drogon::Get}
    );

    // GET /api/health
    app.registerHandler(
        "/api/health",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleHealth(req, std::move(callback));
        },
        {drogon::Get}
    );

    // POST /upload
    app.registerHandler(
        "/upload",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleUpload(req, std::move(callback));
        },
        {drogon::Post}
    );

    // GET /progress/{job_id}
    app.registerHandler(
        "/progress/{job_id}",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback,
               const std::string& jobId) {
            handleProgress(req, std::move(callback), jobId);
        },
        {drogon::Get}
    );

    // GET /download/{job_id}
    app.registerHandler(
        "/download/{job_id}",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback,
               const std::string& jobId) {
            handleDownload(req, std::move(callback), jobId);
        },
        {drogon::Get}
    );

    spdlog::info("[VerifierHandler] Registered 5 routes");
}

void VerifierHandler::handleRoot(
    const drogon::HttpRequestPtr& /* req */,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    callback(toHttpResponse(api_->root()));
}

void VerifierHandler::handleHealth(
    const drogon::HttpRequestPtr& /* req */,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    callback(toHttpResponse(api_->health()));
}

void VerifierHandler::handleUpload(
    const drogon::HttpRequestPtr& req,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    drogon::MultiPartParser parser;
    if (parser.parse(req) != 0) {
        callback(badRequest("Invalid multipart form data"));
        return;
    }

    std::vector<api::UploadedFile> files;
    for (const auto& file : parser.getFiles()) {
        files.push_back({file.getFileName(), std::string(file.fileContent())});
    }
    callback(toHttpResponse(api_->upload(req->getParameter("premium"), files)));
}

void VerifierHandler::handleProgress(
    const drogon::HttpRequestPtr& /* req */,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback,
    const std::string& jobId) {
    callback(toHttpResponse(api_->progress(jobId)));
}

void VerifierHandler::handleDownload(
    const drogon::HttpRequestPtr& /* req */,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback,
    const std::string& jobId) {
    callback(toHttpResponse(api_->download(jobId)));
}

} // namespace handlers
