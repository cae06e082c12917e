#pragma once

#include <string>
#include <json/json.h>
#include <drogon/HttpResponse.h>

#include "../verifier_api.h"

/**
 * @file handler_utils.h
 * @brief Conversion from framework-neutral API responses to Drogon responses
 */

namespace handlers {

inline drogon::HttpResponsePtr jsonError(drogon::HttpStatusCode code, const std::string& message) {
    Json::Value body;
    body["error"] = message;
    auto resp = drogon::HttpResponse::newHttpJsonResponse(body);
    resp->setStatusCode(code);
    return resp;
}

inline drogon::HttpResponsePtr badRequest(const std::string& publicMessage) {
    return jsonError(drogon::k400BadRequest, publicMessage);
}

inline drogon::HttpResponsePtr toHttpResponse(const api::ApiResponse& response) {
    if (response.file) {
        return drogon::HttpResponse::newFileResponse(
            response.file->string(), response.file->filename().string());
    }
    auto resp = drogon::HttpResponse::newHttpJsonResponse(response.body);
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(response.status));
    return resp;
}

} // namespace handlers
