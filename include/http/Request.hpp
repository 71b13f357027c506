#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "const/rest_enums.hpp"
#include "protocol/UrlCodec.hpp"

namespace chunkwire {
namespace http {

/**
 * HTTP Request object containing all request data
 */
struct Request {
    HttpRequest method = HttpRequest::GET;
    std::string path;           // Clean path without query string
    url::QueryParams query;     // Decoded query parameters, in request order
    std::string rawBody;

    std::string getQuery(const std::string& key, const std::string& defaultValue = "") const {
        for (const auto& kv : query) {
            if (kv.first == key) return kv.second;
        }
        return defaultValue;
    }

    bool hasQuery(const std::string& key) const {
        for (const auto& kv : query) {
            if (kv.first == key) return true;
        }
        return false;
    }
};

/**
 * HTTP Response object
 */
struct Response {
    int status = 200;
    std::string contentType = "application/json";
    std::string body;

    static Response json(int status, const nlohmann::json& body) {
        return {status, "application/json", body.dump()};
    }

    static Response ok(const nlohmann::json& body) {
        return json(200, body);
    }

    static Response error(int status, const std::string& code, const std::string& message) {
        return json(status, {{"status", "error"}, {"error", code}, {"message", message}});
    }

    static Response badRequest(const std::string& message) {
        return error(400, "malformed", message);
    }

    static Response notFound(const std::string& message = "Not found") {
        return error(404, "not_found", message);
    }

    static Response methodNotAllowed() {
        return error(405, "method_not_allowed", "Method not allowed");
    }

    static Response internalError(const std::string& message) {
        return error(500, "internal", message);
    }
};

} // namespace http
} // namespace chunkwire
