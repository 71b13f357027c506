#include "server/UploadHandler.hpp"
#include "core/Error.hpp"
#include "protocol/ChunkFrame.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace chunkwire {

using json = nlohmann::json;

UploadHandler::UploadHandler(Reassembler& reassembler, ArtifactStore& store, const std::string& wireProfile)
    : reassembler_(reassembler), store_(store), wireProfile_(wireProfile) {
    if (wireProfile_ != "auto") {
        // throws ProtocolError for an unknown profile name
        WireProfile::byName(wireProfile_);
    }
}

const WireProfile& UploadHandler::profileFor(const http::Request& request) const {
    if (wireProfile_ != "auto") {
        return WireProfile::byName(wireProfile_);
    }
    if (WireProfile::compact().matches(request.query)) {
        return WireProfile::compact();
    }
    return WireProfile::standard();
}

http::Response UploadHandler::handleUpload(const http::Request& request) {
    ChunkFrame frame;
    try {
        frame = ChunkFrame::fromQuery(request.query, profileFor(request));
    } catch (const ProtocolError& e) {
        std::cerr << "[server] Rejected malformed chunk: " << e.what() << std::endl;
        return http::Response::badRequest(e.what());
    }

    ReceiveResult result = reassembler_.receiveChunk(frame);

    if (result.ok()) {
        json response;
        response["status"] = "ok";
        response["message"] = result.message;
        response["chunk"] = frame.index;
        response["expected"] = result.expected;
        response["complete"] = (result.status == ReceiveStatus::Completed);
        if (result.status == ReceiveStatus::Duplicate) {
            response["duplicate"] = true;
        }
        return http::Response::ok(response);
    }

    switch (result.reason) {
        case RejectReason::OrderingViolation:
            return http::Response::json(409, {
                {"status", "error"},
                {"error", to_string(result.reason)},
                {"expected", result.expected},
                {"message", result.message}
            });
        case RejectReason::Storage:
            return http::Response::error(500, to_string(result.reason), result.message);
        case RejectReason::Malformed:
        default:
            return http::Response::error(400, "malformed", result.message);
    }
}

http::Response UploadHandler::handleStatus(const http::Request&) const {
    json response;
    response["status"] = "running";
    response["uploaded_files"] = store_.listCompleted();
    response["active_uploads"] = reassembler_.activeSessions();
    return http::Response::ok(response);
}

http::Response UploadHandler::handleHealth(const http::Request&) const {
    return http::Response::ok({{"status", "ok"}});
}

void UploadHandler::registerEndpoints(HttpServer& server) {
    server.add_endpoint(endpoint(
        [this](const http::Request& request) { return handleUpload(request); },
        HttpRequest::GET,
        "/upload"));
    server.add_endpoint(endpoint(
        [this](const http::Request& request) { return handleStatus(request); },
        HttpRequest::GET,
        "/status"));
    server.add_endpoint(endpoint(
        [this](const http::Request& request) { return handleHealth(request); },
        HttpRequest::GET,
        "/"));
}

} // namespace chunkwire
