#pragma once

#include <string>
#include "http/Request.hpp"
#include "protocol/WireProfile.hpp"
#include "server/ArtifactStore.hpp"
#include "server/HttpServer.hpp"
#include "server/Reassembler.hpp"

namespace chunkwire {

/**
 * HTTP surface of the reassembler: /upload, /status and the / health probe.
 */
class UploadHandler {
public:
    // wireProfile is "standard", "compact" or "auto" (pick whichever field set is complete)
    UploadHandler(Reassembler& reassembler, ArtifactStore& store, const std::string& wireProfile = "auto");

    http::Response handleUpload(const http::Request& request);
    http::Response handleStatus(const http::Request& request) const;
    http::Response handleHealth(const http::Request& request) const;

    void registerEndpoints(HttpServer& server);

private:
    Reassembler& reassembler_;
    ArtifactStore& store_;
    std::string wireProfile_;

    const WireProfile& profileFor(const http::Request& request) const;
};

} // namespace chunkwire
