#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "client/Sender.hpp"
#include "client/Transport.hpp"
#include "core/CancelToken.hpp"
#include "core/Config.hpp"

namespace chunkwire {

/**
 * Client facade used by the command line: server probing plus file upload.
 */
class UploadClient {
public:
    UploadClient(const ClientConfig& config, Transport& transport);

    // Parsed /status body, or nullopt if the server is unreachable or answers badly
    std::optional<nlohmann::json> getServerStatus();

    // GET / answered with any 2xx
    bool isHealthy();

    // Prints server status and stored files; false if the server cannot be reached
    bool testConnection();

    TransferResult uploadFile(const std::string& path, const CancelToken* cancel = nullptr);

    // Command line flow: local file check, then testConnection(), then uploadFile().
    // A local I/O problem is reported without touching the network.
    TransferResult checkAndUpload(const std::string& path, const CancelToken* cancel = nullptr);

    const ClientConfig& config() const { return config_; }

private:
    ClientConfig config_;
    Transport& transport_;

    std::string endpointUrl(const std::string& path) const;
    RequestOptions probeOptions() const;
};

} // namespace chunkwire
