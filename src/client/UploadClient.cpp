#include "client/UploadClient.hpp"
#include "client/Chunker.hpp"
#include "core/Error.hpp"
#include <iostream>

namespace chunkwire {

using json = nlohmann::json;

UploadClient::UploadClient(const ClientConfig& config, Transport& transport)
    : config_(config), transport_(transport) {
    config_.validate();
}

std::string UploadClient::endpointUrl(const std::string& path) const {
    std::string base = config_.serverUrl;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + path;
}

RequestOptions UploadClient::probeOptions() const {
    RequestOptions options;
    options.timeout = config_.probeTimeout;
    options.closeConnection = config_.closeConnection;
    return options;
}

std::optional<json> UploadClient::getServerStatus() {
    TransportResponse response;
    try {
        response = transport_.get(endpointUrl("/status"), probeOptions());
    } catch (const std::exception& e) {
        std::cerr << "Server connection error: " << e.what() << std::endl;
        return std::nullopt;
    }

    if (!response.delivered) {
        std::cerr << "Server connection error: " << response.error << std::endl;
        return std::nullopt;
    }
    if (response.status != 200) {
        std::cerr << "Failed to get status: HTTP " << response.status << std::endl;
        return std::nullopt;
    }

    try {
        return json::parse(response.body);
    } catch (const json::parse_error& e) {
        std::cerr << "Status response is not JSON: " << e.what() << std::endl;
        return std::nullopt;
    }
}

bool UploadClient::isHealthy() {
    try {
        return transport_.get(endpointUrl("/"), probeOptions()).ok();
    } catch (const std::exception& e) {
        std::cerr << "Health check failed: " << e.what() << std::endl;
        return false;
    }
}

bool UploadClient::testConnection() {
    std::cout << "Checking connection to " << config_.serverUrl << std::endl;
    auto status = getServerStatus();

    if (!status || !status->is_object()) {
        std::cout << "Could not connect to server" << std::endl;
        return false;
    }

    std::cout << "Connection established" << std::endl;
    std::cout << "Server status: " << status->value("status", std::string("unknown")) << std::endl;

    json files = status->value("uploaded_files", json::array());
    if (files.is_array() && !files.empty()) {
        std::cout << "Files on server (" << files.size() << "):" << std::endl;
        for (const auto& file : files) {
            std::cout << "   - " << (file.is_string() ? file.get<std::string>() : file.dump()) << std::endl;
        }
    } else {
        std::cout << "No files on server yet" << std::endl;
    }
    return true;
}

TransferResult UploadClient::uploadFile(const std::string& path, const CancelToken* cancel) {
    Sender sender(config_, transport_);
    sender.setCancelToken(cancel);
    return sender.upload(path);
}

TransferResult UploadClient::checkAndUpload(const std::string& path, const CancelToken* cancel) {
    TransferResult result;
    try {
        Chunker chunker(path, config_.chunkSize);
        result.filename = chunker.filename();
        result.chunksTotal = chunker.total();
    } catch (const LocalIOError& e) {
        std::cerr << e.what() << std::endl;
        result.errorKind = ErrorKind::LocalIO;
        result.error = e.what();
        return result;
    }

    if (!testConnection()) {
        result.errorKind = ErrorKind::Transient;
        result.error = "Cannot reach server at " + config_.serverUrl;
        return result;
    }
    std::cout << std::endl;

    return uploadFile(path, cancel);
}

} // namespace chunkwire
