#include "core/Config.hpp"
#include "core/Error.hpp"
#include "protocol/WireProfile.hpp"
#include <fstream>
#include <stdexcept>

namespace chunkwire {

namespace {

nlohmann::json readJsonFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open config file: " + path);
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Invalid JSON in " + path + ": " + e.what());
    }
}

} // namespace

ClientConfig ClientConfig::forProfile(const std::string& name) {
    ClientConfig config;
    if (name == "normal") {
        return config;
    }
    if (name == "low-bandwidth") {
        config.profile = name;
        config.wireProfile = "compact";
        config.chunkSize = 512;
        config.maxRetries = 5;
        config.retryDelay = std::chrono::milliseconds(2000);
        config.maxRetryDelay = std::chrono::milliseconds(30000);
        config.requestTimeout = std::chrono::seconds(15);
        config.closeConnection = true;
        return config;
    }
    throw ConfigError("Unknown network profile: " + name);
}

ClientConfig ClientConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("Client config must be a JSON object");
    }
    try {
        ClientConfig config = forProfile(j.value("profile", std::string("normal")));
        config.serverUrl = j.value("server_url", config.serverUrl);
        config.wireProfile = j.value("wire_profile", config.wireProfile);
        config.chunkSize = j.value("chunk_size", config.chunkSize);
        config.maxRetries = j.value("max_retries", config.maxRetries);
        config.retryDelay = std::chrono::milliseconds(
            j.value("retry_delay_ms", static_cast<long long>(config.retryDelay.count())));
        config.backoffMultiplier = j.value("backoff_multiplier", config.backoffMultiplier);
        config.maxRetryDelay = std::chrono::milliseconds(
            j.value("max_retry_delay_ms", static_cast<long long>(config.maxRetryDelay.count())));
        config.requestTimeout = std::chrono::seconds(
            j.value("request_timeout_s", static_cast<long long>(config.requestTimeout.count())));
        config.probeTimeout = std::chrono::seconds(
            j.value("probe_timeout_s", static_cast<long long>(config.probeTimeout.count())));
        config.closeConnection = j.value("close_connection", config.closeConnection);
        config.validate();
        return config;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Bad client config value: ") + e.what());
    }
}

ClientConfig ClientConfig::fromJsonFile(const std::string& path) {
    return fromJson(readJsonFile(path));
}

void ClientConfig::validate() const {
    if (serverUrl.empty()) {
        throw ConfigError("server_url must not be empty");
    }
    if (chunkSize == 0) {
        throw ConfigError("chunk_size must be positive");
    }
    if (maxRetries == 0) {
        throw ConfigError("max_retries must be at least 1");
    }
    if (backoffMultiplier < 1.0) {
        throw ConfigError("backoff_multiplier must be >= 1.0");
    }
    if (requestTimeout.count() <= 0 || probeTimeout.count() <= 0) {
        throw ConfigError("timeouts must be positive");
    }
    if (retryDelay.count() < 0 || maxRetryDelay.count() < 0) {
        throw ConfigError("retry delays must not be negative");
    }
    try {
        WireProfile::byName(wireProfile);
    } catch (const ProtocolError& e) {
        throw ConfigError(e.what());
    }
}

ServerConfig ServerConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("Server config must be a JSON object");
    }
    try {
        ServerConfig config;
        config.port = j.value("port", config.port);
        config.bindAddress = j.value("bind_address", config.bindAddress);
        config.storageDir = j.value("storage_dir", config.storageDir);
        config.wireProfile = j.value("wire_profile", config.wireProfile);
        config.threads = j.value("threads", config.threads);
        config.maxRequestBytes = j.value("max_request_bytes", config.maxRequestBytes);
        config.readTimeout = std::chrono::seconds(
            j.value("read_timeout_s", static_cast<long long>(config.readTimeout.count())));
        config.validate();
        return config;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Bad server config value: ") + e.what());
    }
}

ServerConfig ServerConfig::fromJsonFile(const std::string& path) {
    return fromJson(readJsonFile(path));
}

void ServerConfig::validate() const {
    if (storageDir.empty()) {
        throw ConfigError("storage_dir must not be empty");
    }
    if (threads == 0) {
        throw ConfigError("threads must be at least 1");
    }
    if (maxRequestBytes < 1024) {
        throw ConfigError("max_request_bytes must be at least 1024");
    }
    if (readTimeout.count() <= 0) {
        throw ConfigError("read_timeout_s must be positive");
    }
    if (wireProfile != "auto") {
        try {
            WireProfile::byName(wireProfile);
        } catch (const ProtocolError& e) {
            throw ConfigError(e.what());
        }
    }
}

unsigned long parseUnsigned(const std::string& text, const std::string& option) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigError(option + " expects a non-negative integer, got '" + text + "'");
    }
    try {
        return std::stoul(text);
    } catch (const std::out_of_range&) {
        throw ConfigError(option + " value out of range: " + text);
    }
}

} // namespace chunkwire
