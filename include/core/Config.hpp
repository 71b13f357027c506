#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace chunkwire {

/**
 * Client side settings. Built from a network profile preset, then optionally
 * overridden from a JSON file and command line flags.
 */
struct ClientConfig {
    std::string serverUrl = "http://127.0.0.1:8080";
    std::string profile = "normal";           // network-quality preset
    std::string wireProfile = "standard";     // field-name set sent on the wire
    size_t chunkSize = 8192;
    unsigned maxRetries = 3;                  // attempts per chunk, first one included
    std::chrono::milliseconds retryDelay{1000};
    double backoffMultiplier = 2.0;
    std::chrono::milliseconds maxRetryDelay{10000};
    std::chrono::seconds requestTimeout{30};
    std::chrono::seconds probeTimeout{10};
    bool closeConnection = false;             // drop the connection after each request

    // "normal" or "low-bandwidth"; throws ConfigError for anything else
    static ClientConfig forProfile(const std::string& name);

    static ClientConfig fromJson(const nlohmann::json& j);
    static ClientConfig fromJsonFile(const std::string& path);

    // Throws ConfigError if a value is out of range
    void validate() const;
};

struct ServerConfig {
    uint16_t port = 8080;
    std::string bindAddress = "0.0.0.0";
    std::string storageDir = "storage";
    std::string wireProfile = "auto";         // "standard", "compact" or "auto"
    unsigned threads = 4;
    size_t maxRequestBytes = 1024 * 1024;
    std::chrono::seconds readTimeout{30};     // idle connections are closed after this

    static ServerConfig fromJson(const nlohmann::json& j);
    static ServerConfig fromJsonFile(const std::string& path);

    void validate() const;
};

// Decimal digits only; throws ConfigError naming option for signs, junk or overflow
unsigned long parseUnsigned(const std::string& text, const std::string& option);

} // namespace chunkwire
