#pragma once

#include <chrono>
#include <string>

namespace chunkwire {

/**
 * Result of one HTTP exchange. When delivered is false the request never produced a
 * response (timeout, refused, reset) and error says why.
 */
struct TransportResponse {
    bool delivered = false;
    bool timedOut = false;
    long status = 0;
    std::string body;
    std::string error;

    bool ok() const { return delivered && status >= 200 && status < 300; }
};

struct RequestOptions {
    std::chrono::seconds timeout{30};
    bool closeConnection = false;
};

/**
 * Sends a single GET request. Implementations may throw; callers treat a throw like
 * an undelivered request.
 */
class Transport {
public:
    virtual ~Transport() = default;
    virtual TransportResponse get(const std::string& url, const RequestOptions& options) = 0;
};

} // namespace chunkwire
