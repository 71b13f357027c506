#pragma once

#include <memory>
#include "client/Transport.hpp"

typedef void CURL;

namespace chunkwire {

// libcurl easy-handle transport; the handle keeps its connection cache between requests
class CurlTransport : public Transport {
public:
    CurlTransport();
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    TransportResponse get(const std::string& url, const RequestOptions& options) override;

private:
    CURL* curl_;
};

} // namespace chunkwire
