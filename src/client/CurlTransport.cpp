#include "client/CurlTransport.hpp"
#include <curl/curl.h>
#include <mutex>
#include <stdexcept>

namespace chunkwire {

namespace {
    size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
        size_t totalSize = size * nmemb;
        userp->append(static_cast<char*>(contents), totalSize);
        return totalSize;
    }

    std::once_flag globalInit;
}

CurlTransport::CurlTransport() {
    std::call_once(globalInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    curl_ = curl_easy_init();
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }
}

CurlTransport::~CurlTransport() {
    curl_easy_cleanup(curl_);
}

TransportResponse CurlTransport::get(const std::string& url, const RequestOptions& options) {
    TransportResponse result;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &result.body);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, static_cast<long>(options.timeout.count()));
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options.timeout.count()));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    // Flaky links: never keep a socket around for the next request
    curl_easy_setopt(curl_, CURLOPT_FORBID_REUSE, options.closeConnection ? 1L : 0L);

    CURLcode res = curl_easy_perform(curl_);

    if (res != CURLE_OK) {
        result.timedOut = (res == CURLE_OPERATION_TIMEDOUT);
        result.error = std::string("CURL error: ") + curl_easy_strerror(res);
        return result;
    }

    long httpCode = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &httpCode);
    result.delivered = true;
    result.status = httpCode;
    return result;
}

} // namespace chunkwire
