#pragma once

#include <string>
#include <stdexcept>

namespace chunkwire {

enum class HttpRequest {
    GET,
};


inline HttpRequest from_string(const std::string& method) {
    if (method == "GET") return HttpRequest::GET;
    else throw std::invalid_argument("Invalid HTTP method string: " + method);
}


inline const char* status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 414: return "URI Too Long";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        default:  return "Unknown";
    }
}

} // namespace chunkwire
