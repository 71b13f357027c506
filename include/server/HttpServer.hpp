#pragma once
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include "const/rest_enums.hpp"
#include "http/Request.hpp"
#include "server/endpoint.hpp"

namespace chunkwire {

/**
 * Minimal HTTP/1.1 server: one request per connection, handlers looked up by path.
 * Connections are served asynchronously by the threads passed to run().
 */
class HttpServer
{
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::unordered_map<std::string, endpoint> handlers_;
    size_t maxRequestBytes_;
    std::chrono::milliseconds readTimeout_{30000};
    bool handleSignals_ = false;

public:
    explicit HttpServer(size_t maxRequestBytes = 1024 * 1024);

    void add_endpoint(const endpoint& ep);

    // Binds and listens; returns the bound port (useful with port 0)
    uint16_t listen(const std::string& address, uint16_t port);

    // Serves until stop() or, after stopOnSignals(), SIGINT/SIGTERM
    void run(unsigned threads = 1);
    void stop();
    void stopOnSignals() { handleSignals_ = true; }

    // A connection that has not sent a complete request head by then is closed
    void setReadTimeout(std::chrono::milliseconds timeout) { readTimeout_ = timeout; }

    // Routes a request line target to its handler and maps exceptions to error responses
    http::Response dispatch(const std::string& method, const std::string& target) const;

private:
    class Connection;

    void do_accept();
    void handle(boost::asio::ip::tcp::socket socket);
};

} // namespace chunkwire
