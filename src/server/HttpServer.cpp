#include "server/HttpServer.hpp"
#include "core/Error.hpp"
#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <thread>
#include <tuple>
#include <vector>

namespace chunkwire {

namespace asio = boost::asio;
using boost::asio::ip::tcp;

HttpServer::HttpServer(size_t maxRequestBytes)
    : acceptor_(io_context_), maxRequestBytes_(maxRequestBytes) {}

void HttpServer::add_endpoint(const endpoint& ep)
{
    handlers_.insert_or_assign(ep.get_path(), ep);
}

uint16_t HttpServer::listen(const std::string& address, uint16_t port)
{
    tcp::endpoint endpoint(asio::ip::make_address(address), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    uint16_t bound = acceptor_.local_endpoint().port();
    std::cout << "[server] Listening on " << address << ":" << bound << std::endl;
    return bound;
}

void HttpServer::run(unsigned threads)
{
    if (!acceptor_.is_open()) {
        throw std::logic_error("HttpServer::listen() must be called before run()");
    }

    std::unique_ptr<asio::signal_set> signals;
    if (handleSignals_) {
        signals = std::make_unique<asio::signal_set>(io_context_, SIGINT, SIGTERM);
        signals->async_wait([this](const boost::system::error_code& ec, int signo) {
            if (!ec) {
                std::cout << "\n[server] Signal " << signo << " received, shutting down" << std::endl;
                stop();
            }
        });
    }

    do_accept();

    std::vector<std::thread> workers;
    for (unsigned i = 1; i < threads; ++i) {
        workers.emplace_back([this] { io_context_.run(); });
    }
    io_context_.run();
    for (auto& worker : workers) {
        worker.join();
    }

    boost::system::error_code ec;
    acceptor_.close(ec);
    io_context_.restart();
}

void HttpServer::stop()
{
    io_context_.stop();
}

void HttpServer::do_accept()
{
    // Each connection gets its own strand so its read, timer and write handlers never overlap
    acceptor_.async_accept(asio::make_strand(io_context_),
                           [this](const boost::system::error_code& ec, tcp::socket socket) {
        if (ec) {
            if (ec == asio::error::operation_aborted) return;
            std::cerr << "[server] Accept failed: " << ec.message() << std::endl;
            do_accept();
            return;
        }
        do_accept();
        handle(std::move(socket));
    });
}

http::Response HttpServer::dispatch(const std::string& method, const std::string& target) const
{
    http::Request request;
    std::string rawQuery;
    std::tie(request.path, rawQuery) = url::splitTarget(target);

    auto it = handlers_.find(request.path);
    if (it == handlers_.end()) {
        return http::Response::notFound("No handler for " + request.path);
    }

    try {
        request.method = from_string(method);
    } catch (const std::invalid_argument&) {
        return http::Response::methodNotAllowed();
    }
    if (it->second.get_rest_type() != request.method) {
        return http::Response::methodNotAllowed();
    }

    try {
        request.query = url::parseQuery(rawQuery);
        return it->second.get_handler()(request);
    }
    catch (const ProtocolError& e) {
        std::cerr << "[server] Bad request to " << request.path << ": " << e.what() << std::endl;
        return http::Response::badRequest(e.what());
    }
    catch (const std::exception& e) {
        std::cerr << "[server] Handler for " << request.path << " failed: " << e.what() << std::endl;
        return http::Response::internalError(e.what());
    }
}

class HttpServer::Connection : public std::enable_shared_from_this<Connection>
{
    const HttpServer& server_;
    tcp::socket socket_;
    asio::steady_timer timer_;
    asio::streambuf buf_;
    std::string out_;

public:
    Connection(const HttpServer& server, tcp::socket socket)
        : server_(server),
          socket_(std::move(socket)),
          timer_(socket_.get_executor()),
          buf_(server.maxRequestBytes_) {}

    void start()
    {
        auto self = shared_from_this();
        timer_.expires_after(server_.readTimeout_);
        timer_.async_wait([self](const boost::system::error_code& ec) {
            if (ec) return;  // cancelled, the request arrived in time
            std::cerr << "[server] No request within " << self->server_.readTimeout_.count()
                      << " ms, closing connection" << std::endl;
            self->close();
        });

        asio::async_read_until(socket_, buf_, "\r\n\r\n",
            [self](const boost::system::error_code& ec, std::size_t) { self->on_read(ec); });
    }

private:
    void on_read(const boost::system::error_code& ec)
    {
        timer_.cancel();

        http::Response response;
        if (ec == asio::error::not_found) {
            response = http::Response::error(431, "too_large", "Request exceeds " +
                                             std::to_string(server_.maxRequestBytes_) + " bytes");
        } else if (ec == asio::error::operation_aborted) {
            return;
        } else if (ec) {
            std::cerr << "[server] Read failed: " << ec.message() << std::endl;
            close();
            return;
        } else {
            std::istream request_stream(&buf_);
            std::string method, target, version;
            request_stream >> method >> target >> version;
            if (method.empty() || target.empty() || version.rfind("HTTP/", 0) != 0) {
                response = http::Response::badRequest("Malformed request line");
            } else {
                response = server_.dispatch(method, target);
            }
        }

        std::ostringstream out;
        out << "HTTP/1.1 " << response.status << " " << status_text(response.status) << "\r\n";
        out << "Content-Length: " << response.body.size() << "\r\n";
        out << "Content-Type: " << response.contentType << "\r\n";
        out << "Connection: close\r\n\r\n";
        out << response.body;
        out_ = out.str();

        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(out_),
            [self](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    std::cerr << "[server] Write failed: " << ec.message() << std::endl;
                }
                self->close();
            });
    }

    void close()
    {
        boost::system::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }
};

void HttpServer::handle(tcp::socket socket)
{
    std::make_shared<Connection>(*this, std::move(socket))->start();
}

} // namespace chunkwire
