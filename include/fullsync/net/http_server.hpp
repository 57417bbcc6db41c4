#pragma once

#include "fullsync/net/http_parser.hpp"
#include "fullsync/net/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <functional>
#include <memory>

namespace fullsync::net {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief One accepted connection; answers a single request and closes
 *
 * Kept alive by the shared_ptr captured in each pending async operation.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, HttpRequestHandler handler);

    void start();

private:
    void do_read();
    void do_write(const HttpResponse& response);
    void handle_error(const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::array<char, 8192> buffer_;
};

/**
 * @brief Event-driven HTTP server on a caller-owned io_context
 *
 * Usage:
 * ```cpp
 * asio::io_context io_context;
 * HttpServer server(io_context, 8080);
 * server.set_handler([&router](const HttpRequest& req) { return router.handle_request(req); });
 * io_context.run();
 * ```
 *
 * Port 0 binds an ephemeral port; get_port() reports the real one.
 */
class HttpServer {
public:
    HttpServer(asio::io_context& io_context, uint16_t port);

    void set_handler(HttpRequestHandler handler);

    uint16_t get_port() const { return port_; }

    void stop();

private:
    void do_accept();

    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    uint16_t port_;
};

} // namespace fullsync::net
