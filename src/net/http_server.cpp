#include "fullsync/net/http_server.hpp"
#include "fullsync/net/http_router.hpp"

#include <spdlog/spdlog.h>

namespace fullsync::net {

// ──────────────────────────────────────────────────────────
// HttpConnection
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(tcp::socket socket, HttpRequestHandler handler)
    : socket_(std::move(socket))
    , handler_(std::move(handler)) {
}

void HttpConnection::start() {
    do_read();
}

void HttpConnection::do_read() {
    auto self = shared_from_this();

    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
                    spdlog::debug("Read error: {}", ec.message());
                }
                return;
            }

            auto parse_result = parser_.parse(buffer_.data(), bytes_transferred);
            if (parse_result.is_error()) {
                handle_error(parse_result.error().message);
                return;
            }
            if (!parse_result.value()) {
                do_read();
                return;
            }

            HttpRequest request = parser_.get_request();
            spdlog::info("{} {}", HttpMethodUtils::to_string(request.method), request.url);

            HttpResponse response;
            try {
                response = handler_(request);
            } catch (const std::exception& e) {
                spdlog::error("Handler threw exception: {}", e.what());
                response = json_error(HttpStatus::INTERNAL_SERVER_ERROR, "InternalError", "internal server error");
            }
            do_write(response);
        }
    );
}

void HttpConnection::do_write(const HttpResponse& response) {
    auto self = shared_from_this();
    auto data = std::make_shared<std::vector<uint8_t>>(response.serialize());

    asio::async_write(
        socket_,
        asio::buffer(*data),
        [this, self, data](boost::system::error_code ec, size_t bytes_transferred) {
            if (!ec) {
                spdlog::debug("Sent {} bytes", bytes_transferred);
                boost::system::error_code shutdown_ec;
                socket_.shutdown(tcp::socket::shutdown_both, shutdown_ec);
            } else if (ec != asio::error::operation_aborted) {
                spdlog::debug("Write error: {}", ec.message());
            }
        }
    );
}

void HttpConnection::handle_error(const std::string& message) {
    spdlog::warn("Connection error: {}", message);
    auto response = json_error(HttpStatus::BAD_REQUEST, "ValidationError", message);
    response.set_header("Connection", "close");
    do_write(response);
}

// ──────────────────────────────────────────────────────────
// HttpServer
// ──────────────────────────────────────────────────────────

HttpServer::HttpServer(asio::io_context& io_context, uint16_t port)
    : acceptor_(io_context, tcp::endpoint(tcp::v4(), port))
    , port_(acceptor_.local_endpoint().port()) {
    spdlog::info("HTTP server listening on port {}", port_);
    do_accept();
}

void HttpServer::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

void HttpServer::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        spdlog::warn("Closing acceptor failed: {}", ec.message());
    }
}

void HttpServer::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
                return;
            }
            if (!ec) {
                std::make_shared<HttpConnection>(std::move(socket), handler_)->start();
            } else {
                spdlog::error("Accept error: {}", ec.message());
            }
            do_accept();
        }
    );
}

} // namespace fullsync::net
