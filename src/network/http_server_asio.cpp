#include "orca/network/http_server_asio.hpp"

#include "orca/network/http_router.hpp"

#include <spdlog/spdlog.h>

namespace orca {
namespace network {

HttpConnection::HttpConnection(tcp::socket socket,
                               std::shared_ptr<const HttpRequestHandler> handler,
                               std::shared_ptr<const WebSocketRoutes> websockets)
    : socket_(std::move(socket))
    , handler_(std::move(handler))
    , websockets_(std::move(websockets)) {
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
                    spdlog::debug("[Http] read failed: {}", ec.message());
                }
                return;
            }

            auto parsed = parser_.parse(buffer_.data(), bytes_transferred);
            if (parsed.is_error()) {
                // Oversized event batches get 413 so clients know to split them
                const bool too_large = parsed.error().find("exceeds") != std::string::npos;
                reject(too_large ? HttpStatus::PAYLOAD_TOO_LARGE : HttpStatus::BAD_REQUEST, parsed.error());
            } else if (parsed.value()) {
                on_request(parser_.get_request());
            } else {
                do_read();
            }
        }
    );
}

void HttpConnection::on_request(const HttpRequest& request) {
    spdlog::debug("[Http] {} {}", HttpMethodUtils::to_string(request.method), request.url);

    if (request.is_websocket_upgrade() && websockets_) {
        auto it = websockets_->find(request.path());
        if (it != websockets_->end()) {
            std::make_shared<WebSocketSession>(std::move(socket_), it->second)->start(request);
            return;
        }
    }

    HttpResponse response;
    if (!handler_ || !*handler_) {
        response = error_response(HttpStatus::SERVICE_UNAVAILABLE, "No handler installed");
    } else {
        try {
            response = (*handler_)(request);
        } catch (const std::exception& e) {
            spdlog::error("[Http] {} {} failed: {}", HttpMethodUtils::to_string(request.method), request.url, e.what());
            response = error_response(HttpStatus::INTERNAL_SERVER_ERROR, "Internal server error");
        }
    }

    do_write(response);
}

void HttpConnection::do_write(const HttpResponse& response) {
    auto self = shared_from_this();

    // One request per connection
    HttpResponse closing = response;
    closing.set_header("Connection", "close");
    auto wire = std::make_shared<std::vector<uint8_t>>(closing.serialize());

    asio::async_write(
        socket_,
        asio::buffer(*wire),
        [this, self, wire](boost::system::error_code ec, size_t) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::debug("[Http] write failed: {}", ec.message());
                }
                return;
            }
            boost::system::error_code shutdown_ec;
            socket_.shutdown(tcp::socket::shutdown_both, shutdown_ec);
        }
    );
}

void HttpConnection::reject(HttpStatus status, const std::string& message) {
    spdlog::warn("[Http] rejected request from {}: {}", remote_address(), message);
    do_write(error_response(status, message));
}

std::string HttpConnection::remote_address() const {
    boost::system::error_code ec;
    const auto endpoint = socket_.remote_endpoint(ec);
    return ec ? std::string("unknown") : endpoint.address().to_string();
}

HttpServerAsio::HttpServerAsio(asio::io_context& io_context, const std::string& address, uint16_t port)
    : acceptor_(io_context, tcp::endpoint(asio::ip::make_address(address), port))
    , handler_(std::make_shared<HttpRequestHandler>())
    , websockets_(std::make_shared<WebSocketRoutes>())
    , port_(acceptor_.local_endpoint().port()) {

    spdlog::info("[Http] listening on {}:{}", address, port_);

    do_accept();
}

void HttpServerAsio::set_handler(HttpRequestHandler handler) {
    handler_ = std::make_shared<HttpRequestHandler>(std::move(handler));
}

void HttpServerAsio::add_websocket(const std::string& path, WebSocketMessageHandler handler) {
    (*websockets_)[path] = std::move(handler);
    spdlog::debug("[Http] websocket endpoint {}", path);
}

void HttpServerAsio::close() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        spdlog::warn("[Http] closing acceptor: {}", ec.message());
    }
}

void HttpServerAsio::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted) {
                return;
            }
            if (ec) {
                spdlog::error("[Http] accept failed: {}", ec.message());
            } else {
                std::make_shared<HttpConnection>(std::move(socket), handler_, websockets_)->start();
            }

            if (acceptor_.is_open()) {
                do_accept();
            }
        }
    );
}

} // namespace network
} // namespace orca
