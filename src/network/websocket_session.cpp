#include "orca/network/websocket_session.hpp"

#include <spdlog/spdlog.h>

namespace orca {
namespace network {

beast::http::request<beast::http::empty_body> to_beast_request(const HttpRequest& request) {
    beast::http::request<beast::http::empty_body> req;
    req.method(beast::http::verb::get);
    req.target(request.url);
    req.version(request.version == HttpVersion::HTTP_1_0 ? 10 : 11);
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    return req;
}

WebSocketSession::WebSocketSession(boost::asio::ip::tcp::socket socket, WebSocketMessageHandler handler)
    : ws_(std::move(socket))
    , handler_(std::move(handler)) {
}

void WebSocketSession::start(const HttpRequest& upgrade) {
    path_ = upgrade.path();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.async_accept(
        to_beast_request(upgrade),
        [self = shared_from_this()](beast::error_code ec) {
            self->on_accept(ec);
        });
}

void WebSocketSession::on_accept(beast::error_code ec) {
    if (ec) {
        spdlog::warn("[WebSocket] handshake on {} failed: {}", path_, ec.message());
        return;
    }
    spdlog::debug("[WebSocket] session opened on {}", path_);
    do_read();
}

void WebSocketSession::do_read() {
    ws_.async_read(
        buffer_,
        [self = shared_from_this()](beast::error_code ec, std::size_t bytes_transferred) {
            self->on_read(ec, bytes_transferred);
        });
}

void WebSocketSession::on_read(beast::error_code ec, std::size_t bytes_transferred) {
    if (ec) {
        if (ec == websocket::error::closed) {
            spdlog::debug("[WebSocket] session on {} closed after {} frames", path_, frames_);
        } else if (ec != boost::asio::error::operation_aborted) {
            spdlog::debug("[WebSocket] session on {} ended: {}", path_, ec.message());
        }
        return;
    }

    frames_++;
    spdlog::trace("[WebSocket] frame {} of {} bytes on {}", frames_, bytes_transferred, path_);
    std::string message = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());

    if (!ws_.got_text()) {
        spdlog::warn("[WebSocket] skipping binary frame of {} bytes on {}", message.size(), path_);
    } else {
        try {
            handler_(message);
        } catch (const std::exception& e) {
            spdlog::warn("[WebSocket] frame on {} not handled: {}", path_, e.what());
        }
    }

    do_read();
}

} // namespace network
} // namespace orca
