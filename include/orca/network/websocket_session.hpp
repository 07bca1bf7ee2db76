#pragma once

/**
 * @file websocket_session.hpp
 * @brief One accepted WebSocket connection (GET /events/in)
 *
 * WHY THIS FILE EXISTS:
 * Producers stream events one text frame at a time. HttpConnection parses
 * the upgrade request with the same HttpParser as any other request and
 * then hands its socket to a WebSocketSession, which completes the
 * handshake with Boost.Beast and reads frames asynchronously until the
 * peer goes away.
 *
 * LIFECYCLE:
 * 1. Created from the upgrading connection's socket
 * 2. start() answers the handshake
 * 3. Each text frame is passed to the message handler, then the next read
 *    is queued
 * 4. A close frame or any read error ends the session; there is nothing
 *    to roll back because every frame was handled on receipt
 */

#include "orca/network/http_types.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <functional>
#include <memory>
#include <string>

namespace orca {
namespace network {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;

using WebSocketMessageHandler = std::function<void(const std::string&)>;

class WebSocketSession : public std::enable_shared_from_this<WebSocketSession> {
public:
    WebSocketSession(boost::asio::ip::tcp::socket socket, WebSocketMessageHandler handler);

    // Complete the handshake for an already-parsed upgrade request
    void start(const HttpRequest& upgrade);

private:
    void on_accept(beast::error_code ec);
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);

    websocket::stream<boost::asio::ip::tcp::socket> ws_;
    beast::flat_buffer buffer_;
    WebSocketMessageHandler handler_;
    std::string path_;
    std::size_t frames_ = 0;
};

// Beast's view of a request parsed by HttpParser
beast::http::request<beast::http::empty_body> to_beast_request(const HttpRequest& request);

} // namespace network
} // namespace orca
