#pragma once

#include "orca/network/http_parser.hpp"
#include "orca/network/http_types.hpp"
#include "orca/network/websocket_session.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace orca {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

// WebSocket endpoints keyed by request path
using WebSocketRoutes = std::unordered_map<std::string, WebSocketMessageHandler>;

/**
 * @brief One accepted connection serving a single request
 *
 * Reads until the parser reports a complete request, answers it and shuts
 * the socket down. A WebSocket upgrade on a registered path instead moves
 * the socket into a WebSocketSession.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket,
                   std::shared_ptr<const HttpRequestHandler> handler,
                   std::shared_ptr<const WebSocketRoutes> websockets);

    void start();

private:
    void do_read();
    void on_request(const HttpRequest& request);
    void do_write(const HttpResponse& response);
    void reject(HttpStatus status, const std::string& message);
    std::string remote_address() const;

    tcp::socket socket_;
    std::shared_ptr<const HttpRequestHandler> handler_;
    std::shared_ptr<const WebSocketRoutes> websockets_;
    HttpParser parser_;
    std::array<char, 8192> buffer_;
};

/**
 * @brief Accept loop for the REST API and the event WebSocket
 *
 * Thread safety:
 * - io_context.run() may be called from several threads; each
 *   connection's callbacks are serialized by its own async chain
 * - the request handler may therefore run concurrently and must be
 *   thread-safe
 *
 * Usage:
 * ```cpp
 * asio::io_context io_context;
 * HttpServerAsio server(io_context, "0.0.0.0", 4200);
 * server.set_handler([&router](const HttpRequest& req) {
 *     return router.handle_request(req);
 * });
 * server.add_websocket("/events/in", on_frame);
 * io_context.run();
 * ```
 */
class HttpServerAsio {
public:
    /**
     * @param io_context Event loop (must outlive this server)
     * @param address Interface to bind, e.g. "0.0.0.0"
     * @param port Port to listen on; 0 picks a free port
     */
    HttpServerAsio(asio::io_context& io_context, const std::string& address, uint16_t port);

    // Call before io_context.run()
    void set_handler(HttpRequestHandler handler);

    // Call before io_context.run()
    void add_websocket(const std::string& path, WebSocketMessageHandler handler);

    // Actual listening port (resolved when constructed with port 0)
    uint16_t get_port() const { return port_; }

    // Stop accepting; open connections finish on their own
    void close();

private:
    void do_accept();

    tcp::acceptor acceptor_;
    std::shared_ptr<const HttpRequestHandler> handler_;
    std::shared_ptr<WebSocketRoutes> websockets_;
    uint16_t port_;
};

} // namespace network
} // namespace orca
