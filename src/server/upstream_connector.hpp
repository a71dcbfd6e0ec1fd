#pragma once

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>

#include <expected>
#include <memory>
#include <string>
#include <tuple>

namespace shellrelay {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace ssl = net::ssl;

// Stream types
using plain_ws_stream = websocket::stream<beast::tcp_stream>;
using ssl_ws_stream = websocket::stream<ssl::stream<beast::tcp_stream>>;

/**
 * UpstreamChannel - an open, authenticated upstream console WebSocket
 *
 * Hides the plain/TLS split from the bridge. All operations must run on the
 * executor the channel was connected on.
 */
class UpstreamChannel {
public:
    explicit UpstreamChannel(std::unique_ptr<plain_ws_stream> ws);
    explicit UpstreamChannel(std::unique_ptr<ssl_ws_stream> wss);

    UpstreamChannel(const UpstreamChannel&) = delete;
    UpstreamChannel& operator=(const UpstreamChannel&) = delete;

    net::awaitable<std::tuple<beast::error_code, size_t>> async_read(beast::flat_buffer& buffer);
    net::awaitable<beast::error_code> async_write(net::const_buffer data, bool binary);
    net::awaitable<beast::error_code> async_close(const websocket::close_reason& reason);

    // Frame type of the last message read
    bool got_binary() const;
    bool is_open() const;

    // Close reason sent by the peer, if it sent one
    websocket::close_reason reason() const;

    // Limits and close-handshake timeout for the relay phase
    void configure(size_t max_message_bytes, std::chrono::milliseconds close_timeout);

    // Hard close of the TCP connection, no close frame
    void shutdown();

private:
    std::unique_ptr<plain_ws_stream> ws_;
    std::unique_ptr<ssl_ws_stream> wss_;
};

/**
 * UpstreamConnector - opens the console WebSocket a ticket was minted for
 *
 *   ws[s]://<host>:<api_port>/api2/json/nodes/{node}/{qemu|lxc}/{id}/vncwebsocket
 *       ?port=<port>&vncticket=<ticket>
 *
 * The whole connect (resolve, TCP, TLS, upgrade, termproxy login) is bounded
 * by relay.connect_timeout. Each ticket is presented exactly once; nothing
 * here retries.
 */
class UpstreamConnector {
public:
    explicit UpstreamConnector(const RelayConfig& config);

    UpstreamConnector(const UpstreamConnector&) = delete;
    UpstreamConnector& operator=(const UpstreamConnector&) = delete;

    net::awaitable<std::expected<std::unique_ptr<UpstreamChannel>, RelayError>>
    connect(const ConsoleTicket& ticket);

    // Request target (path + query) of the console endpoint
    static std::string console_target(const ConsoleTicket& ticket);

private:
    template<typename WsStream>
    net::awaitable<std::expected<void, RelayError>>
    handshake(WsStream& ws, const std::string& host, const ConsoleTicket& ticket,
              std::chrono::steady_clock::time_point deadline);

    const RelayConfig& config_;
    ssl::context ssl_ctx_;
};

} // namespace shellrelay
