#include "server/upstream_connector.hpp"
#include "server/proxmox_api.hpp"
#include "common/log.hpp"

#include <boost/url.hpp>
#include <algorithm>

namespace shellrelay {

namespace http = beast::http;
namespace urls = boost::urls;
using tcp = net::ip::tcp;

namespace {

constexpr const char* USER_AGENT = "shellrelay/1.0";

std::chrono::milliseconds remaining(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return std::max(left, std::chrono::milliseconds(1));
}

// Peer went away without answering
bool is_peer_gone(const beast::error_code& ec) {
    return ec == websocket::error::closed ||
           ec == net::error::eof ||
           ec == net::error::connection_reset;
}

} // anonymous namespace

// ============================================================================
// UpstreamChannel
// ============================================================================

UpstreamChannel::UpstreamChannel(std::unique_ptr<plain_ws_stream> ws)
    : ws_(std::move(ws)) {}

UpstreamChannel::UpstreamChannel(std::unique_ptr<ssl_ws_stream> wss)
    : wss_(std::move(wss)) {}

net::awaitable<std::tuple<beast::error_code, size_t>> UpstreamChannel::async_read(beast::flat_buffer& buffer) {
    beast::error_code ec;
    size_t bytes = 0;
    if (wss_) {
        bytes = co_await wss_->async_read(buffer, net::redirect_error(net::use_awaitable, ec));
    } else {
        bytes = co_await ws_->async_read(buffer, net::redirect_error(net::use_awaitable, ec));
    }
    co_return std::make_tuple(ec, bytes);
}

net::awaitable<beast::error_code> UpstreamChannel::async_write(net::const_buffer data, bool binary) {
    beast::error_code ec;
    if (wss_) {
        wss_->binary(binary);
        co_await wss_->async_write(data, net::redirect_error(net::use_awaitable, ec));
    } else {
        ws_->binary(binary);
        co_await ws_->async_write(data, net::redirect_error(net::use_awaitable, ec));
    }
    co_return ec;
}

net::awaitable<beast::error_code> UpstreamChannel::async_close(const websocket::close_reason& reason) {
    beast::error_code ec;
    if (wss_) {
        co_await wss_->async_close(reason, net::redirect_error(net::use_awaitable, ec));
    } else {
        co_await ws_->async_close(reason, net::redirect_error(net::use_awaitable, ec));
    }
    co_return ec;
}

bool UpstreamChannel::got_binary() const {
    return wss_ ? wss_->got_binary() : ws_->got_binary();
}

bool UpstreamChannel::is_open() const {
    return wss_ ? wss_->is_open() : ws_->is_open();
}

websocket::close_reason UpstreamChannel::reason() const {
    return wss_ ? wss_->reason() : ws_->reason();
}

void UpstreamChannel::configure(size_t max_message_bytes, std::chrono::milliseconds close_timeout) {
    websocket::stream_base::timeout opt{
        close_timeout,                      // handshake (and close handshake)
        websocket::stream_base::none(),     // idle
        false                               // keep-alive pings
    };
    if (wss_) {
        wss_->read_message_max(max_message_bytes);
        wss_->set_option(opt);
    } else {
        ws_->read_message_max(max_message_bytes);
        ws_->set_option(opt);
    }
}

void UpstreamChannel::shutdown() {
    beast::error_code ec;
    if (wss_) {
        auto& lowest = beast::get_lowest_layer(*wss_);
        lowest.socket().shutdown(tcp::socket::shutdown_both, ec);
        lowest.close();
    } else if (ws_) {
        auto& lowest = beast::get_lowest_layer(*ws_);
        lowest.socket().shutdown(tcp::socket::shutdown_both, ec);
        lowest.close();
    }
}

// ============================================================================
// UpstreamConnector
// ============================================================================

UpstreamConnector::UpstreamConnector(const RelayConfig& config)
    : config_(config)
    , ssl_ctx_(ssl::context::tls_client)
{
    if (config_.proxmox.verify_tls) {
        ssl_ctx_.set_default_verify_paths();
        ssl_ctx_.set_verify_mode(ssl::verify_peer);
    } else {
        ssl_ctx_.set_verify_mode(ssl::verify_none);
    }
}

std::string UpstreamConnector::console_target(const ConsoleTicket& ticket) {
    std::string target = ProxmoxApi::resource_path(ticket.issued_for);
    target += "/vncwebsocket?port=";
    target += std::to_string(ticket.target_port);
    target += "&vncticket=";
    target += urls::encode(ticket.value, urls::unreserved_chars);
    return target;
}

template<typename WsStream>
net::awaitable<std::expected<void, RelayError>>
UpstreamConnector::handshake(WsStream& ws, const std::string& host, const ConsoleTicket& ticket,
                             std::chrono::steady_clock::time_point deadline) {
    const auto descriptor = ticket.issued_for.to_string();

    // No pings: idle_timeout bounds each handshake read
    ws.set_option(websocket::stream_base::timeout{remaining(deadline), remaining(deadline), false});

    std::string authorization;
    std::string cookie;
    if (!config_.proxmox.token_name.empty()) {
        authorization = "PVEAPIToken=" + config_.proxmox.token_name + "=" + config_.proxmox.token_value;
    } else {
        cookie = "PVEAuthCookie=" + ticket.value;
    }
    ws.set_option(websocket::stream_base::decorator(
        [authorization, cookie](websocket::request_type& req) {
            req.set(http::field::user_agent, USER_AGENT);
            if (!authorization.empty()) {
                req.set(http::field::authorization, authorization);
            }
            if (!cookie.empty()) {
                req.set(http::field::cookie, cookie);
            }
        }));

    beast::error_code ec;
    websocket::response_type res;
    co_await ws.async_handshake(res, host + ":" + std::to_string(config_.proxmox.api_port),
                                console_target(ticket), net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        const auto status = res.result_int();
        if (status == 401 || status == 403) {
            NLOG_WARN(log::UPSTREAM_LOGGER, "UpstreamConnector: {} rejected the ticket for {} (HTTP {})",
                      host, descriptor, status);
            co_return std::unexpected(RelayError::UPSTREAM_AUTH_FAILED);
        }
        NLOG_WARN(log::UPSTREAM_LOGGER, "UpstreamConnector: Upgrade for {} failed: {} (HTTP {})",
                  descriptor, ec.message(), status);
        co_return std::unexpected(RelayError::UPSTREAM_UNREACHABLE);
    }

    if (config_.relay.handshake == HandshakeMode::TERMPROXY) {
        const std::string login = ticket.upstream_user + ":" + ticket.value + "\n";
        ws.text(true);
        co_await ws.async_write(net::buffer(login), net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            NLOG_WARN(log::UPSTREAM_LOGGER, "UpstreamConnector: Login write for {} failed: {}",
                      descriptor, ec.message());
            co_return std::unexpected(is_peer_gone(ec) ? RelayError::UPSTREAM_AUTH_FAILED
                                                       : RelayError::UPSTREAM_UNREACHABLE);
        }

        ws.set_option(websocket::stream_base::timeout{remaining(deadline), remaining(deadline), false});

        beast::flat_buffer reply;
        co_await ws.async_read(reply, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            if (is_peer_gone(ec)) {
                NLOG_WARN(log::UPSTREAM_LOGGER, "UpstreamConnector: {} closed before accepting the login for {}",
                          host, descriptor);
                co_return std::unexpected(RelayError::UPSTREAM_AUTH_FAILED);
            }
            NLOG_WARN(log::UPSTREAM_LOGGER, "UpstreamConnector: Login reply for {} failed: {}",
                      descriptor, ec.message());
            co_return std::unexpected(RelayError::UPSTREAM_UNREACHABLE);
        }

        const auto text = beast::buffers_to_string(reply.data());
        if (!text.starts_with("OK")) {
            NLOG_WARN(log::UPSTREAM_LOGGER, "UpstreamConnector: Unexpected login reply for {} ({} bytes)",
                      descriptor, text.size());
            co_return std::unexpected(RelayError::UPSTREAM_UNREACHABLE);
        }
    }

    // Relay-phase timeouts are applied by the session
    ws.set_option(websocket::stream_base::timeout{
        websocket::stream_base::none(), websocket::stream_base::none(), false});

    NLOG_INFO(log::UPSTREAM_LOGGER, "UpstreamConnector: Console {} open via {}", descriptor, host);
    co_return std::expected<void, RelayError>{};
}

net::awaitable<std::expected<std::unique_ptr<UpstreamChannel>, RelayError>>
UpstreamConnector::connect(const ConsoleTicket& ticket) {
    auto executor = co_await net::this_coro::executor;
    const auto& target = ticket.issued_for;
    const auto& host = config_.proxmox.host_for(target.node);
    const auto port = std::to_string(config_.proxmox.api_port);
    const auto deadline = std::chrono::steady_clock::now() + config_.relay.connect_timeout;

    NLOG_DEBUG(log::UPSTREAM_LOGGER, "UpstreamConnector: Connecting to {}://{}:{} for {}",
               config_.proxmox.tls ? "wss" : "ws", host, port, target.to_string());

    beast::error_code ec;
    tcp::resolver resolver(executor);
    auto endpoints = co_await resolver.async_resolve(host, port, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        NLOG_WARN(log::UPSTREAM_LOGGER, "UpstreamConnector: Failed to resolve {}: {}", host, ec.message());
        co_return std::unexpected(RelayError::UPSTREAM_UNREACHABLE);
    }

    if (config_.proxmox.tls) {
        auto wss = std::make_unique<ssl_ws_stream>(executor, ssl_ctx_);

        // Set SNI hostname
        if (!SSL_set_tlsext_host_name(wss->next_layer().native_handle(), host.c_str())) {
            NLOG_ERROR(log::UPSTREAM_LOGGER, "UpstreamConnector: Failed to set SNI hostname {}", host);
            co_return std::unexpected(RelayError::UPSTREAM_UNREACHABLE);
        }

        auto& lowest = beast::get_lowest_layer(*wss);
        lowest.expires_at(deadline);
        co_await lowest.async_connect(endpoints, net::redirect_error(net::use_awaitable, ec));
        if (!ec) {
            co_await wss->next_layer().async_handshake(ssl::stream_base::client,
                                                       net::redirect_error(net::use_awaitable, ec));
        }
        if (ec) {
            NLOG_WARN(log::UPSTREAM_LOGGER, "UpstreamConnector: Connect to {}:{} failed: {}",
                      host, port, ec.message());
            lowest.close();
            co_return std::unexpected(RelayError::UPSTREAM_UNREACHABLE);
        }

        // The websocket layer enforces its own timeouts from here on
        lowest.expires_never();

        auto result = co_await handshake(*wss, host, ticket, deadline);
        if (!result) {
            lowest.close();
            co_return std::unexpected(result.error());
        }
        co_return std::make_unique<UpstreamChannel>(std::move(wss));
    }

    auto ws = std::make_unique<plain_ws_stream>(executor);
    auto& lowest = beast::get_lowest_layer(*ws);
    lowest.expires_at(deadline);
    co_await lowest.async_connect(endpoints, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        NLOG_WARN(log::UPSTREAM_LOGGER, "UpstreamConnector: Connect to {}:{} failed: {}",
                  host, port, ec.message());
        lowest.close();
        co_return std::unexpected(RelayError::UPSTREAM_UNREACHABLE);
    }
    lowest.expires_never();

    auto result = co_await handshake(*ws, host, ticket, deadline);
    if (!result) {
        lowest.close();
        co_return std::unexpected(result.error());
    }
    co_return std::make_unique<UpstreamChannel>(std::move(ws));
}

} // namespace shellrelay
