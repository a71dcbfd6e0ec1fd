#pragma once

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/http.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace shellrelay {

namespace net = boost::asio;
namespace ssl = net::ssl;
namespace http = boost::beast::http;

// Result of POST .../vncproxy
struct ConsoleProxy {
    std::string ticket;
    uint16_t port{0};
    std::string user;
};

// Maps a failed control-plane reply to the relay taxonomy. `message` is the
// HTTP reason phrase and/or body, which is where Proxmox puts its error text.
RelayError classify_api_failure(unsigned status, std::string_view message);

// Splits a Proxmox tag list ("a;b,c d") into tags
std::vector<std::string> split_tags(std::string_view tags);

/**
 * ProxmoxApi - coroutine client for the hypervisor REST API (api2/json)
 *
 * One short-lived HTTP/1.1 connection per call, bounded by
 * proxmox.request_timeout. Authenticates with the configured API token.
 */
class ProxmoxApi {
public:
    struct Response {
        unsigned status{0};
        std::string reason;
        std::string body;
    };

    explicit ProxmoxApi(const RelayConfig::Proxmox& config);

    ProxmoxApi(const ProxmoxApi&) = delete;
    ProxmoxApi& operator=(const ProxmoxApi&) = delete;

    // POST /nodes/{node}/{qemu|lxc}/{id}/vncproxy  (websocket=1)
    net::awaitable<std::expected<ConsoleProxy, RelayError>>
    create_console_proxy(const ResourceDescriptor& target);

    // GET /nodes/{node}/{qemu|lxc}/{id}/config -> tags
    net::awaitable<std::expected<std::vector<std::string>, RelayError>>
    resource_tags(const ResourceDescriptor& target);

    // "/api2/json/nodes/{node}/{qemu|lxc}/{id}"
    static std::string resource_path(const ResourceDescriptor& target);

    const RelayConfig::Proxmox& config() const { return config_; }

private:
    // Transport failures come back as UPSTREAM_UNREACHABLE; any HTTP status is a Response
    net::awaitable<std::expected<Response, RelayError>>
    request(http::verb method, const std::string& node, const std::string& target, std::string body);

    const RelayConfig::Proxmox& config_;
    ssl::context ssl_ctx_;
};

} // namespace shellrelay
