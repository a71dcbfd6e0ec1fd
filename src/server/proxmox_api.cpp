#include "server/proxmox_api.hpp"
#include "common/log.hpp"

#include <boost/beast/core.hpp>
#include <boost/json.hpp>
#include <algorithm>
#include <cctype>

namespace shellrelay {

namespace beast = boost::beast;
namespace json = boost::json;
using tcp = net::ip::tcp;

namespace {

constexpr const char* USER_AGENT = "shellrelay/1.0";

bool contains_nocase(std::string_view haystack, std::string_view needle) {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != haystack.end();
}

// Writes the request and reads the reply on an already connected stream
template<typename Stream>
net::awaitable<beast::error_code> exchange(Stream& stream,
                                           http::request<http::string_body>& req,
                                           http::response<http::string_body>& res) {
    beast::error_code ec;
    co_await http::async_write(stream, req, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        co_return ec;
    }

    beast::flat_buffer buffer;
    co_await http::async_read(stream, buffer, res, net::redirect_error(net::use_awaitable, ec));
    co_return ec;
}

// Parses the reply envelope and returns its "data" member
std::expected<json::value, RelayError> parse_data(const std::string& body) {
    beast::error_code ec;
    auto jv = json::parse(body, ec);
    if (ec || !jv.is_object()) {
        return std::unexpected(RelayError::UPSTREAM_UNREACHABLE);
    }
    auto* data = jv.as_object().if_contains("data");
    if (!data) {
        return std::unexpected(RelayError::UPSTREAM_UNREACHABLE);
    }
    return *data;
}

} // anonymous namespace

RelayError classify_api_failure(unsigned status, std::string_view message) {
    if (status == 401 || status == 403) {
        return RelayError::UPSTREAM_AUTH_FAILED;
    }
    if (status == 404 || contains_nocase(message, "does not exist")) {
        return RelayError::RESOURCE_NOT_FOUND;
    }
    if (contains_nocase(message, "not running")) {
        return RelayError::RESOURCE_NOT_RUNNING;
    }
    return RelayError::UPSTREAM_UNREACHABLE;
}

std::vector<std::string> split_tags(std::string_view tags) {
    std::vector<std::string> result;
    size_t start = 0;
    while (start < tags.size()) {
        auto end = tags.find_first_of(";, ", start);
        if (end == std::string_view::npos) {
            end = tags.size();
        }
        if (end > start) {
            result.emplace_back(tags.substr(start, end - start));
        }
        start = end + 1;
    }
    return result;
}

ProxmoxApi::ProxmoxApi(const RelayConfig::Proxmox& config)
    : config_(config)
    , ssl_ctx_(ssl::context::tls_client)
{
    if (config_.verify_tls) {
        ssl_ctx_.set_default_verify_paths();
        ssl_ctx_.set_verify_mode(ssl::verify_peer);
    } else {
        // Proxmox ships a self-signed certificate by default
        ssl_ctx_.set_verify_mode(ssl::verify_none);
    }
}

std::string ProxmoxApi::resource_path(const ResourceDescriptor& target) {
    std::string path = "/api2/json/nodes/";
    path += target.node;
    path += '/';
    path += resource_kind_path(target.kind);
    path += '/';
    path += std::to_string(target.resource_id);
    return path;
}

net::awaitable<std::expected<ProxmoxApi::Response, RelayError>>
ProxmoxApi::request(http::verb method, const std::string& node, const std::string& target, std::string body) {
    auto executor = co_await net::this_coro::executor;
    const auto& host = config_.host_for(node);
    const auto port = std::to_string(config_.api_port);

    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, USER_AGENT);
    req.set(http::field::accept, "application/json");
    if (!config_.token_name.empty()) {
        req.set(http::field::authorization,
                "PVEAPIToken=" + config_.token_name + "=" + config_.token_value);
    }
    if (method == http::verb::post) {
        req.set(http::field::content_type, "application/x-www-form-urlencoded");
        req.body() = std::move(body);
    }
    req.prepare_payload();

    beast::error_code ec;
    tcp::resolver resolver(executor);
    auto endpoints = co_await resolver.async_resolve(host, port, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        NLOG_WARN(log::UPSTREAM_LOGGER, "ProxmoxApi: Failed to resolve {}: {}", host, ec.message());
        co_return std::unexpected(RelayError::UPSTREAM_UNREACHABLE);
    }

    http::response<http::string_body> res;

    if (config_.tls) {
        ssl::stream<beast::tcp_stream> stream(executor, ssl_ctx_);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
            NLOG_ERROR(log::UPSTREAM_LOGGER, "ProxmoxApi: Failed to set SNI hostname {}", host);
            co_return std::unexpected(RelayError::UPSTREAM_UNREACHABLE);
        }

        auto& lowest = beast::get_lowest_layer(stream);
        lowest.expires_after(config_.request_timeout);
        co_await lowest.async_connect(endpoints, net::redirect_error(net::use_awaitable, ec));
        if (!ec) {
            co_await stream.async_handshake(ssl::stream_base::client,
                                            net::redirect_error(net::use_awaitable, ec));
        }
        if (!ec) {
            ec = co_await exchange(stream, req, res);
        }

        beast::error_code ignored;
        lowest.socket().shutdown(tcp::socket::shutdown_both, ignored);
    } else {
        beast::tcp_stream stream(executor);
        stream.expires_after(config_.request_timeout);
        co_await stream.async_connect(endpoints, net::redirect_error(net::use_awaitable, ec));
        if (!ec) {
            ec = co_await exchange(stream, req, res);
        }

        beast::error_code ignored;
        stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
    }

    if (ec) {
        NLOG_WARN(log::UPSTREAM_LOGGER, "ProxmoxApi: {} {} on {} failed: {}",
                  std::string(http::to_string(method)), target, host, ec.message());
        co_return std::unexpected(RelayError::UPSTREAM_UNREACHABLE);
    }

    Response response;
    response.status = res.result_int();
    response.reason = std::string(res.reason());
    response.body = std::move(res.body());

    NLOG_DEBUG(log::UPSTREAM_LOGGER, "ProxmoxApi: {} {} -> {}", std::string(http::to_string(method)), target,
               response.status);
    co_return response;
}

net::awaitable<std::expected<ConsoleProxy, RelayError>>
ProxmoxApi::create_console_proxy(const ResourceDescriptor& target) {
    auto response = co_await request(http::verb::post, target.node,
                                     resource_path(target) + "/vncproxy", "websocket=1");
    if (!response) {
        co_return std::unexpected(response.error());
    }
    if (response->status / 100 != 2) {
        auto error = classify_api_failure(response->status, response->reason + " " + response->body);
        NLOG_WARN(log::UPSTREAM_LOGGER, "ProxmoxApi: vncproxy for {} rejected: {} {} ({})",
                  target.to_string(), response->status, response->reason, relay_error_name(error));
        co_return std::unexpected(error);
    }

    auto data = parse_data(response->body);
    if (!data || !data->is_object()) {
        NLOG_WARN(log::UPSTREAM_LOGGER, "ProxmoxApi: Malformed vncproxy reply for {}", target.to_string());
        co_return std::unexpected(RelayError::UPSTREAM_UNREACHABLE);
    }
    const auto& obj = data->as_object();

    ConsoleProxy proxy;
    if (auto* ticket = obj.if_contains("ticket"); ticket && ticket->is_string()) {
        proxy.ticket = ticket->as_string().c_str();
    }
    if (auto* user = obj.if_contains("user"); user && user->is_string()) {
        proxy.user = user->as_string().c_str();
    }

    // The API returns the port as a string on some versions and as a number on others
    if (auto* port = obj.if_contains("port")) {
        if (port->is_string()) {
            if (auto parsed = parse_port(port->as_string().c_str())) {
                proxy.port = *parsed;
            }
        } else if (port->is_int64() && port->as_int64() > 0 && port->as_int64() <= 65535) {
            proxy.port = static_cast<uint16_t>(port->as_int64());
        } else if (port->is_uint64() && port->as_uint64() > 0 && port->as_uint64() <= 65535) {
            proxy.port = static_cast<uint16_t>(port->as_uint64());
        }
    }

    if (proxy.ticket.empty() || proxy.port == 0) {
        NLOG_WARN(log::UPSTREAM_LOGGER, "ProxmoxApi: vncproxy reply for {} lacks ticket or port",
                  target.to_string());
        co_return std::unexpected(RelayError::UPSTREAM_UNREACHABLE);
    }
    co_return proxy;
}

net::awaitable<std::expected<std::vector<std::string>, RelayError>>
ProxmoxApi::resource_tags(const ResourceDescriptor& target) {
    auto response = co_await request(http::verb::get, target.node, resource_path(target) + "/config", {});
    if (!response) {
        co_return std::unexpected(response.error());
    }
    if (response->status / 100 != 2) {
        co_return std::unexpected(classify_api_failure(response->status,
                                                       response->reason + " " + response->body));
    }

    auto data = parse_data(response->body);
    if (!data || !data->is_object()) {
        co_return std::unexpected(RelayError::UPSTREAM_UNREACHABLE);
    }

    if (auto* tags = data->as_object().if_contains("tags"); tags && tags->is_string()) {
        co_return split_tags(tags->as_string().c_str());
    }
    co_return std::vector<std::string>{};
}

} // namespace shellrelay
