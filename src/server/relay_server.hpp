#pragma once

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/io_context_pool.hpp"
#include "common/types.hpp"
#include "server/proxmox_api.hpp"
#include "server/session_registry.hpp"
#include "server/ticket_store.hpp"
#include "server/upstream_connector.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/url/url_view.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace shellrelay {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace urls = boost::urls;
using tcp = net::ip::tcp;

class AdmissionGate;
class TicketExchange;

// ============================================================================
// HTTP Request Handler Types
// ============================================================================

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

HttpResponse make_json_response(http::status status, const std::string& body);
HttpResponse make_error_response(http::status status, const std::string& error, const std::string& message);
HttpResponse make_error_response(RelayError error, const std::string& message = {});

/**
 * RelayServer - HTTP/WebSocket front end of the console relay
 *
 * Routes:
 *   GET    /shell/ticket/{node}/{id}   mint a console ticket
 *   WS     /shell/ws/{node}/{id}       relay connection
 *   GET    /shell/sessions             list open sessions (admin)
 *   DELETE /shell/sessions/{id}        force-close a session (admin)
 *   GET    /healthz
 *
 * Connections are spread round-robin over the IOContextPool and stay on the
 * io_context they were accepted onto. Always create with std::make_shared:
 * every coroutine the server spawns keeps it alive.
 */
class RelayServer : public std::enable_shared_from_this<RelayServer> {
public:
    // Null gate/exchange: built from config (auth.mode, proxmox section)
    explicit RelayServer(RelayConfig config,
                         std::shared_ptr<AdmissionGate> gate = nullptr,
                         std::shared_ptr<TicketExchange> exchange = nullptr);
    ~RelayServer();

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    // Binds the listener and spawns the accept and ticket-sweep loops.
    // Throws if the address cannot be bound.
    void start(IOContextPool& pool);

    // Closes the listener and cancels every session with SHUTTING_DOWN.
    // Safe to call from any thread.
    void stop();

    bool running() const { return running_.load(std::memory_order_acquire); }

    // Bound port; differs from config when server.port is 0
    uint16_t local_port() const { return local_port_.load(std::memory_order_acquire); }

    const RelayConfig& config() const { return config_; }
    SessionRegistry& registry() { return registry_; }
    TicketStore& ticket_store() { return ticket_store_; }
    AdmissionGate& gate() { return *gate_; }

    struct Stats {
        std::atomic<uint64_t> connections_accepted{0};
        std::atomic<uint64_t> relay_requests{0};
        std::atomic<uint64_t> relay_rejections{0};
        std::atomic<uint64_t> tickets_minted{0};
    };
    const Stats& stats() const { return stats_; }

private:
    // Query of a relay connection request, still unvalidated
    struct ConsoleRequest {
        std::string node;
        std::string resource_id;
        std::string resource_type;
        std::string ticket;
        std::string port;
        std::string token;
    };

    net::awaitable<void> accept_loop();
    net::awaitable<void> sweep_loop();
    net::awaitable<void> handle_connection(tcp::socket socket);

    net::awaitable<HttpResponse> handle_http(const HttpRequest& req, urls::url_view target);
    net::awaitable<HttpResponse> handle_ticket(const HttpRequest& req, const std::string& node,
                                               const std::string& id, urls::params_view params);
    HttpResponse handle_list_sessions(const HttpRequest& req, urls::params_view params);
    HttpResponse handle_close_session(const HttpRequest& req, const std::string& id,
                                      urls::params_view params);
    HttpResponse handle_health() const;

    net::awaitable<void> handle_console(beast::tcp_stream stream, HttpRequest req, ConsoleRequest console);

    // Bearer from the Authorization header, else the "token" query parameter
    std::expected<OperatorIdentity, RelayError> authenticate(const HttpRequest& req,
                                                             std::string_view query_token = {}) const;

    RelayConfig config_;
    ProxmoxApi api_;
    TicketStore ticket_store_;
    SessionRegistry registry_;
    UpstreamConnector connector_;
    std::shared_ptr<AdmissionGate> gate_;
    std::shared_ptr<TicketExchange> exchange_;

    IOContextPool* pool_{nullptr};
    std::unique_ptr<tcp::acceptor> acceptor_;
    std::unique_ptr<net::steady_timer> sweep_timer_;
    std::atomic<bool> running_{false};
    std::atomic<uint16_t> local_port_{0};
    Stats stats_;
};

} // namespace shellrelay
