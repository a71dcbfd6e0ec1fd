#include "server/relay_server.hpp"
#include "server/admission_gate.hpp"
#include "server/console_session.hpp"
#include "server/ticket_exchange.hpp"
#include "common/log.hpp"

#include <boost/json.hpp>
#include <boost/url/parse.hpp>

namespace shellrelay {

namespace json = boost::json;

namespace {

constexpr auto HTTP_READ_TIMEOUT = std::chrono::seconds(30);
constexpr const char* SERVER_NAME = "shellrelay/1.0";

using ClientStream = ConsoleSession::ClientStream;

std::string query_param(urls::params_view params, std::string_view key) {
    auto it = params.find(key);
    if (it == params.end()) {
        return {};
    }
    return std::string((*it).value);
}

std::vector<std::string> path_segments(urls::url_view target) {
    std::vector<std::string> segments;
    for (auto segment : target.segments()) {
        segments.push_back(std::string(segment));
    }
    return segments;
}

json::object session_to_json(const SessionInfo& info) {
    json::object j;
    j["id"] = info.id;
    j["node"] = info.descriptor.node;
    j["resource_type"] = std::string(resource_kind_name(info.descriptor.kind));
    j["vmid"] = info.descriptor.resource_id;
    j["operator"] = info.operator_subject;
    j["state"] = std::string(session_state_name(info.state));
    j["created_at"] = to_unix_seconds(info.created_at);
    j["last_activity_at"] = to_unix_seconds(info.last_activity_at);
    j["bytes_client_to_upstream"] = info.bytes_client_to_upstream;
    j["bytes_upstream_to_client"] = info.bytes_upstream_to_client;
    return j;
}

std::expected<ResourceDescriptor, RelayError> parse_descriptor(const std::string& node,
                                                               const std::string& id,
                                                               const std::string& resource_type) {
    auto kind = parse_resource_kind(resource_type.empty() ? std::string_view("qemu") : resource_type);
    if (!kind) {
        return std::unexpected(kind.error());
    }
    auto resource_id = parse_resource_id(id);
    if (!resource_id) {
        return std::unexpected(resource_id.error());
    }

    ResourceDescriptor descriptor{node, *kind, *resource_id};
    if (auto valid = descriptor.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    return descriptor;
}

// Closes an accepted relay connection that never became a session
net::awaitable<void> reject(ClientStream& ws, RelayError error, std::string_view detail = {}) {
    NLOG_INFO(log::RELAY_LOGGER, "RelayServer: Rejecting relay connection: {} {}",
              relay_error_name(error), detail);

    beast::error_code ec;
    co_await ws.async_close(make_close_reason(error, detail), net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        NLOG_DEBUG(log::RELAY_LOGGER, "RelayServer: Close after rejection failed: {}", ec.message());
    }
    auto& lowest = beast::get_lowest_layer(ws);
    lowest.socket().shutdown(tcp::socket::shutdown_both, ec);
    lowest.close();
}

} // anonymous namespace

// ============================================================================
// HTTP Helpers
// ============================================================================

HttpResponse make_json_response(http::status status, const std::string& body) {
    HttpResponse res{status, 11};
    res.set(http::field::server, SERVER_NAME);
    res.set(http::field::content_type, "application/json");
    res.set(http::field::access_control_allow_origin, "*");
    res.body() = body;
    res.prepare_payload();
    return res;
}

HttpResponse make_error_response(http::status status, const std::string& error, const std::string& message) {
    json::object j;
    j["error"] = error;
    j["message"] = message;
    return make_json_response(status, json::serialize(j));
}

HttpResponse make_error_response(RelayError error, const std::string& message) {
    return make_error_response(static_cast<http::status>(http_status_for(error)),
                               std::string(relay_error_name(error)),
                               message.empty() ? std::string(relay_error_message(error)) : message);
}

// ============================================================================
// RelayServer
// ============================================================================

RelayServer::RelayServer(RelayConfig config,
                         std::shared_ptr<AdmissionGate> gate,
                         std::shared_ptr<TicketExchange> exchange)
    : config_(std::move(config))
    , api_(config_.proxmox)
    , ticket_store_(config_.tickets.retention)
    , registry_(config_.relay.max_sessions)
    , connector_(config_)
    , gate_(std::move(gate))
    , exchange_(std::move(exchange)) {
    if (!gate_) {
        if (config_.auth.mode == "disabled") {
            NLOG_WARN(log::ADMISSION_LOGGER,
                      "RelayServer: Operator authentication is DISABLED, every caller is an admin");
            gate_ = std::make_shared<OpenAdmissionGate>();
        } else {
            gate_ = std::make_shared<TokenAdmissionGate>(config_.auth.jwt_secret, api_,
                                                         config_.auth.owner_tag_prefix,
                                                         config_.auth.admin_role);
        }
    }
    if (!exchange_) {
        exchange_ = std::make_shared<ProxmoxTicketExchange>(api_, config_.tickets.ttl);
    }
}

RelayServer::~RelayServer() {
    if (acceptor_ && acceptor_->is_open()) {
        beast::error_code ec;
        acceptor_->close(ec);
    }
}

void RelayServer::start(IOContextPool& pool) {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    pool_ = &pool;
    auto& ioc = pool.get_io_context(0);

    try {
        tcp::endpoint endpoint(net::ip::make_address(config_.server.bind_address), config_.server.port);

        acceptor_ = std::make_unique<tcp::acceptor>(ioc);
        acceptor_->open(endpoint.protocol());
        acceptor_->set_option(net::socket_base::reuse_address(true));
        acceptor_->bind(endpoint);
        acceptor_->listen(net::socket_base::max_listen_connections);
        local_port_.store(acceptor_->local_endpoint().port(), std::memory_order_release);
    } catch (const std::exception& e) {
        running_.store(false, std::memory_order_release);
        NLOG_ERROR(log::HTTP_LOGGER, "RelayServer: Failed to listen on {}:{}: {}",
                   config_.server.bind_address, config_.server.port, e.what());
        throw;
    }

    sweep_timer_ = std::make_unique<net::steady_timer>(ioc);

    auto self = shared_from_this();
    net::co_spawn(ioc,
        [self]() -> net::awaitable<void> {
            co_await self->accept_loop();
        },
        [](std::exception_ptr ep) {
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    NLOG_ERROR(log::HTTP_LOGGER, "RelayServer: Accept loop exception: {}", e.what());
                }
            }
        });

    net::co_spawn(ioc,
        [self]() -> net::awaitable<void> {
            co_await self->sweep_loop();
        },
        [](std::exception_ptr ep) {
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    NLOG_ERROR(log::TICKET_LOGGER, "RelayServer: Ticket sweep exception: {}", e.what());
                }
            }
        });

    NLOG_INFO(log::HTTP_LOGGER, "RelayServer: Listening on {}:{} ({} threads, handshake={})",
              config_.server.bind_address, local_port(), pool.size(),
              handshake_mode_name(config_.relay.handshake));
}

void RelayServer::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }

    if (acceptor_) {
        // Acceptor and timer belong to io_context 0
        net::post(acceptor_->get_executor(), [self = shared_from_this()]() {
            beast::error_code ec;
            self->acceptor_->close(ec);
            if (self->sweep_timer_) {
                self->sweep_timer_->cancel();
            }
        });
    }

    auto cancelled = registry_.shutdown(RelayError::SHUTTING_DOWN);
    NLOG_INFO(log::HTTP_LOGGER, "RelayServer: Stopped, {} sessions asked to close", cancelled);
}

net::awaitable<void> RelayServer::accept_loop() {
    while (running_.load(std::memory_order_acquire)) {
        try {
            auto& target_ioc = pool_->get_io_context();

            tcp::socket socket(target_ioc);
            co_await acceptor_->async_accept(socket, net::use_awaitable);

            stats_.connections_accepted.fetch_add(1, std::memory_order_relaxed);

            beast::error_code ec;
            auto remote = socket.remote_endpoint(ec);
            NLOG_DEBUG(log::HTTP_LOGGER, "RelayServer: Accepted connection from {}",
                       ec ? std::string("?") : remote.address().to_string());

            // The connection lives on the io_context its socket was created on
            auto executor = socket.get_executor();
            net::co_spawn(executor,
                [self = shared_from_this(), socket = std::move(socket)]() mutable -> net::awaitable<void> {
                    co_await self->handle_connection(std::move(socket));
                },
                [](std::exception_ptr ep) {
                    if (ep) {
                        try {
                            std::rethrow_exception(ep);
                        } catch (const std::exception& e) {
                            NLOG_ERROR(log::HTTP_LOGGER, "RelayServer: Connection handler exception: {}", e.what());
                        }
                    }
                });

        } catch (const boost::system::system_error& e) {
            if (e.code() == net::error::operation_aborted) {
                break;
            }
            NLOG_WARN(log::HTTP_LOGGER, "RelayServer: Accept error: {}", e.what());
        }
    }
    NLOG_DEBUG(log::HTTP_LOGGER, "RelayServer: Accept loop finished");
}

net::awaitable<void> RelayServer::sweep_loop() {
    while (running_.load(std::memory_order_acquire)) {
        sweep_timer_->expires_after(config_.tickets.sweep_interval);

        beast::error_code ec;
        co_await sweep_timer_->async_wait(net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            break;
        }

        ticket_store_.sweep();
    }
}

// ============================================================================
// Connection Handling
// ============================================================================

net::awaitable<void> RelayServer::handle_connection(tcp::socket socket) {
    beast::tcp_stream stream(std::move(socket));
    beast::flat_buffer buffer;

    for (;;) {
        HttpRequest req;
        stream.expires_after(HTTP_READ_TIMEOUT);

        beast::error_code ec;
        co_await http::async_read(stream, buffer, req, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            if (ec != http::error::end_of_stream && ec != net::error::operation_aborted) {
                NLOG_DEBUG(log::HTTP_LOGGER, "RelayServer: Read failed: {}", ec.message());
            }
            break;
        }

        auto target = urls::parse_origin_form(req.target());
        if (!target) {
            auto res = make_error_response(RelayError::BAD_REQUEST, "malformed request target");
            co_await http::async_write(stream, res, net::redirect_error(net::use_awaitable, ec));
            break;
        }

        if (websocket::is_upgrade(req)) {
            auto segments = path_segments(*target);
            if (segments.size() == 4 && segments[0] == "shell" && segments[1] == "ws") {
                auto params = target->params();
                ConsoleRequest console;
                console.node = segments[2];
                console.resource_id = segments[3];
                console.resource_type = query_param(params, "resource_type");
                console.ticket = query_param(params, "ticket");
                console.port = query_param(params, "port");
                console.token = query_param(params, "token");

                co_await handle_console(std::move(stream), std::move(req), std::move(console));
                co_return;
            }

            NLOG_DEBUG(log::HTTP_LOGGER, "RelayServer: Upgrade on unknown path {}", std::string(req.target()));
            auto res = make_error_response(http::status::not_found, "not_found", "no such endpoint");
            co_await http::async_write(stream, res, net::redirect_error(net::use_awaitable, ec));
            break;
        }

        auto res = co_await handle_http(req, *target);
        res.keep_alive(req.keep_alive());

        co_await http::async_write(stream, res, net::redirect_error(net::use_awaitable, ec));
        if (ec || !res.keep_alive()) {
            break;
        }
    }

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

net::awaitable<HttpResponse> RelayServer::handle_http(const HttpRequest& req, urls::url_view target) {
    auto segments = path_segments(target);
    auto params = target.params();
    const auto method = req.method();

    NLOG_DEBUG(log::HTTP_LOGGER, "RelayServer: {} {}",
               std::string(req.method_string()), std::string(req.target()));

    if (segments.size() == 1 && segments[0] == "healthz" && method == http::verb::get) {
        co_return handle_health();
    }

    if (!segments.empty() && segments[0] == "shell") {
        if (segments.size() == 4 && segments[1] == "ticket" && method == http::verb::get) {
            co_return co_await handle_ticket(req, segments[2], segments[3], params);
        }
        if (segments.size() == 2 && segments[1] == "sessions" && method == http::verb::get) {
            co_return handle_list_sessions(req, params);
        }
        if (segments.size() == 3 && segments[1] == "sessions" && method == http::verb::delete_) {
            co_return handle_close_session(req, segments[2], params);
        }
    }

    co_return make_error_response(http::status::not_found, "not_found", "no such endpoint");
}

std::expected<OperatorIdentity, RelayError>
RelayServer::authenticate(const HttpRequest& req, std::string_view query_token) const {
    auto header = req.find(http::field::authorization);
    if (header != req.end()) {
        auto bearer = bearer_from_header(std::string_view(header->value().data(), header->value().size()));
        if (!bearer.empty()) {
            return gate_->authenticate(bearer);
        }
    }
    return gate_->authenticate(query_token);
}

net::awaitable<HttpResponse> RelayServer::handle_ticket(const HttpRequest& req, const std::string& node,
                                                        const std::string& id, urls::params_view params) {
    auto descriptor = parse_descriptor(node, id, query_param(params, "resource_type"));
    if (!descriptor) {
        co_return make_error_response(descriptor.error(), "invalid resource");
    }

    auto requester = authenticate(req, query_param(params, "token"));
    if (!requester) {
        co_return make_error_response(requester.error());
    }

    auto admitted = co_await gate_->admit(*requester, *descriptor);
    if (!admitted) {
        NLOG_INFO(log::ADMISSION_LOGGER, "RelayServer: {} denied ticket for {}: {}",
                  requester->subject, descriptor->to_string(), relay_error_name(admitted.error()));
        co_return make_error_response(admitted.error());
    }

    auto ticket = co_await exchange_->mint(*descriptor, *requester);
    if (!ticket) {
        co_return make_error_response(ticket.error());
    }
    stats_.tickets_minted.fetch_add(1, std::memory_order_relaxed);

    json::object j;
    j["ticket"] = ticket->value;
    j["port"] = ticket->target_port;
    j["node"] = descriptor->node;
    j["vmid"] = descriptor->resource_id;
    j["resource_type"] = std::string(resource_kind_path(descriptor->kind));
    j["expires_at"] = to_unix_seconds(ticket->expires_at);

    ticket_store_.remember(std::move(*ticket));
    co_return make_json_response(http::status::ok, json::serialize(j));
}

HttpResponse RelayServer::handle_list_sessions(const HttpRequest& req, urls::params_view params) {
    auto requester = authenticate(req, query_param(params, "token"));
    if (!requester) {
        return make_error_response(requester.error());
    }
    if (!requester->is_admin()) {
        return make_error_response(http::status::forbidden, "forbidden", "admin role required");
    }

    json::array sessions;
    for (const auto& info : registry_.snapshot()) {
        sessions.push_back(session_to_json(info));
    }
    return make_json_response(http::status::ok, json::serialize(sessions));
}

HttpResponse RelayServer::handle_close_session(const HttpRequest& req, const std::string& id,
                                               urls::params_view params) {
    auto requester = authenticate(req, query_param(params, "token"));
    if (!requester) {
        return make_error_response(requester.error());
    }
    if (!requester->is_admin()) {
        return make_error_response(http::status::forbidden, "forbidden", "admin role required");
    }

    if (!registry_.cancel(id, RelayError::FORCED_CLOSE)) {
        return make_error_response(http::status::not_found, "not_found", "no such session");
    }

    NLOG_INFO(log::RELAY_LOGGER, "RelayServer: Session {} force-closed by {}", id, requester->subject);
    json::object j;
    j["id"] = id;
    j["status"] = "closing";
    return make_json_response(http::status::accepted, json::serialize(j));
}

HttpResponse RelayServer::handle_health() const {
    json::object j;
    j["status"] = "ok";
    j["sessions"] = registry_.size();
    j["pending_tickets"] = ticket_store_.size();
    return make_json_response(http::status::ok, json::serialize(j));
}

// ============================================================================
// Relay Connection
// ============================================================================

net::awaitable<void> RelayServer::handle_console(beast::tcp_stream stream, HttpRequest req,
                                                 ConsoleRequest console) {
    stats_.relay_requests.fetch_add(1, std::memory_order_relaxed);

    // Accept unconditionally so every rejection reaches the terminal as a close code
    stream.expires_never();
    ClientStream ws(std::move(stream));
    ws.set_option(websocket::stream_base::timeout{config_.relay.teardown_timeout,
                                                  websocket::stream_base::none(), false});
    ws.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, SERVER_NAME);
    }));

    beast::error_code ec;
    co_await ws.async_accept(req, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        NLOG_DEBUG(log::RELAY_LOGGER, "RelayServer: WebSocket accept failed: {}", ec.message());
        co_return;
    }

    auto count_rejection = [this]() {
        stats_.relay_rejections.fetch_add(1, std::memory_order_relaxed);
    };

    auto descriptor = parse_descriptor(console.node, console.resource_id, console.resource_type);
    if (!descriptor) {
        count_rejection();
        co_await reject(ws, descriptor.error(), "invalid resource");
        co_return;
    }

    uint16_t port = 0;
    if (!console.ticket.empty()) {
        auto parsed = parse_port(console.port);
        if (!parsed) {
            count_rejection();
            co_await reject(ws, parsed.error(), console.port.empty() ? "port is required" : "invalid port");
            co_return;
        }
        port = *parsed;
    }

    auto reservation = registry_.try_reserve();
    if (!reservation) {
        auto error = registry_.accepting() ? RelayError::SESSION_LIMIT_EXCEEDED : RelayError::SHUTTING_DOWN;
        count_rejection();
        co_await reject(ws, error);
        co_return;
    }

    auto requester = authenticate(req, console.token);
    if (!requester) {
        count_rejection();
        co_await reject(ws, requester.error(), "authentication required");
        co_return;
    }

    auto admitted = co_await gate_->admit(*requester, *descriptor);
    if (!admitted) {
        count_rejection();
        co_await reject(ws, admitted.error(), "access denied");
        co_return;
    }

    ConsoleTicket ticket;
    if (!console.ticket.empty()) {
        auto claimed = ticket_store_.claim(console.ticket, port, *descriptor, *requester);
        if (!claimed) {
            count_rejection();
            if (claimed.error() == RelayError::UNAUTHORIZED) {
                co_await reject(ws, RelayError::UNAUTHORIZED, "ticket issued to another operator");
            } else {
                co_await reject(ws, claimed.error());
            }
            co_return;
        }
        ticket = std::move(*claimed);
    } else {
        auto minted = co_await exchange_->mint(*descriptor, *requester);
        if (!minted) {
            count_rejection();
            co_await reject(ws, minted.error());
            co_return;
        }
        stats_.tickets_minted.fetch_add(1, std::memory_order_relaxed);
        ticket = std::move(*minted);
    }

    auto session = std::make_shared<ConsoleSession>(std::move(ws), *descriptor, *requester, registry_,
                                                    std::move(*reservation), config_.relay);
    co_await session->run(connector_, std::move(ticket));
}

} // namespace shellrelay
