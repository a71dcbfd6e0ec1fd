#include <gtest/gtest.h>
#include "server/relay_server.hpp"
#include "server/admission_gate.hpp"
#include "server/ticket_exchange.hpp"
#include "test_helpers.hpp"

#include <boost/json.hpp>

using namespace shellrelay;
using namespace shellrelay::test;

namespace {

// Mints predictable tickets without a control plane
class RecordingExchange : public TicketExchange {
public:
    net::awaitable<std::expected<ConsoleTicket, RelayError>>
    mint(const ResourceDescriptor& target, const OperatorIdentity& requester) override {
        auto n = calls_.fetch_add(1) + 1;
        if (failure) {
            co_return std::unexpected(*failure);
        }
        co_return make_ticket("PVEVNC:minted-" + std::to_string(n), target, requester.subject);
    }

    static ConsoleTicket make_ticket(const std::string& value, const ResourceDescriptor& target,
                                     const std::string& subject,
                                     TimePoint issued_at = Clock::now()) {
        ConsoleTicket ticket;
        ticket.value = value;
        ticket.target_port = 5900;
        ticket.issued_for = target;
        ticket.issued_to = subject;
        ticket.upstream_user = "root@pam";
        ticket.issued_at = issued_at;
        ticket.expires_at = issued_at + std::chrono::seconds(30);
        return ticket;
    }

    int calls() const { return calls_.load(); }

    std::optional<RelayError> failure;

private:
    std::atomic<int> calls_{0};
};

std::shared_ptr<StaticAdmissionGate> make_gate() {
    return std::make_shared<StaticAdmissionGate>(
        [](std::string_view bearer) -> std::expected<OperatorIdentity, RelayError> {
            if (bearer == "alice" || bearer == "bob") {
                return OperatorIdentity{std::string(bearer), "user", "", false};
            }
            if (bearer == "root") {
                return OperatorIdentity{"root", "admin", "", true};
            }
            return std::unexpected(RelayError::UNAUTHORIZED);
        },
        [](const OperatorIdentity& who, const ResourceDescriptor& target) {
            // VM 666 belongs to nobody
            return who.is_admin() || target.resource_id != 666;
        });
}

// The upstream shell: answers "ls\n" like a terminal would, echoes everything else
std::optional<FakeConsole::Frame> shell_responder(const FakeConsole::Frame& frame) {
    if (frame.data == "ls\n") {
        return FakeConsole::Frame{"file.txt\n", frame.binary};
    }
    return frame;
}

const ResourceDescriptor VM101{"n1", ResourceKind::Vm, 101};

} // anonymous namespace

class RelayServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        console_.set_responder(shell_responder);

        config_.server.bind_address = "127.0.0.1";
        config_.server.port = 0;
        config_.proxmox.host = "127.0.0.1";
        config_.proxmox.api_port = console_.port();
        config_.proxmox.tls = false;
        config_.relay.connect_timeout = std::chrono::milliseconds(2000);
        config_.relay.teardown_timeout = std::chrono::milliseconds(500);

        exchange_ = std::make_shared<RecordingExchange>();
        gate_ = make_gate();
    }

    void TearDown() override {
        if (server_) {
            server_->stop();
        }
        if (pool_) {
            pool_->stop();
            pool_->join();
        }
        server_.reset();
        pool_.reset();
        console_.stop();
    }

    // Tests tweak config_ first, then start
    void start() {
        console_.start();
        pool_ = std::make_unique<IOContextPool>(2);
        server_ = std::make_shared<RelayServer>(config_, gate_, exchange_);
        server_->start(*pool_);
        pool_->start();
    }

    uint16_t port() const { return server_->local_port(); }

    static std::string ws_path(const std::string& node, const std::string& id, const std::string& query = {}) {
        auto path = "/shell/ws/" + node + "/" + id;
        if (!query.empty()) {
            path += "?" + query;
        }
        return path;
    }

    void remember(const ConsoleTicket& ticket) { server_->ticket_store().remember(ticket); }

    FakeConsole console_;
    RelayConfig config_;
    std::shared_ptr<RecordingExchange> exchange_;
    std::shared_ptr<StaticAdmissionGate> gate_;
    std::unique_ptr<IOContextPool> pool_;
    std::shared_ptr<RelayServer> server_;
};

// ============================================================================
// Relay round trips
// ============================================================================

TEST_F(RelayServerTest, CommandOutputReachesTerminal) {
    start();
    auto ticket = RecordingExchange::make_ticket("PVEVNC:t1", VM101, "alice");
    remember(ticket);

    TestClient client;
    ASSERT_FALSE(client.connect(port(), ws_path("n1", "101", "resource_type=qemu&ticket=PVEVNC%3At1&port=5900"),
                                "alice"));
    ASSERT_FALSE(client.send("ls\n"));

    auto reply = client.read();
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->data, "file.txt\n");
    EXPECT_FALSE(reply->binary);

    auto attempts = console_.attempts();
    ASSERT_EQ(attempts.size(), 1u);
    EXPECT_EQ(attempts[0].target,
              "/api2/json/nodes/n1/qemu/101/vncwebsocket?port=5900&vncticket=PVEVNC%3At1");
    EXPECT_EQ(attempts[0].cookie, "PVEAuthCookie=PVEVNC:t1");
    EXPECT_EQ(exchange_->calls(), 0);

    EXPECT_EQ(console_.frames(), (std::vector<FakeConsole::Frame>{{"ls\n", false}}));
}

TEST_F(RelayServerTest, MintsTicketWhenNoneGiven) {
    start();

    TestClient client;
    ASSERT_FALSE(client.connect(port(), ws_path("n1", "200", "resource_type=lxc&token=bob")));
    ASSERT_FALSE(client.send("ls\n"));
    auto reply = client.read();
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->data, "file.txt\n");

    EXPECT_EQ(exchange_->calls(), 1);
    auto attempts = console_.attempts();
    ASSERT_EQ(attempts.size(), 1u);
    EXPECT_EQ(attempts[0].target,
              "/api2/json/nodes/n1/lxc/200/vncwebsocket?port=5900&vncticket=PVEVNC%3Aminted-1");
}

TEST_F(RelayServerTest, PreservesFrameTypesAndOrder) {
    start();

    TestClient client;
    ASSERT_FALSE(client.connect(port(), ws_path("n1", "101"), "alice"));

    const std::string binary_payload("\x00\x01\xfe\xff", 4);
    ASSERT_FALSE(client.send(binary_payload, true));
    auto binary = client.read();
    ASSERT_TRUE(binary.has_value());
    EXPECT_TRUE(binary->binary);
    EXPECT_EQ(binary->data, binary_payload);

    ASSERT_FALSE(client.send("echo hi\n", false));
    auto text = client.read();
    ASSERT_TRUE(text.has_value());
    EXPECT_FALSE(text->binary);
    EXPECT_EQ(text->data, "echo hi\n");

    for (int i = 0; i < 20; ++i) {
        ASSERT_FALSE(client.send("k" + std::to_string(i)));
    }
    for (int i = 0; i < 20; ++i) {
        auto echoed = client.read();
        ASSERT_TRUE(echoed.has_value());
        EXPECT_EQ(echoed->data, "k" + std::to_string(i));
    }

    auto frames = console_.frames();
    ASSERT_EQ(frames.size(), 22u);
    EXPECT_EQ(frames[0], (FakeConsole::Frame{binary_payload, true}));
    EXPECT_EQ(frames[1], (FakeConsole::Frame{"echo hi\n", false}));
}

TEST_F(RelayServerTest, UpstreamPushReachesTerminal) {
    start();

    TestClient client;
    ASSERT_FALSE(client.connect(port(), ws_path("n1", "101"), "alice"));
    ASSERT_TRUE(wait_until([&]() { return console_.open_connections() == 1; }));

    console_.broadcast({"\x1b[2J", false});
    auto pushed = client.read();
    ASSERT_TRUE(pushed.has_value());
    EXPECT_EQ(pushed->data, "\x1b[2J");
}

TEST_F(RelayServerTest, SessionsAreIsolated) {
    start();

    TestClient a;
    TestClient b;
    ASSERT_FALSE(a.connect(port(), ws_path("n1", "101"), "alice"));
    ASSERT_FALSE(b.connect(port(), ws_path("n1", "102"), "bob"));
    ASSERT_TRUE(wait_until([&]() { return server_->registry().size() == 2; }));

    ASSERT_FALSE(a.send("from-a"));
    ASSERT_FALSE(b.send("from-b"));

    auto ra = a.read();
    auto rb = b.read();
    ASSERT_TRUE(ra.has_value());
    ASSERT_TRUE(rb.has_value());
    EXPECT_EQ(ra->data, "from-a");
    EXPECT_EQ(rb->data, "from-b");

    // Closing one leaves the other running
    a.close();
    ASSERT_TRUE(wait_until([&]() { return server_->registry().size() == 1; }));
    ASSERT_FALSE(b.send("still-here"));
    auto again = b.read();
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->data, "still-here");
}

TEST_F(RelayServerTest, RegisteredSessionIsAlreadyOpen) {
    start();

    TestClient client;
    ASSERT_FALSE(client.connect(port(), ws_path("n1", "101"), "alice"));
    ASSERT_TRUE(wait_until([&]() { return server_->registry().size() == 1; }));

    auto sessions = server_->registry().snapshot();
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].state, SessionState::OPEN);
}

TEST_F(RelayServerTest, UpstreamDropFailsOnlyItsSession) {
    start();

    TestClient a;
    TestClient b;
    ASSERT_FALSE(a.connect(port(), ws_path("n1", "101"), "alice"));
    ASSERT_FALSE(b.connect(port(), ws_path("n1", "102"), "bob"));
    ASSERT_TRUE(wait_until([&]() { return console_.open_connections() == 2; }));

    console_.abort_connection("/qemu/101/");

    EXPECT_EQ(a.read_close_code(), close_codes::UPSTREAM_UNREACHABLE);
    EXPECT_EQ(a.close_reason(), "upstream connection lost");
    ASSERT_TRUE(wait_until([&]() { return server_->registry().size() == 1; }));

    ASSERT_FALSE(b.send("ls\n"));
    auto output = b.read();
    ASSERT_TRUE(output.has_value());
    EXPECT_EQ(output->data, "file.txt\n");
}

// ============================================================================
// Tickets
// ============================================================================

TEST_F(RelayServerTest, ExpiredTicketNeverReachesUpstream) {
    start();
    auto ticket = RecordingExchange::make_ticket("PVEVNC:old", VM101, "alice",
                                                 Clock::now() - std::chrono::seconds(60));
    remember(ticket);

    TestClient client;
    ASSERT_FALSE(client.connect(port(), ws_path("n1", "101", "ticket=PVEVNC%3Aold&port=5900"), "alice"));
    EXPECT_EQ(client.read_close_code(), close_codes::AUTH_FAILED);
    EXPECT_EQ(client.close_reason(), "ticket expired");

    EXPECT_TRUE(console_.attempts().empty());
    EXPECT_EQ(exchange_->calls(), 0);
    EXPECT_EQ(server_->registry().size(), 0u);
}

TEST_F(RelayServerTest, TicketIsSingleUse) {
    start();
    remember(RecordingExchange::make_ticket("PVEVNC:once", VM101, "alice"));
    const auto path = ws_path("n1", "101", "ticket=PVEVNC%3Aonce&port=5900");

    TestClient first;
    ASSERT_FALSE(first.connect(port(), path, "alice"));
    ASSERT_FALSE(first.send("ls\n"));
    ASSERT_TRUE(first.read().has_value());

    TestClient second;
    ASSERT_FALSE(second.connect(port(), path, "alice"));
    EXPECT_EQ(second.read_close_code(), close_codes::AUTH_FAILED);
    EXPECT_EQ(second.close_reason(), "ticket invalid");

    EXPECT_EQ(console_.attempts().size(), 1u);
}

TEST_F(RelayServerTest, TicketForAnotherTargetIsRefused) {
    start();
    remember(RecordingExchange::make_ticket("PVEVNC:vm101", VM101, "alice"));

    TestClient wrong_vm;
    ASSERT_FALSE(wrong_vm.connect(port(), ws_path("n1", "102", "ticket=PVEVNC%3Avm101&port=5900"), "alice"));
    EXPECT_EQ(wrong_vm.read_close_code(), close_codes::AUTH_FAILED);

    TestClient wrong_port;
    ASSERT_FALSE(wrong_port.connect(port(), ws_path("n1", "101", "ticket=PVEVNC%3Avm101&port=5901"), "alice"));
    EXPECT_EQ(wrong_port.read_close_code(), close_codes::AUTH_FAILED);

    EXPECT_TRUE(console_.attempts().empty());
    EXPECT_EQ(server_->ticket_store().size(), 1u);
}

TEST_F(RelayServerTest, TicketIssuedToAnotherOperator) {
    start();
    remember(RecordingExchange::make_ticket("PVEVNC:bobs", VM101, "bob"));

    const auto path = ws_path("n1", "101", "ticket=PVEVNC%3Abobs&port=5900");

    TestClient alice;
    ASSERT_FALSE(alice.connect(port(), path, "alice"));
    EXPECT_EQ(alice.read_close_code(), close_codes::UNAUTHORIZED);
    EXPECT_EQ(alice.close_reason(), "ticket issued to another operator");
    EXPECT_TRUE(console_.attempts().empty());
    EXPECT_EQ(server_->ticket_store().size(), 1u);

    // The owner can still use it
    TestClient bob;
    ASSERT_FALSE(bob.connect(port(), path, "bob"));
    ASSERT_FALSE(bob.send("ls\n"));
    auto output = bob.read();
    ASSERT_TRUE(output.has_value());
    EXPECT_EQ(output->data, "file.txt\n");
    EXPECT_EQ(console_.attempts().size(), 1u);
    EXPECT_EQ(server_->ticket_store().size(), 0u);
}

TEST_F(RelayServerTest, TicketEndpointMintsAndRecords) {
    start();

    auto res = http_call(port(), http::verb::get, "/shell/ticket/n1/200?resource_type=lxc", "alice");
    ASSERT_EQ(res.result(), http::status::ok);
    auto body = boost::json::parse(res.body()).as_object();
    EXPECT_EQ(std::string(body.at("ticket").as_string().c_str()), "PVEVNC:minted-1");
    EXPECT_EQ(body.at("port").to_number<int64_t>(), 5900);
    EXPECT_EQ(std::string(body.at("node").as_string().c_str()), "n1");
    EXPECT_EQ(body.at("vmid").to_number<int64_t>(), 200);
    EXPECT_EQ(std::string(body.at("resource_type").as_string().c_str()), "lxc");
    EXPECT_GT(body.at("expires_at").to_number<int64_t>(), to_unix_seconds(Clock::now()));
    EXPECT_EQ(server_->ticket_store().size(), 1u);

    TestClient client;
    ASSERT_FALSE(client.connect(port(), ws_path("n1", "200", "resource_type=lxc&ticket=PVEVNC%3Aminted-1&port=5900"),
                                "alice"));
    ASSERT_FALSE(client.send("ls\n"));
    ASSERT_TRUE(client.read().has_value());
    EXPECT_EQ(server_->ticket_store().size(), 0u);
}

TEST_F(RelayServerTest, TicketEndpointErrors) {
    start();

    auto anonymous = http_call(port(), http::verb::get, "/shell/ticket/n1/101");
    EXPECT_EQ(anonymous.result(), http::status::unauthorized);

    auto bad_kind = http_call(port(), http::verb::get, "/shell/ticket/n1/101?resource_type=docker", "alice");
    EXPECT_EQ(bad_kind.result(), http::status::bad_request);

    auto denied = http_call(port(), http::verb::get, "/shell/ticket/n1/666", "alice");
    EXPECT_EQ(denied.result(), http::status::unauthorized);
    auto denied_body = boost::json::parse(denied.body()).as_object();
    EXPECT_EQ(std::string(denied_body.at("error").as_string().c_str()), "unauthorized");

    exchange_->failure = RelayError::RESOURCE_NOT_RUNNING;
    auto stopped = http_call(port(), http::verb::get, "/shell/ticket/n1/101", "alice");
    EXPECT_EQ(stopped.result(), http::status::conflict);

    EXPECT_EQ(server_->ticket_store().size(), 0u);
}

// ============================================================================
// Admission
// ============================================================================

TEST_F(RelayServerTest, MalformedRequestsAreBadRequest) {
    start();

    TestClient bad_id;
    ASSERT_FALSE(bad_id.connect(port(), ws_path("n1", "abc"), "alice"));
    EXPECT_EQ(bad_id.read_close_code(), close_codes::BAD_REQUEST);

    TestClient bad_kind;
    ASSERT_FALSE(bad_kind.connect(port(), ws_path("n1", "101", "resource_type=docker"), "alice"));
    EXPECT_EQ(bad_kind.read_close_code(), close_codes::BAD_REQUEST);

    TestClient missing_port;
    ASSERT_FALSE(missing_port.connect(port(), ws_path("n1", "101", "ticket=abc"), "alice"));
    EXPECT_EQ(missing_port.read_close_code(), close_codes::BAD_REQUEST);
    EXPECT_EQ(missing_port.close_reason(), "port is required");

    EXPECT_TRUE(console_.attempts().empty());
    EXPECT_EQ(gate_->admit_calls(), 0u);
}

TEST_F(RelayServerTest, UnauthenticatedOrDeniedNeverConnects) {
    start();

    TestClient anonymous;
    ASSERT_FALSE(anonymous.connect(port(), ws_path("n1", "101")));
    EXPECT_EQ(anonymous.read_close_code(), close_codes::UNAUTHORIZED);

    TestClient forged;
    ASSERT_FALSE(forged.connect(port(), ws_path("n1", "101", "token=eve")));
    EXPECT_EQ(forged.read_close_code(), close_codes::UNAUTHORIZED);

    TestClient not_owner;
    ASSERT_FALSE(not_owner.connect(port(), ws_path("n1", "666"), "alice"));
    EXPECT_EQ(not_owner.read_close_code(), close_codes::UNAUTHORIZED);

    EXPECT_TRUE(console_.attempts().empty());
    EXPECT_EQ(exchange_->calls(), 0);
}

TEST_F(RelayServerTest, MintFailureIsReported) {
    exchange_->failure = RelayError::RESOURCE_NOT_FOUND;
    start();

    TestClient client;
    ASSERT_FALSE(client.connect(port(), ws_path("n1", "999"), "alice"));
    EXPECT_EQ(client.read_close_code(), close_codes::NOT_FOUND);
    EXPECT_TRUE(console_.attempts().empty());
}

TEST_F(RelayServerTest, SessionLimit) {
    config_.relay.max_sessions = 1;
    start();

    TestClient first;
    ASSERT_FALSE(first.connect(port(), ws_path("n1", "101"), "alice"));
    ASSERT_TRUE(wait_until([&]() { return server_->registry().size() == 1; }));

    TestClient second;
    ASSERT_FALSE(second.connect(port(), ws_path("n1", "102"), "alice"));
    EXPECT_EQ(second.read_close_code(), close_codes::SESSION_LIMIT);
    EXPECT_EQ(console_.attempts().size(), 1u);

    first.close();
    ASSERT_TRUE(wait_until([&]() { return server_->registry().reserved() == 0; }));

    TestClient third;
    ASSERT_FALSE(third.connect(port(), ws_path("n1", "102"), "alice"));
    ASSERT_FALSE(third.send("ls\n"));
    EXPECT_TRUE(third.read().has_value());
}

// ============================================================================
// Upstream failures
// ============================================================================

TEST_F(RelayServerTest, UpstreamRejectsTicket) {
    console_.reject_upgrades_with(http::status::unauthorized);
    start();

    TestClient client;
    ASSERT_FALSE(client.connect(port(), ws_path("n1", "101"), "alice"));
    EXPECT_EQ(client.read_close_code(), close_codes::AUTH_FAILED);
    EXPECT_EQ(client.close_reason(), "upstream rejected ticket");
    EXPECT_EQ(console_.attempts().size(), 1u);
    EXPECT_EQ(server_->registry().reserved(), 0u);
}

TEST_F(RelayServerTest, UpstreamNonConformingReplyIsUnreachable) {
    console_.reject_upgrades_with(http::status::ok);
    start();

    TestClient client;
    ASSERT_FALSE(client.connect(port(), ws_path("n1", "101"), "alice"));
    EXPECT_EQ(client.read_close_code(), close_codes::UPSTREAM_UNREACHABLE);
}

TEST_F(RelayServerTest, UpstreamUnreachable) {
    uint16_t dead_port = 0;
    {
        net::io_context ioc;
        tcp::acceptor scratch(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        dead_port = scratch.local_endpoint().port();
    }
    config_.proxmox.api_port = dead_port;
    start();

    TestClient client;
    ASSERT_FALSE(client.connect(port(), ws_path("n1", "101"), "alice"));
    EXPECT_EQ(client.read_close_code(), close_codes::UPSTREAM_UNREACHABLE);
    EXPECT_EQ(server_->registry().size(), 0u);
}

TEST_F(RelayServerTest, TermproxyLogin) {
    config_.relay.handshake = HandshakeMode::TERMPROXY;
    console_.expect_login("root@pam:PVEVNC:minted-1\n");
    start();

    TestClient client;
    ASSERT_FALSE(client.connect(port(), ws_path("n1", "101"), "alice"));
    ASSERT_FALSE(client.send("ls\n"));
    auto reply = client.read();
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->data, "file.txt\n");
}

TEST_F(RelayServerTest, TermproxyLoginRefused) {
    config_.relay.handshake = HandshakeMode::TERMPROXY;
    console_.expect_login("someone-else\n");
    start();

    TestClient client;
    ASSERT_FALSE(client.connect(port(), ws_path("n1", "101"), "alice"));
    EXPECT_EQ(client.read_close_code(), close_codes::AUTH_FAILED);
}

// ============================================================================
// Teardown
// ============================================================================

TEST_F(RelayServerTest, AbruptClientCloseClosesUpstream) {
    start();

    TestClient client;
    ASSERT_FALSE(client.connect(port(), ws_path("n1", "101"), "alice"));
    ASSERT_FALSE(client.send("ls\n"));
    ASSERT_TRUE(client.read().has_value());
    ASSERT_EQ(server_->registry().size(), 1u);

    client.abort();

    EXPECT_TRUE(wait_until([&]() { return console_.closed_connections() == 1; }));
    EXPECT_TRUE(wait_until([&]() { return server_->registry().size() == 0; }));
    EXPECT_EQ(server_->registry().reserved(), 0u);
}

TEST_F(RelayServerTest, ClientCloseIsPropagated) {
    start();

    TestClient client;
    ASSERT_FALSE(client.connect(port(), ws_path("n1", "101"), "alice"));
    ASSERT_TRUE(wait_until([&]() { return console_.open_connections() == 1; }));

    client.close();
    ASSERT_TRUE(wait_until([&]() { return console_.closed_connections() == 1; }));
    EXPECT_EQ(console_.last_close_code(), close_codes::NORMAL);
    EXPECT_TRUE(wait_until([&]() { return server_->registry().size() == 0; }));
}

TEST_F(RelayServerTest, UpstreamCloseIsPropagated) {
    start();

    TestClient client;
    ASSERT_FALSE(client.connect(port(), ws_path("n1", "101"), "alice"));
    ASSERT_TRUE(wait_until([&]() { return console_.open_connections() == 1; }));

    console_.close_all(websocket::close_code::normal);
    EXPECT_EQ(client.read_close_code(), close_codes::NORMAL);
    EXPECT_EQ(client.close_reason(), "upstream closed");
    EXPECT_TRUE(wait_until([&]() { return server_->registry().size() == 0; }));
}

TEST_F(RelayServerTest, IdleTimeout) {
    config_.relay.idle_timeout = std::chrono::seconds(1);
    start();

    TestClient client;
    ASSERT_FALSE(client.connect(port(), ws_path("n1", "101"), "alice"));
    EXPECT_EQ(client.read_close_code(), close_codes::NORMAL);
    EXPECT_EQ(client.close_reason(), "idle timeout");
    EXPECT_TRUE(wait_until([&]() { return console_.closed_connections() == 1; }));
}

TEST_F(RelayServerTest, StopClosesSessionsWithGoingAway) {
    start();

    TestClient client;
    ASSERT_FALSE(client.connect(port(), ws_path("n1", "101"), "alice"));
    ASSERT_TRUE(wait_until([&]() { return server_->registry().size() == 1; }));

    server_->stop();
    EXPECT_EQ(client.read_close_code(), close_codes::GOING_AWAY);
    EXPECT_TRUE(wait_until([&]() { return console_.closed_connections() == 1; }));
    EXPECT_TRUE(wait_until([&]() { return server_->registry().reserved() == 0; }));
}

// ============================================================================
// Administration
// ============================================================================

TEST_F(RelayServerTest, ListAndForceCloseSessions) {
    start();

    TestClient client;
    ASSERT_FALSE(client.connect(port(), ws_path("n1", "101"), "alice"));
    ASSERT_TRUE(wait_until([&]() { return server_->registry().size() == 1; }));
    ASSERT_FALSE(client.send("ls\n"));
    ASSERT_TRUE(client.read().has_value());

    auto forbidden = http_call(port(), http::verb::get, "/shell/sessions", "alice");
    EXPECT_EQ(forbidden.result(), http::status::forbidden);

    auto listed = http_call(port(), http::verb::get, "/shell/sessions", "root");
    ASSERT_EQ(listed.result(), http::status::ok);
    auto sessions = boost::json::parse(listed.body()).as_array();
    ASSERT_EQ(sessions.size(), 1u);
    const auto& session = sessions[0].as_object();
    EXPECT_EQ(std::string(session.at("operator").as_string().c_str()), "alice");
    EXPECT_EQ(std::string(session.at("state").as_string().c_str()), "OPEN");
    EXPECT_EQ(session.at("vmid").to_number<int64_t>(), 101);
    EXPECT_EQ(session.at("bytes_client_to_upstream").to_number<int64_t>(), 3);
    EXPECT_EQ(session.at("bytes_upstream_to_client").to_number<int64_t>(), 9);
    const std::string id = session.at("id").as_string().c_str();

    auto unknown = http_call(port(), http::verb::delete_, "/shell/sessions/nope", "root");
    EXPECT_EQ(unknown.result(), http::status::not_found);

    auto closed = http_call(port(), http::verb::delete_, "/shell/sessions/" + id, "root");
    EXPECT_EQ(closed.result(), http::status::accepted);

    EXPECT_EQ(client.read_close_code(), close_codes::FORCED);
    EXPECT_TRUE(wait_until([&]() { return server_->registry().size() == 0; }));
}

TEST_F(RelayServerTest, HealthAndUnknownRoutes) {
    start();
    remember(RecordingExchange::make_ticket("PVEVNC:pending", VM101, "alice"));

    auto health = http_call(port(), http::verb::get, "/healthz");
    ASSERT_EQ(health.result(), http::status::ok);
    auto body = boost::json::parse(health.body()).as_object();
    EXPECT_EQ(std::string(body.at("status").as_string().c_str()), "ok");
    EXPECT_EQ(body.at("sessions").to_number<int64_t>(), 0);
    EXPECT_EQ(body.at("pending_tickets").to_number<int64_t>(), 1);

    auto missing = http_call(port(), http::verb::get, "/nope");
    EXPECT_EQ(missing.result(), http::status::not_found);

    TestClient client;
    EXPECT_TRUE(client.connect(port(), "/not/a/relay/path", "alice"));
}
