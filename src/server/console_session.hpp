#pragma once

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/types.hpp"
#include "server/session_registry.hpp"
#include "server/session_state.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace shellrelay {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;

class UpstreamChannel;
class UpstreamConnector;

/**
 * ConsoleSession - one operator terminal bridged to one upstream console
 *
 * Owns the accepted client WebSocket and, from CONNECTING on, the upstream
 * channel. Everything except info() and cancel() runs on the executor of
 * the client stream, so the session needs no locks of its own.
 *
 * While OPEN, two pumps copy messages in each direction with the frame type
 * unchanged and a watcher handles cancellation, idle timeout and the
 * teardown deadline. Whichever end condition is observed first decides the
 * close code; both sides are then closed and the session leaves the
 * registry before run() returns.
 */
class ConsoleSession : public SessionHandle,
                       public std::enable_shared_from_this<ConsoleSession> {
public:
    using ClientStream = websocket::stream<beast::tcp_stream>;

    ConsoleSession(ClientStream client,
                   ResourceDescriptor target,
                   OperatorIdentity requester,
                   SessionRegistry& registry,
                   SessionRegistry::Reservation reservation,
                   const RelayConfig::Relay& options);
    ~ConsoleSession() override;

    ConsoleSession(const ConsoleSession&) = delete;
    ConsoleSession& operator=(const ConsoleSession&) = delete;

    // Connects upstream with the ticket, then relays until either side ends.
    // Returns after the session has been removed from the registry.
    net::awaitable<void> run(UpstreamConnector& connector, ConsoleTicket ticket);

    // SessionHandle
    const SessionId& id() const override { return id_; }
    SessionInfo info() const override;
    void cancel(RelayError reason) override;

    SessionState state() const { return state_.load(std::memory_order_acquire); }
    const ResourceDescriptor& target() const { return target_; }

private:
    enum class Side { CLIENT, UPSTREAM, NONE };

    // How the session ended; code/reason go to whichever side is still alive
    struct Outcome {
        uint16_t code{close_codes::NORMAL};
        std::string reason;
        bool error{false};
    };

    bool transition(SessionState to);
    void touch();

    void on_cancel(RelayError reason);
    void begin_teardown(Outcome outcome, Side ended);
    void pump_finished();
    void hard_close();

    Outcome client_ended(const beast::error_code& ec) const;
    Outcome upstream_ended(const beast::error_code& ec) const;
    static Outcome outcome_for(RelayError reason);

    net::awaitable<void> bridge();
    net::awaitable<void> pump_client_to_upstream();
    net::awaitable<void> pump_upstream_to_client();
    net::awaitable<void> watch();
    net::awaitable<void> close_client(websocket::close_reason reason);
    net::awaitable<void> close_upstream(websocket::close_reason reason);
    net::awaitable<void> abort_before_open(RelayError reason);
    void finish();

    const SessionId id_;
    const ResourceDescriptor target_;
    const OperatorIdentity requester_;
    const TimePoint created_at_;
    const RelayConfig::Relay& options_;

    SessionRegistry& registry_;
    std::optional<SessionRegistry::Reservation> reservation_;

    ClientStream client_;
    std::unique_ptr<UpstreamChannel> upstream_;
    net::any_io_executor executor_;

    // Read from other threads via info()
    std::atomic<SessionState> state_{SessionState::ADMITTED};
    std::atomic<uint64_t> bytes_client_to_upstream_{0};
    std::atomic<uint64_t> bytes_upstream_to_client_{0};
    std::atomic<Clock::rep> last_activity_{0};

    // Session executor only
    Outcome outcome_;
    std::optional<RelayError> pending_cancel_;
    bool client_close_started_{false};
    bool upstream_close_started_{false};
    bool hard_closed_{false};
    bool registered_{false};
    int pumps_running_{0};
    std::chrono::steady_clock::time_point last_activity_steady_;
    std::chrono::steady_clock::time_point teardown_deadline_;
    net::steady_timer wake_;
};

} // namespace shellrelay
