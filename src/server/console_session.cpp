#include "server/console_session.hpp"
#include "server/upstream_connector.hpp"
#include "common/log.hpp"

#include <boost/asio/experimental/awaitable_operators.hpp>

namespace shellrelay {

using namespace boost::asio::experimental::awaitable_operators;

namespace {

void log_spawn_exception(const std::string& id, std::exception_ptr ep) {
    if (ep) {
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            NLOG_ERROR(log::SESSION_LOGGER, "Session {}: Close task exception: {}", id, e.what());
        }
    }
}

} // anonymous namespace

ConsoleSession::ConsoleSession(ClientStream client,
                               ResourceDescriptor target,
                               OperatorIdentity requester,
                               SessionRegistry& registry,
                               SessionRegistry::Reservation reservation,
                               const RelayConfig::Relay& options)
    : id_(generate_session_id())
    , target_(std::move(target))
    , requester_(std::move(requester))
    , created_at_(Clock::now())
    , options_(options)
    , registry_(registry)
    , reservation_(std::move(reservation))
    , client_(std::move(client))
    , executor_(client_.get_executor())
    , last_activity_steady_(std::chrono::steady_clock::now())
    , wake_(executor_)
{
    last_activity_.store(created_at_.time_since_epoch().count(), std::memory_order_relaxed);

    client_.read_message_max(options_.max_message_bytes);
    client_.set_option(websocket::stream_base::timeout{
        options_.teardown_timeout,          // close handshake
        websocket::stream_base::none(),     // idle is tracked across both sides
        false
    });
}

ConsoleSession::~ConsoleSession() {
    NLOG_TRACE(log::SESSION_LOGGER, "Session {}: Destroyed", id_);
}

SessionInfo ConsoleSession::info() const {
    SessionInfo info;
    info.id = id_;
    info.descriptor = target_;
    info.operator_subject = requester_.subject;
    info.state = state();
    info.created_at = created_at_;
    info.last_activity_at = TimePoint(Clock::duration(last_activity_.load(std::memory_order_relaxed)));
    info.bytes_client_to_upstream = bytes_client_to_upstream_.load(std::memory_order_relaxed);
    info.bytes_upstream_to_client = bytes_upstream_to_client_.load(std::memory_order_relaxed);
    return info;
}

void ConsoleSession::cancel(RelayError reason) {
    net::post(executor_, [self = shared_from_this(), reason]() {
        self->on_cancel(reason);
    });
}

bool ConsoleSession::transition(SessionState to) {
    auto from = state();
    if (!can_transition(from, to)) {
        NLOG_ERROR(log::SESSION_LOGGER, "Session {} [{}]: Refused transition {} -> {}",
                   id_, target_.to_string(), session_state_name(from), session_state_name(to));
        return false;
    }
    state_.store(to, std::memory_order_release);
    NLOG_DEBUG(log::SESSION_LOGGER, "Session {} [{}]: {} -> {}",
               id_, target_.to_string(), session_state_name(from), session_state_name(to));
    return true;
}

void ConsoleSession::touch() {
    last_activity_steady_ = std::chrono::steady_clock::now();
    last_activity_.store(Clock::now().time_since_epoch().count(), std::memory_order_relaxed);
}

// ============================================================================
// Lifecycle
// ============================================================================

net::awaitable<void> ConsoleSession::run(UpstreamConnector& connector, ConsoleTicket ticket) {
    auto self = shared_from_this();

    NLOG_INFO(log::SESSION_LOGGER, "Session {} [{}]: Admitted for {}",
              id_, target_.to_string(), requester_.subject);

    if (!transition(SessionState::CONNECTING)) {
        co_return;
    }

    auto channel = co_await connector.connect(ticket);
    if (!channel) {
        const auto error = channel.error();
        transition(SessionState::ERRORED);
        NLOG_WARN(log::SESSION_LOGGER, "Session {} [{}]: Upstream connect failed: {}",
                  id_, target_.to_string(), relay_error_name(error));

        client_close_started_ = true;
        beast::error_code ec;
        co_await client_.async_close(make_close_reason(error), net::redirect_error(net::use_awaitable, ec));
        beast::get_lowest_layer(client_).close();
        reservation_.reset();
        co_return;
    }

    upstream_ = std::move(*channel);
    upstream_->configure(options_.max_message_bytes, options_.teardown_timeout);

    if (pending_cancel_) {
        co_await abort_before_open(*pending_cancel_);
        co_return;
    }

    // OPEN before insert: the registry only ever lists sessions that relay
    transition(SessionState::OPEN);
    touch();

    if (!registry_.insert(self)) {
        co_await abort_before_open(registry_.accepting() ? RelayError::INTERNAL_ERROR
                                                         : RelayError::SHUTTING_DOWN);
        co_return;
    }
    registered_ = true;
    NLOG_INFO(log::SESSION_LOGGER, "Session {} [{}]: Open", id_, target_.to_string());

    try {
        co_await bridge();
    } catch (const std::exception& e) {
        NLOG_ERROR(log::SESSION_LOGGER, "Session {} [{}]: Internal error: {}",
                   id_, target_.to_string(), e.what());
        if (state() == SessionState::OPEN) {
            outcome_ = outcome_for(RelayError::INTERNAL_ERROR);
            transition(SessionState::CLOSING);
        }
        outcome_.error = true;
    }

    finish();
}

net::awaitable<void> ConsoleSession::abort_before_open(RelayError reason) {
    outcome_ = outcome_for(reason);
    transition(SessionState::CLOSING);

    const auto close_reason = make_close_reason(reason);
    client_close_started_ = true;
    upstream_close_started_ = true;

    beast::error_code ec;
    co_await client_.async_close(close_reason, net::redirect_error(net::use_awaitable, ec));
    co_await upstream_->async_close(close_reason);

    finish();
}

void ConsoleSession::finish() {
    hard_close();

    transition(outcome_.error ? SessionState::ERRORED : SessionState::CLOSED);

    if (registered_) {
        registry_.remove(id_);
        registered_ = false;
    }
    reservation_.reset();

    NLOG_INFO(log::SESSION_LOGGER, "Session {} [{}]: {} code={} reason='{}' up={}B down={}B",
              id_, target_.to_string(), session_state_name(state()), outcome_.code, outcome_.reason,
              bytes_client_to_upstream_.load(std::memory_order_relaxed),
              bytes_upstream_to_client_.load(std::memory_order_relaxed));
}

void ConsoleSession::hard_close() {
    if (hard_closed_) {
        return;
    }
    hard_closed_ = true;

    beast::error_code ec;
    auto& lowest = beast::get_lowest_layer(client_);
    lowest.socket().shutdown(net::ip::tcp::socket::shutdown_both, ec);
    lowest.close();
    if (upstream_) {
        upstream_->shutdown();
    }
}

// ============================================================================
// Teardown
// ============================================================================

ConsoleSession::Outcome ConsoleSession::outcome_for(RelayError reason) {
    auto close_reason = make_close_reason(reason);
    Outcome outcome;
    outcome.code = static_cast<uint16_t>(close_reason.code);
    outcome.reason = std::string(close_reason.reason.data(), close_reason.reason.size());
    outcome.error = reason != RelayError::FORCED_CLOSE && reason != RelayError::SHUTTING_DOWN;
    return outcome;
}

ConsoleSession::Outcome ConsoleSession::client_ended(const beast::error_code& ec) const {
    if (ec == websocket::error::closed) {
        return {close_codes::NORMAL, "normal closure", false};
    }
    NLOG_DEBUG(log::SESSION_LOGGER, "Session {}: Client connection lost: {}", id_, ec.message());
    return {close_codes::GOING_AWAY, "client disconnected", true};
}

ConsoleSession::Outcome ConsoleSession::upstream_ended(const beast::error_code& ec) const {
    if (ec == websocket::error::closed) {
        return {close_codes::NORMAL, "upstream closed", false};
    }
    NLOG_DEBUG(log::SESSION_LOGGER, "Session {}: Upstream connection lost: {}", id_, ec.message());
    return {close_codes::UPSTREAM_UNREACHABLE, "upstream connection lost", true};
}

void ConsoleSession::on_cancel(RelayError reason) {
    switch (state()) {
        case SessionState::ADMITTED:
        case SessionState::CONNECTING:
            if (!pending_cancel_) {
                pending_cancel_ = reason;
            }
            break;
        case SessionState::OPEN:
            NLOG_INFO(log::SESSION_LOGGER, "Session {} [{}]: Cancelled ({})",
                      id_, target_.to_string(), relay_error_name(reason));
            begin_teardown(outcome_for(reason), Side::NONE);
            break;
        default:
            break;  // Already tearing down
    }
}

void ConsoleSession::begin_teardown(Outcome outcome, Side ended) {
    // First observer wins
    if (state() != SessionState::OPEN) {
        return;
    }

    outcome_ = std::move(outcome);
    transition(SessionState::CLOSING);
    teardown_deadline_ = std::chrono::steady_clock::now() + options_.teardown_timeout;
    wake_.cancel();

    const auto close_reason = make_close_reason(outcome_.code, outcome_.reason);

    if (ended != Side::CLIENT && !client_close_started_) {
        client_close_started_ = true;
        net::co_spawn(
            executor_,
            [self = shared_from_this(), close_reason]() -> net::awaitable<void> {
                co_await self->close_client(close_reason);
            },
            [id = id_](std::exception_ptr ep) { log_spawn_exception(id, ep); });
    }

    if (ended != Side::UPSTREAM && !upstream_close_started_) {
        upstream_close_started_ = true;
        net::co_spawn(
            executor_,
            [self = shared_from_this(), close_reason]() -> net::awaitable<void> {
                co_await self->close_upstream(close_reason);
            },
            [id = id_](std::exception_ptr ep) { log_spawn_exception(id, ep); });
    }
}

net::awaitable<void> ConsoleSession::close_client(websocket::close_reason reason) {
    beast::error_code ec;
    co_await client_.async_close(reason, net::redirect_error(net::use_awaitable, ec));
    if (ec && ec != net::error::operation_aborted) {
        NLOG_DEBUG(log::SESSION_LOGGER, "Session {}: Client close: {}", id_, ec.message());
    }
}

net::awaitable<void> ConsoleSession::close_upstream(websocket::close_reason reason) {
    auto ec = co_await upstream_->async_close(reason);
    if (ec && ec != net::error::operation_aborted) {
        NLOG_DEBUG(log::SESSION_LOGGER, "Session {}: Upstream close: {}", id_, ec.message());
    }
}

void ConsoleSession::pump_finished() {
    if (--pumps_running_ == 0) {
        wake_.cancel();
    }
}

// ============================================================================
// Bridge
// ============================================================================

net::awaitable<void> ConsoleSession::bridge() {
    pumps_running_ = 2;
    co_await (pump_client_to_upstream() && pump_upstream_to_client() && watch());
}

net::awaitable<void> ConsoleSession::pump_client_to_upstream() {
    beast::flat_buffer buffer;

    for (;;) {
        beast::error_code ec;
        co_await client_.async_read(buffer, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            begin_teardown(client_ended(ec), Side::CLIENT);
            break;
        }

        const auto size = buffer.size();
        if (state() != SessionState::OPEN) {
            // Keep reading until the close handshake completes, but relay nothing
            buffer.consume(size);
            continue;
        }

        auto wec = co_await upstream_->async_write(buffer.data(), client_.got_binary());
        buffer.consume(size);
        if (wec) {
            begin_teardown(upstream_ended(wec), Side::UPSTREAM);
            break;
        }

        bytes_client_to_upstream_.fetch_add(size, std::memory_order_relaxed);
        touch();
    }

    pump_finished();
}

net::awaitable<void> ConsoleSession::pump_upstream_to_client() {
    beast::flat_buffer buffer;

    for (;;) {
        auto [ec, bytes] = co_await upstream_->async_read(buffer);
        if (ec) {
            begin_teardown(upstream_ended(ec), Side::UPSTREAM);
            break;
        }

        const auto size = buffer.size();
        if (state() != SessionState::OPEN) {
            buffer.consume(size);
            continue;
        }

        beast::error_code wec;
        client_.binary(upstream_->got_binary());
        co_await client_.async_write(buffer.data(), net::redirect_error(net::use_awaitable, wec));
        buffer.consume(size);
        if (wec) {
            begin_teardown(client_ended(wec), Side::CLIENT);
            break;
        }

        bytes_upstream_to_client_.fetch_add(size, std::memory_order_relaxed);
        touch();
    }

    pump_finished();
}

net::awaitable<void> ConsoleSession::watch() {
    using std::chrono::steady_clock;
    const auto idle_timeout = std::chrono::duration_cast<steady_clock::duration>(options_.idle_timeout);

    while (pumps_running_ > 0) {
        const auto now = steady_clock::now();

        if (state() == SessionState::CLOSING && !hard_closed_ && now >= teardown_deadline_) {
            NLOG_WARN(log::SESSION_LOGGER, "Session {} [{}]: Teardown deadline passed, forcing close",
                      id_, target_.to_string());
            hard_close();
            continue;
        }

        if (idle_timeout.count() > 0 && state() == SessionState::OPEN &&
            now - last_activity_steady_ >= idle_timeout) {
            NLOG_INFO(log::SESSION_LOGGER, "Session {} [{}]: Idle timeout", id_, target_.to_string());
            begin_teardown({close_codes::NORMAL, "idle timeout", false}, Side::NONE);
            continue;
        }

        auto next = now + std::chrono::hours(1);
        if (state() == SessionState::CLOSING && !hard_closed_) {
            next = std::min(next, teardown_deadline_);
        }
        if (idle_timeout.count() > 0 && state() == SessionState::OPEN) {
            next = std::min(next, last_activity_steady_ + idle_timeout);
        }

        wake_.expires_at(next);
        beast::error_code ec;
        co_await wake_.async_wait(net::redirect_error(net::use_awaitable, ec));
    }
}

} // namespace shellrelay
