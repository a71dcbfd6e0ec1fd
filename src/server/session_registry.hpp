#pragma once

#include "common/errors.hpp"
#include "common/types.hpp"
#include "server/session_state.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace shellrelay {

// Point-in-time view of a session, safe to hand to any thread
struct SessionInfo {
    SessionId id;
    ResourceDescriptor descriptor;
    std::string operator_subject;
    SessionState state{SessionState::ADMITTED};
    TimePoint created_at{};
    TimePoint last_activity_at{};
    uint64_t bytes_client_to_upstream{0};
    uint64_t bytes_upstream_to_client{0};
};

/**
 * SessionHandle - what the registry knows about a live session
 *
 * Implemented by ConsoleSession. info() and cancel() may be called from any
 * thread; cancel() only requests teardown and returns immediately.
 */
class SessionHandle {
public:
    virtual ~SessionHandle() = default;

    virtual const SessionId& id() const = 0;
    virtual SessionInfo info() const = 0;
    virtual void cancel(RelayError reason) = 0;
};

/**
 * SessionRegistry - process-wide table of open console sessions
 *
 * The lock is held only for the map operation itself, never across I/O.
 * Also owns the optional concurrent-session ceiling: a slot is reserved when
 * a relay connection is admitted and released when its Reservation dies.
 */
class SessionRegistry {
public:
    class Reservation {
    public:
        Reservation(Reservation&& other) noexcept;
        Reservation& operator=(Reservation&& other) noexcept;
        ~Reservation();

        Reservation(const Reservation&) = delete;
        Reservation& operator=(const Reservation&) = delete;

        void release();

    private:
        friend class SessionRegistry;
        explicit Reservation(std::atomic<size_t>* counter) : counter_(counter) {}

        std::atomic<size_t>* counter_{nullptr};
    };

    // max_sessions = 0 means unlimited
    explicit SessionRegistry(size_t max_sessions = 0);

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Empty when the ceiling is reached
    std::optional<Reservation> try_reserve();
    size_t reserved() const { return reserved_.load(std::memory_order_acquire); }
    size_t max_sessions() const { return max_sessions_; }

    // False if a session with the same id is already present
    bool insert(std::shared_ptr<SessionHandle> session);
    bool remove(const SessionId& id);
    std::shared_ptr<SessionHandle> find(const SessionId& id) const;
    bool contains(const SessionId& id) const;

    std::vector<SessionInfo> snapshot() const;
    size_t size() const;

    // Requests teardown; false if the id is unknown
    bool cancel(const SessionId& id, RelayError reason);

    // Returns the number of sessions asked to close
    size_t cancel_all(RelayError reason);

    // Refuse new reservations and insertions, then cancel everything open
    size_t shutdown(RelayError reason);
    bool accepting() const { return accepting_.load(std::memory_order_acquire); }

private:
    const size_t max_sessions_;
    std::atomic<size_t> reserved_{0};
    std::atomic<bool> accepting_{true};

    mutable std::shared_mutex mutex_;
    std::unordered_map<SessionId, std::shared_ptr<SessionHandle>> sessions_;
};

} // namespace shellrelay
