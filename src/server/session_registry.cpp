#include "server/session_registry.hpp"
#include "common/log.hpp"

#include <mutex>

namespace shellrelay {

// ============================================================================
// Reservation
// ============================================================================

SessionRegistry::Reservation::Reservation(Reservation&& other) noexcept
    : counter_(other.counter_) {
    other.counter_ = nullptr;
}

SessionRegistry::Reservation& SessionRegistry::Reservation::operator=(Reservation&& other) noexcept {
    if (this != &other) {
        release();
        counter_ = other.counter_;
        other.counter_ = nullptr;
    }
    return *this;
}

SessionRegistry::Reservation::~Reservation() {
    release();
}

void SessionRegistry::Reservation::release() {
    if (counter_) {
        counter_->fetch_sub(1, std::memory_order_acq_rel);
        counter_ = nullptr;
    }
}

// ============================================================================
// SessionRegistry
// ============================================================================

SessionRegistry::SessionRegistry(size_t max_sessions)
    : max_sessions_(max_sessions) {}

std::optional<SessionRegistry::Reservation> SessionRegistry::try_reserve() {
    if (!accepting()) {
        return std::nullopt;
    }

    size_t current = reserved_.load(std::memory_order_acquire);
    do {
        if (max_sessions_ != 0 && current >= max_sessions_) {
            NLOG_WARN(log::RELAY_LOGGER, "SessionRegistry: Session limit {} reached", max_sessions_);
            return std::nullopt;
        }
    } while (!reserved_.compare_exchange_weak(current, current + 1,
                                              std::memory_order_acq_rel,
                                              std::memory_order_acquire));
    return Reservation(&reserved_);
}

bool SessionRegistry::insert(std::shared_ptr<SessionHandle> session) {
    if (!session) {
        return false;
    }
    const auto id = session->id();
    std::unique_lock lock(mutex_);
    if (!accepting()) {
        return false;
    }
    auto [it, inserted] = sessions_.emplace(id, std::move(session));
    if (!inserted) {
        NLOG_ERROR(log::RELAY_LOGGER, "SessionRegistry: Duplicate session id {}", id);
    }
    return inserted;
}

bool SessionRegistry::remove(const SessionId& id) {
    std::unique_lock lock(mutex_);
    return sessions_.erase(id) > 0;
}

std::shared_ptr<SessionHandle> SessionRegistry::find(const SessionId& id) const {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(id);
    return it != sessions_.end() ? it->second : nullptr;
}

bool SessionRegistry::contains(const SessionId& id) const {
    std::shared_lock lock(mutex_);
    return sessions_.contains(id);
}

std::vector<SessionInfo> SessionRegistry::snapshot() const {
    std::vector<std::shared_ptr<SessionHandle>> handles;
    {
        std::shared_lock lock(mutex_);
        handles.reserve(sessions_.size());
        for (const auto& [id, session] : sessions_) {
            handles.push_back(session);
        }
    }

    std::vector<SessionInfo> result;
    result.reserve(handles.size());
    for (const auto& session : handles) {
        result.push_back(session->info());
    }
    return result;
}

size_t SessionRegistry::size() const {
    std::shared_lock lock(mutex_);
    return sessions_.size();
}

bool SessionRegistry::cancel(const SessionId& id, RelayError reason) {
    auto session = find(id);
    if (!session) {
        return false;
    }
    NLOG_INFO(log::RELAY_LOGGER, "SessionRegistry: Cancelling session {} ({})",
              id, relay_error_name(reason));
    session->cancel(reason);
    return true;
}

size_t SessionRegistry::cancel_all(RelayError reason) {
    std::vector<std::shared_ptr<SessionHandle>> handles;
    {
        std::shared_lock lock(mutex_);
        handles.reserve(sessions_.size());
        for (const auto& [id, session] : sessions_) {
            handles.push_back(session);
        }
    }

    for (const auto& session : handles) {
        session->cancel(reason);
    }
    if (!handles.empty()) {
        NLOG_INFO(log::RELAY_LOGGER, "SessionRegistry: Cancelled {} sessions ({})",
                  handles.size(), relay_error_name(reason));
    }
    return handles.size();
}

size_t SessionRegistry::shutdown(RelayError reason) {
    {
        // Taken exclusively so no insert can slip in after the flag flips
        std::unique_lock lock(mutex_);
        accepting_.store(false, std::memory_order_release);
    }
    return cancel_all(reason);
}

} // namespace shellrelay
