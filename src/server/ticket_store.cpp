#include "server/ticket_store.hpp"
#include "common/log.hpp"

namespace shellrelay {

TicketStore::TicketStore(std::chrono::seconds retention)
    : retention_(retention) {}

void TicketStore::remember(ConsoleTicket ticket) {
    auto value = ticket.value;
    std::lock_guard lock(mutex_);
    tickets_.insert_or_assign(std::move(value), std::move(ticket));
}

std::expected<ConsoleTicket, RelayError> TicketStore::claim(const std::string& value,
                                                            uint16_t port,
                                                            const ResourceDescriptor& target,
                                                            const OperatorIdentity& requester,
                                                            TimePoint now) {
    std::lock_guard lock(mutex_);

    auto it = tickets_.find(value);
    if (it == tickets_.end()) {
        return std::unexpected(RelayError::TICKET_INVALID);
    }

    if (it->second.is_expired(now)) {
        tickets_.erase(it);
        return std::unexpected(RelayError::TICKET_EXPIRED);
    }

    // Wrong target: leave the entry for the connection it was minted for
    if (it->second.target_port != port || !(it->second.issued_for == target)) {
        NLOG_WARN(log::TICKET_LOGGER, "TicketStore: Ticket presented for {} port {}, issued for {} port {}",
                  target.to_string(), port, it->second.issued_for.to_string(), it->second.target_port);
        return std::unexpected(RelayError::TICKET_INVALID);
    }

    if (it->second.issued_to != requester.subject && !requester.is_admin()) {
        NLOG_WARN(log::TICKET_LOGGER, "TicketStore: {} presented a ticket issued to {} for {}",
                  requester.subject, it->second.issued_to, target.to_string());
        return std::unexpected(RelayError::UNAUTHORIZED);
    }

    auto ticket = std::move(it->second);
    tickets_.erase(it);
    return ticket;
}

size_t TicketStore::sweep(TimePoint now) {
    std::lock_guard lock(mutex_);
    size_t removed = std::erase_if(tickets_, [&](const auto& entry) {
        return entry.second.expires_at + retention_ <= now;
    });
    if (removed > 0) {
        NLOG_DEBUG(log::TICKET_LOGGER, "TicketStore: Swept {} stale tickets, {} pending",
                   removed, tickets_.size());
    }
    return removed;
}

size_t TicketStore::size() const {
    std::lock_guard lock(mutex_);
    return tickets_.size();
}

} // namespace shellrelay
