#pragma once

#include "common/errors.hpp"
#include "common/types.hpp"

#include <chrono>
#include <expected>
#include <mutex>
#include <string>
#include <unordered_map>

namespace shellrelay {

/**
 * TicketStore - minted console tickets awaiting their single use
 *
 * A ticket leaves the store the moment it is claimed, so a second relay
 * connection presenting the same value is refused before any upstream
 * connection is attempted. Expired entries are kept for a retention period
 * so a late presentation reports TICKET_EXPIRED rather than TICKET_INVALID.
 * A presentation that fails the target or owner check leaves the entry in
 * place for the operator it was issued to.
 */
class TicketStore {
public:
    explicit TicketStore(std::chrono::seconds retention = std::chrono::seconds(300));

    void remember(ConsoleTicket ticket);

    std::expected<ConsoleTicket, RelayError> claim(const std::string& value,
                                                   uint16_t port,
                                                   const ResourceDescriptor& target,
                                                   const OperatorIdentity& requester,
                                                   TimePoint now = Clock::now());

    // Returns the number of entries dropped
    size_t sweep(TimePoint now = Clock::now());

    size_t size() const;

private:
    const std::chrono::seconds retention_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConsoleTicket> tickets_;
};

} // namespace shellrelay
