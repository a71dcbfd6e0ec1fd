#pragma once

#include "common/errors.hpp"
#include "common/types.hpp"

#include <boost/asio/awaitable.hpp>

#include <chrono>
#include <expected>

namespace shellrelay {

namespace net = boost::asio;

class ProxmoxApi;

/**
 * TicketExchange - mints console tickets from the hypervisor control plane
 *
 * Every call mints a fresh, independent ticket scoped to one resource.
 * Failures are terminal for the call; callers never reuse a failed ticket.
 * Authorization is checked before this is called, not here. The relay
 * server records every minted ticket in its TicketStore.
 */
class TicketExchange {
public:
    virtual ~TicketExchange() = default;

    virtual net::awaitable<std::expected<ConsoleTicket, RelayError>>
    mint(const ResourceDescriptor& target, const OperatorIdentity& requester) = 0;
};

// Mints through POST .../vncproxy
class ProxmoxTicketExchange : public TicketExchange {
public:
    ProxmoxTicketExchange(ProxmoxApi& api, std::chrono::seconds ttl);

    net::awaitable<std::expected<ConsoleTicket, RelayError>>
    mint(const ResourceDescriptor& target, const OperatorIdentity& requester) override;

private:
    ProxmoxApi& api_;
    std::chrono::seconds ttl_;
};

} // namespace shellrelay
