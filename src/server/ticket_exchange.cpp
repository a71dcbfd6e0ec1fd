#include "server/ticket_exchange.hpp"
#include "server/proxmox_api.hpp"
#include "common/log.hpp"

namespace shellrelay {

ProxmoxTicketExchange::ProxmoxTicketExchange(ProxmoxApi& api, std::chrono::seconds ttl)
    : api_(api)
    , ttl_(ttl) {}

net::awaitable<std::expected<ConsoleTicket, RelayError>>
ProxmoxTicketExchange::mint(const ResourceDescriptor& target, const OperatorIdentity& requester) {
    auto proxy = co_await api_.create_console_proxy(target);
    if (!proxy) {
        NLOG_WARN(log::TICKET_LOGGER, "TicketExchange: Mint for {} failed: {}",
                  target.to_string(), relay_error_name(proxy.error()));
        co_return std::unexpected(proxy.error());
    }

    ConsoleTicket ticket;
    ticket.value = std::move(proxy->ticket);
    ticket.target_port = proxy->port;
    ticket.issued_for = target;
    ticket.issued_to = requester.subject;
    ticket.upstream_user = proxy->user.empty() ? api_.config().token_user() : std::move(proxy->user);
    ticket.issued_at = Clock::now();
    ticket.expires_at = ticket.issued_at + ttl_;

    NLOG_INFO(log::TICKET_LOGGER, "TicketExchange: Minted ticket for {} (port {}) to {}, expires in {}s",
              target.to_string(), ticket.target_port, requester.subject, ttl_.count());
    co_return ticket;
}

} // namespace shellrelay
