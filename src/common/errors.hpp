#pragma once

#include <boost/beast/websocket/rfc6455.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace shellrelay {

// ============================================================================
// Relay Error Taxonomy
// ============================================================================
// Every error is terminal for the session or request that produced it.
// Retrying means a new relay connection with a freshly minted ticket.
enum class RelayError : uint16_t {
    BAD_REQUEST = 1,            // Malformed admission parameters
    UNAUTHORIZED = 2,           // Missing/invalid operator token or gate denial
    TICKET_EXPIRED = 3,
    TICKET_INVALID = 4,         // Unknown, already claimed, or issued for another target
    UPSTREAM_AUTH_FAILED = 5,   // Upstream console rejected the ticket
    UPSTREAM_UNREACHABLE = 6,   // Network, TLS, timeout or non-conforming handshake
    RESOURCE_NOT_FOUND = 7,
    RESOURCE_NOT_RUNNING = 8,
    SESSION_LIMIT_EXCEEDED = 9,
    FORCED_CLOSE = 10,          // Operator-initiated disconnect
    SHUTTING_DOWN = 11,
    INTERNAL_ERROR = 12,
};

constexpr std::string_view relay_error_name(RelayError error) {
    switch (error) {
        case RelayError::BAD_REQUEST:            return "bad_request";
        case RelayError::UNAUTHORIZED:           return "unauthorized";
        case RelayError::TICKET_EXPIRED:         return "ticket_expired";
        case RelayError::TICKET_INVALID:         return "ticket_invalid";
        case RelayError::UPSTREAM_AUTH_FAILED:   return "upstream_auth_failed";
        case RelayError::UPSTREAM_UNREACHABLE:   return "upstream_unreachable";
        case RelayError::RESOURCE_NOT_FOUND:     return "resource_not_found";
        case RelayError::RESOURCE_NOT_RUNNING:   return "resource_not_running";
        case RelayError::SESSION_LIMIT_EXCEEDED: return "session_limit_exceeded";
        case RelayError::FORCED_CLOSE:           return "forced_close";
        case RelayError::SHUTTING_DOWN:          return "shutting_down";
        case RelayError::INTERNAL_ERROR:         return "internal_error";
    }
    return "internal_error";
}

// Default human-readable text, used as close reason when no detail is given
std::string_view relay_error_message(RelayError error);

// ============================================================================
// WebSocket Close Codes
// ============================================================================
namespace close_codes {
inline constexpr uint16_t NORMAL = 1000;
inline constexpr uint16_t GOING_AWAY = 1001;
inline constexpr uint16_t INTERNAL_ERROR = 1011;
inline constexpr uint16_t FORCED = 4000;
inline constexpr uint16_t BAD_REQUEST = 4400;
inline constexpr uint16_t UNAUTHORIZED = 4401;
inline constexpr uint16_t AUTH_FAILED = 4403;
inline constexpr uint16_t NOT_FOUND = 4404;
inline constexpr uint16_t NOT_RUNNING = 4409;
inline constexpr uint16_t SESSION_LIMIT = 4429;
inline constexpr uint16_t UPSTREAM_UNREACHABLE = 4502;
} // namespace close_codes

// Close code delivered to the operator's terminal
uint16_t close_code_for(RelayError error);

// HTTP status for the ticket endpoint
unsigned http_status_for(RelayError error);

// WebSocket close reasons are limited to 123 bytes
constexpr size_t MAX_CLOSE_REASON = 123;

boost::beast::websocket::close_reason make_close_reason(uint16_t code, std::string_view reason);
boost::beast::websocket::close_reason make_close_reason(RelayError error, std::string_view detail = {});

} // namespace shellrelay
