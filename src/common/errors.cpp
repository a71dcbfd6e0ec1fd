#include "common/errors.hpp"
#include <algorithm>

namespace shellrelay {

std::string_view relay_error_message(RelayError error) {
    switch (error) {
        case RelayError::BAD_REQUEST:            return "bad request";
        case RelayError::UNAUTHORIZED:           return "unauthorized";
        case RelayError::TICKET_EXPIRED:         return "ticket expired";
        case RelayError::TICKET_INVALID:         return "ticket invalid";
        case RelayError::UPSTREAM_AUTH_FAILED:   return "upstream rejected ticket";
        case RelayError::UPSTREAM_UNREACHABLE:   return "upstream unreachable";
        case RelayError::RESOURCE_NOT_FOUND:     return "resource not found";
        case RelayError::RESOURCE_NOT_RUNNING:   return "resource not running";
        case RelayError::SESSION_LIMIT_EXCEEDED: return "session limit exceeded";
        case RelayError::FORCED_CLOSE:           return "closed by administrator";
        case RelayError::SHUTTING_DOWN:          return "relay shutting down";
        case RelayError::INTERNAL_ERROR:         return "internal error";
    }
    return "internal error";
}

uint16_t close_code_for(RelayError error) {
    switch (error) {
        case RelayError::BAD_REQUEST:            return close_codes::BAD_REQUEST;
        case RelayError::UNAUTHORIZED:           return close_codes::UNAUTHORIZED;
        case RelayError::TICKET_EXPIRED:
        case RelayError::TICKET_INVALID:
        case RelayError::UPSTREAM_AUTH_FAILED:   return close_codes::AUTH_FAILED;
        case RelayError::UPSTREAM_UNREACHABLE:   return close_codes::UPSTREAM_UNREACHABLE;
        case RelayError::RESOURCE_NOT_FOUND:     return close_codes::NOT_FOUND;
        case RelayError::RESOURCE_NOT_RUNNING:   return close_codes::NOT_RUNNING;
        case RelayError::SESSION_LIMIT_EXCEEDED: return close_codes::SESSION_LIMIT;
        case RelayError::FORCED_CLOSE:           return close_codes::FORCED;
        case RelayError::SHUTTING_DOWN:          return close_codes::GOING_AWAY;
        case RelayError::INTERNAL_ERROR:         return close_codes::INTERNAL_ERROR;
    }
    return close_codes::INTERNAL_ERROR;
}

unsigned http_status_for(RelayError error) {
    switch (error) {
        case RelayError::BAD_REQUEST:            return 400;
        case RelayError::UNAUTHORIZED:           return 401;
        case RelayError::TICKET_EXPIRED:
        case RelayError::TICKET_INVALID:
        case RelayError::UPSTREAM_AUTH_FAILED:   return 403;
        case RelayError::RESOURCE_NOT_FOUND:     return 404;
        case RelayError::RESOURCE_NOT_RUNNING:   return 409;
        case RelayError::SESSION_LIMIT_EXCEEDED: return 429;
        case RelayError::UPSTREAM_UNREACHABLE:   return 502;
        case RelayError::SHUTTING_DOWN:          return 503;
        case RelayError::FORCED_CLOSE:
        case RelayError::INTERNAL_ERROR:         return 500;
    }
    return 500;
}

boost::beast::websocket::close_reason make_close_reason(uint16_t code, std::string_view reason) {
    // Cut on a UTF-8 boundary so the peer never sees a broken sequence
    size_t len = std::min(reason.size(), MAX_CLOSE_REASON);
    while (len > 0 && len < reason.size() &&
           (static_cast<unsigned char>(reason[len]) & 0xC0) == 0x80) {
        --len;
    }
    return boost::beast::websocket::close_reason(static_cast<boost::beast::websocket::close_code>(code), reason.substr(0, len));
}

boost::beast::websocket::close_reason make_close_reason(RelayError error, std::string_view detail) {
    return make_close_reason(close_code_for(error),
                             detail.empty() ? relay_error_message(error) : detail);
}

} // namespace shellrelay
