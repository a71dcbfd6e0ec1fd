#pragma once

#include <cstdint>
#include <string_view>

namespace shellrelay {

// Console session lifecycle
//
//   ADMITTED -> CONNECTING -> OPEN -> CLOSING -> CLOSED
//                    |          |        |
//                    +----------+--------+----> ERRORED
//
// CLOSED and ERRORED are terminal.
enum class SessionState : uint8_t {
    ADMITTED,
    CONNECTING,
    OPEN,
    CLOSING,
    CLOSED,
    ERRORED,
};

constexpr std::string_view session_state_name(SessionState state) {
    switch (state) {
        case SessionState::ADMITTED:   return "ADMITTED";
        case SessionState::CONNECTING: return "CONNECTING";
        case SessionState::OPEN:       return "OPEN";
        case SessionState::CLOSING:    return "CLOSING";
        case SessionState::CLOSED:     return "CLOSED";
        case SessionState::ERRORED:    return "ERRORED";
    }
    return "UNKNOWN";
}

constexpr bool is_terminal(SessionState state) {
    return state == SessionState::CLOSED || state == SessionState::ERRORED;
}

// ADMITTED may also go straight to CLOSING when the relay is cancelled
// before the upstream connect starts.
constexpr bool can_transition(SessionState from, SessionState to) {
    switch (from) {
        case SessionState::ADMITTED:
            return to == SessionState::CONNECTING || to == SessionState::CLOSING ||
                   to == SessionState::ERRORED;
        case SessionState::CONNECTING:
            return to == SessionState::OPEN || to == SessionState::CLOSING ||
                   to == SessionState::ERRORED;
        case SessionState::OPEN:
            return to == SessionState::CLOSING || to == SessionState::ERRORED;
        case SessionState::CLOSING:
            return to == SessionState::CLOSED || to == SessionState::ERRORED;
        case SessionState::CLOSED:
        case SessionState::ERRORED:
            return false;
    }
    return false;
}

} // namespace shellrelay
