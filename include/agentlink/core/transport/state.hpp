#pragma once

#include <cstdint>
#include <string_view>


namespace agentlink::core::transport {

// ===============================================================
// CONNECTION STATUS ENUM
// ===============================================================
// Externally observable status of the Connection. Connected means the
// channel is open AND authenticated.
enum class ConnectionStatus : uint8_t {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting
};

[[nodiscard]]
inline constexpr std::string_view to_string(ConnectionStatus s) noexcept {
    switch (s) {
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Connecting:   return "connecting";
        case ConnectionStatus::Connected:    return "connected";
        case ConnectionStatus::Reconnecting: return "reconnecting";
        default:                             return "unknown";
    }
}


// ===============================================================
// EVENT ENUM
// ===============================================================
enum class Event : uint8_t {
    // --- User intent ---
    ConnectRequested,
    ReconnectRequested,
    DisconnectRequested,

    // --- Transport lifecycle ---
    TransportOpened,
    TransportOpenFailed,
    TransportClosed,

    // --- Authentication ---
    AuthSucceeded,
    AuthRejected,

    // --- Liveness ---
    PongTimeout,

    // --- Network availability ---
    NetworkOnline,
    NetworkOffline,

    // --- Retry ---
    RetryTimerExpired,
    TokenExpired
};

[[nodiscard]]
inline constexpr std::string_view to_string(Event e) noexcept {
    switch (e) {
        case Event::ConnectRequested:    return "ConnectRequested";
        case Event::ReconnectRequested:  return "ReconnectRequested";
        case Event::DisconnectRequested: return "DisconnectRequested";
        case Event::TransportOpened:     return "TransportOpened";
        case Event::TransportOpenFailed: return "TransportOpenFailed";
        case Event::TransportClosed:     return "TransportClosed";
        case Event::AuthSucceeded:       return "AuthSucceeded";
        case Event::AuthRejected:        return "AuthRejected";
        case Event::PongTimeout:         return "PongTimeout";
        case Event::NetworkOnline:       return "NetworkOnline";
        case Event::NetworkOffline:      return "NetworkOffline";
        case Event::RetryTimerExpired:   return "RetryTimerExpired";
        case Event::TokenExpired:        return "TokenExpired";
        default:                         return "UnknownEvent";
    }
}


// ===============================================================
// DISCONNECT REASON ENUM
// ===============================================================
enum class DisconnectReason : uint8_t {
    None,
    LocalClose,        // explicit disconnect() by user
    TransportError,    // websocket / IO error or remote close
    PongTimeout,       // heartbeat reply missing
    NetworkOffline,    // host reported the network as unavailable
    AuthRejected,      // peer rejected the credentials
    TokenExpired,      // token refresher reported no session
    RetriesExhausted   // attempt cap reached
};

[[nodiscard]]
inline constexpr std::string_view to_string(DisconnectReason r) noexcept {
    switch (r) {
        case DisconnectReason::None:             return "None";
        case DisconnectReason::LocalClose:       return "LocalClose";
        case DisconnectReason::TransportError:   return "TransportError";
        case DisconnectReason::PongTimeout:      return "PongTimeout";
        case DisconnectReason::NetworkOffline:   return "NetworkOffline";
        case DisconnectReason::AuthRejected:     return "AuthRejected";
        case DisconnectReason::TokenExpired:     return "TokenExpired";
        case DisconnectReason::RetriesExhausted: return "RetriesExhausted";
        default:                                 return "Unknown";
    }
}

} // namespace agentlink::core::transport
