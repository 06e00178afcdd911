#pragma once

#include <string_view>

namespace agentlink::core {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Transport-level error classification.

Platform and library error codes (Boost.Asio, Beast, OpenSSL) are mapped
onto this small set of semantic failures. Connection decides from this
classification whether a failure is recovered by reconnecting.
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidUrl,       // Malformed or unsupported URL (scheme, host, port)
    InvalidState,     // Operation not allowed in current transport state

    // --- Expected / benign termination --------------------------------------
    LocalShutdown,    // Connection was closed intentionally by the local endpoint
    RemoteClosed,     // Remote endpoint closed the connection gracefully (CLOSE frame)

    // --- Transient / recoverable failures -----------------------------------
    Timeout,          // Transport-level timeout (idle, stalled network, dead peer)
    ConnectionFailed, // Connection attempt failed (DNS, refused, routing, etc)
    HandshakeFailed,  // TLS or WebSocket upgrade failed
    AuthFailed,       // Channel opened but the peer rejected the credentials

    // --- Protocol / framing issues ------------------------------------------
    ProtocolError,    // Invalid frame or protocol violation

    // --- Fatal / unspecified transport failure ------------------------------
    TransportFailure, // Unclassified transport failure
};


[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::InvalidUrl:        return "InvalidUrl";
    case Error::InvalidState:      return "InvalidState";
    case Error::LocalShutdown:     return "LocalShutdown";
    case Error::RemoteClosed:      return "RemoteClosed";
    case Error::Timeout:           return "Timeout";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::HandshakeFailed:   return "HandshakeFailed";
    case Error::AuthFailed:        return "AuthFailed";
    case Error::ProtocolError:     return "ProtocolError";
    case Error::TransportFailure:  return "TransportFailure";
    default:                       return "Unknown";
    }
}

} // namespace transport
} // namespace agentlink::core
