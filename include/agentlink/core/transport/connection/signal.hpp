/*
===============================================================================
 Connection Signals
===============================================================================

connection::Signal represents externally observable, edge-triggered facts
emitted by Connection via its poll_signal() interface.

Signals are:
  - Edge-triggered (not level- or state-based)
  - Single-shot per occurrence
  - Deterministic and poll-driven

They complement the subscribe/unsubscribe handlers for callers that prefer
to drive everything from one poll loop. Signals are informational: if the
bounded signal buffer overflows the oldest signal is dropped, and nothing in
Connection depends on a signal being observed.

-------------------------------------------------------------------------------
 Signal Meanings
-------------------------------------------------------------------------------

Connected
  The channel is open and the peer accepted the credentials.

Reconnected
  Connected again after a previous connected session. Emitted together with
  Connected, and only for recoveries.

Disconnected
  The logical connection became unusable.

RetryScheduled
  A reconnection attempt has been scheduled according to the backoff policy.

AuthRejected
  The peer rejected the credentials presented in client:auth.

PongTimeout
  No pong was received within the pong window; the transport was force-closed.

QueueOverflow
  An outbound message was dropped because the pending queue is full.

===============================================================================
*/
#pragma once

#include <cstdint>
#include <string_view>


namespace agentlink::core::transport::connection {

enum class Signal : uint8_t {
    None,
    Connected,
    Reconnected,
    Disconnected,
    RetryScheduled,
    AuthRejected,
    PongTimeout,
    QueueOverflow,
};

[[nodiscard]]
inline std::string_view to_string(Signal sig) noexcept {
    switch (sig) {
        case Signal::None:           return "None";
        case Signal::Connected:      return "Connected";
        case Signal::Reconnected:    return "Reconnected";
        case Signal::Disconnected:   return "Disconnected";
        case Signal::RetryScheduled: return "RetryScheduled";
        case Signal::AuthRejected:   return "AuthRejected";
        case Signal::PongTimeout:    return "PongTimeout";
        case Signal::QueueOverflow:  return "QueueOverflow";
        default:                     return "Unknown";
    }
}

} // namespace agentlink::core::transport::connection
