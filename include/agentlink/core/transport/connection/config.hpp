/*
================================================================================
agentlink Connection Configuration
================================================================================
*/
#pragma once

#include <cstddef>
#include <cstdint>
#include <chrono>
#include <functional>
#include <string>


namespace agentlink::core::transport {

// Capacity of the pending outbound queue (messages)
inline constexpr std::size_t OUTBOUND_QUEUE_CAPACITY = 500;

// Scheduled retries before the connection gives up and reports disconnected
inline constexpr std::uint32_t MAX_RECONNECT_ATTEMPTS = 50;

// Backoff: min(RECONNECT_BASE_DELAY * 2^attempt, RECONNECT_MAX_DELAY)
inline constexpr std::chrono::milliseconds RECONNECT_BASE_DELAY{1000};
inline constexpr std::chrono::milliseconds RECONNECT_MAX_DELAY{30000};

// Heartbeat: ping period and pong deadline
inline constexpr std::chrono::milliseconds HEARTBEAT_INTERVAL{30000};
inline constexpr std::chrono::milliseconds PONG_TIMEOUT{10000};

// Capacity of the signal buffer (number of signals)
inline constexpr std::size_t SIGNAL_RING_CAPACITY = 64;

namespace connection {

// Runtime overrides. Defaults mirror the compile-time constants above.
struct Config {
    std::size_t outbound_queue_capacity          = OUTBOUND_QUEUE_CAPACITY;
    std::uint32_t max_reconnect_attempts         = MAX_RECONNECT_ATTEMPTS;
    std::chrono::milliseconds reconnect_base_delay = RECONNECT_BASE_DELAY;
    std::chrono::milliseconds reconnect_max_delay  = RECONNECT_MAX_DELAY;
    std::chrono::milliseconds heartbeat_interval   = HEARTBEAT_INTERVAL;
    std::chrono::milliseconds pong_timeout         = PONG_TIMEOUT;

    // Builds the authentication frame sent first on every opened channel
    // from the current token. Empty: {"type":"client:auth","token":..}.
    // Runs under the connection lock and must not call back into it.
    std::function<std::string(const std::string& token)> auth_message{};
};

} // namespace connection

} // namespace agentlink::core::transport
