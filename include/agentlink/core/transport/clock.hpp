#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>


namespace agentlink::core::transport {

// -----------------------------------------------------------------------------
// ClockConcept
// -----------------------------------------------------------------------------
//
// Time source used by timers. std::chrono::steady_clock satisfies it; tests
// inject a manually advanced clock.
//
template<class C>
concept ClockConcept =
    requires {
        typename C::duration;
        typename C::time_point;
        { C::now() } -> std::same_as<typename C::time_point>;
    };

static_assert(ClockConcept<std::chrono::steady_clock>);

// Milliseconds since the clock epoch (used for heartbeat timestamps)
template<ClockConcept Clock>
[[nodiscard]]
inline std::uint64_t epoch_ms(typename Clock::time_point tp) noexcept {
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count());
}

} // namespace agentlink::core::transport
