#pragma once

#include <chrono>

#include "agentlink/core/transport/clock.hpp"


namespace agentlink::core::transport {

// -----------------------------------------------------------------------------
// Timer
// -----------------------------------------------------------------------------
//
// Owned, cancelable one-shot deadline. Timers never run callbacks; the owner
// checks them from its poll loop. cancel() takes effect immediately: a
// cancelled timer never reports as due.
//
template<ClockConcept Clock>
class Timer {
public:
    using time_point = typename Clock::time_point;

    inline void arm(std::chrono::milliseconds delay) noexcept {
        deadline_ = Clock::now() + std::chrono::duration_cast<typename Clock::duration>(delay);
        armed_ = true;
    }

    inline void cancel() noexcept {
        armed_ = false;
    }

    [[nodiscard]]
    inline bool armed() const noexcept {
        return armed_;
    }

    [[nodiscard]]
    inline time_point deadline() const noexcept {
        return deadline_;
    }

    // Returns true exactly once when the deadline has passed, and disarms.
    [[nodiscard]]
    inline bool fire_if_due(time_point now) noexcept {
        if (armed_ && now >= deadline_) {
            armed_ = false;
            return true;
        }
        return false;
    }

private:
    time_point deadline_{};
    bool armed_{false};
};

} // namespace agentlink::core::transport
