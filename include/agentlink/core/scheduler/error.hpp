#pragma once

#include <cstdint>
#include <string_view>

namespace agentlink::core::scheduler {

/*
===============================================================================
 scheduler::Error
===============================================================================

Synchronous rejections returned by Scheduler operations. Adapter failures are
not errors of the scheduler: they travel through Completion::fail and only
advance the agent queue.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,
    DuplicateAgent,   // register_agent() for an id that is already registered
    UnknownAgent,     // operation addressed to an id that is not registered
    QueueFull,        // agent busy and its queue at capacity (item not accepted)
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:           return "None";
    case Error::DuplicateAgent: return "DuplicateAgent";
    case Error::UnknownAgent:   return "UnknownAgent";
    case Error::QueueFull:      return "QueueFull";
    default:                    return "Unknown";
    }
}

} // namespace agentlink::core::scheduler
