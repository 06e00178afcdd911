/*
================================================================================
agentlink Scheduler Configuration
================================================================================
*/
#pragma once

#include <cstddef>
#include <chrono>

#include "lcr/optional.hpp"


namespace agentlink::core::scheduler {

// Work items an agent may hold in addition to the one in flight
inline constexpr std::size_t AGENT_QUEUE_CAPACITY = 50;

struct Config {
    std::size_t queue_capacity = AGENT_QUEUE_CAPACITY;

    // When set, poll() fails an in-flight item that has been running longer
    // than this with reason "timed out" and asks the adapter to abort it.
    // Disabled by default: a hanging adapter keeps its agent busy.
    lcr::optional<std::chrono::milliseconds> adapter_timeout{};
};

} // namespace agentlink::core::scheduler
