#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "agentlink/core/protocol/schema/gateway/agent_status.hpp"


namespace agentlink::core::scheduler {

// Busy iff an adapter call is outstanding for the agent
enum class AgentState : std::uint8_t {
    Idle,
    Busy
};

[[nodiscard]]
inline constexpr std::string_view to_string(AgentState s) noexcept {
    switch (s) {
        case AgentState::Idle: return "idle";
        case AgentState::Busy: return "busy";
        default:               return "unknown";
    }
}

// One observable scheduler transition for one agent
struct StatusUpdate {
    std::string agent_id;
    protocol::AgentStatus status{protocol::AgentStatus::Online};
    std::uint32_t queue_depth{0};

    bool operator==(const StatusUpdate&) const = default;
};

} // namespace agentlink::core::scheduler
