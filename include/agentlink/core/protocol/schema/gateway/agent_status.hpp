#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "lcr/json.hpp"

namespace agentlink::core::protocol {

// ===============================================
// AGENT STATUS ENUM (wire values)
// ===============================================
enum class AgentStatus : std::uint8_t {
    Online,
    Busy
};

[[nodiscard]]
inline constexpr std::string_view to_string(AgentStatus s) noexcept {
    switch (s) {
        case AgentStatus::Online: return "online";
        case AgentStatus::Busy:   return "busy";
        default:                  return "unknown";
    }
}

namespace schema::gateway {

// {"type":"gateway:agent_status","agentId":"..","status":"online|busy","queueDepth":n}
struct AgentStatus {
    static constexpr std::string_view TYPE = "gateway:agent_status";

    std::string agent_id;
    protocol::AgentStatus status{protocol::AgentStatus::Online};
    std::uint32_t queue_depth{0};

    [[nodiscard]]
    std::string to_json() const {
        std::string out;
        out.reserve(96 + agent_id.size());
        out += '{';
        lcr::json::append_field(out, "type", TYPE);
        out += ',';
        lcr::json::append_field(out, "agentId", agent_id);
        out += ',';
        lcr::json::append_field(out, "status", to_string(status));
        out += ',';
        lcr::json::append_field(out, "queueDepth", queue_depth);
        out += '}';
        return out;
    }
};

} // namespace schema::gateway
} // namespace agentlink::core::protocol
