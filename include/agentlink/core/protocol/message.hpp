#pragma once

#include <cstdint>
#include <string_view>
#include <variant>

#include "agentlink/core/protocol/schema/server/messages.hpp"

namespace agentlink::core::protocol {

// ===============================================
// INBOUND MESSAGE KIND (known type registry)
// ===============================================
enum class Kind : std::uint8_t {
    AuthResult,
    Pong,
    Error,
    SendToAgent,
    StopAgent,
    RemoveAgent,
    Unknown
};

[[nodiscard]]
inline constexpr Kind to_kind(std::string_view type) noexcept {
    if (type == "server:auth_result")         return Kind::AuthResult;
    if (type == "server:gateway_auth_result") return Kind::AuthResult;
    if (type == "server:pong")                return Kind::Pong;
    if (type == "server:error")               return Kind::Error;
    if (type == "server:send_to_agent")       return Kind::SendToAgent;
    if (type == "server:stop_agent")          return Kind::StopAgent;
    if (type == "server:remove_agent")        return Kind::RemoveAgent;
    return Kind::Unknown;
}

[[nodiscard]]
inline constexpr std::string_view to_string(Kind k) noexcept {
    switch (k) {
        case Kind::AuthResult:  return "server:auth_result";
        case Kind::Pong:        return "server:pong";
        case Kind::Error:       return "server:error";
        case Kind::SendToAgent: return "server:send_to_agent";
        case Kind::StopAgent:   return "server:stop_agent";
        case Kind::RemoveAgent: return "server:remove_agent";
        default:                return "unknown";
    }
}

// Tagged union of every inbound message the parser recognizes.
using InboundMessage = std::variant<
    schema::server::AuthResult,
    schema::server::Pong,
    schema::server::ErrorNotice,
    schema::server::SendToAgent,
    schema::server::StopAgent,
    schema::server::RemoveAgent
>;

} // namespace agentlink::core::protocol
