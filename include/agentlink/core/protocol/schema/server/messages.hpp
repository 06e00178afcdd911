#pragma once

#include <cstdint>
#include <string>

#include "lcr/optional.hpp"

namespace agentlink::core::protocol::schema::server {

// server:auth_result / server:gateway_auth_result
struct AuthResult {
    bool ok{false};
    lcr::optional<std::string> error{};
};

// server:pong
struct Pong {
    std::uint64_t ts{0};
};

// server:error
struct ErrorNotice {
    std::string code;
    std::string message;
};

// server:send_to_agent
struct SendToAgent {
    std::string agent_id;
    std::string room_id;
    std::string message_id;
    std::string content;
    std::string sender_name;
};

// server:stop_agent
struct StopAgent {
    std::string agent_id;
};

// server:remove_agent
struct RemoveAgent {
    std::string agent_id;
};

} // namespace agentlink::core::protocol::schema::server
