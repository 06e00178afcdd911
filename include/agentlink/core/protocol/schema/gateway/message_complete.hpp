#pragma once

#include <string>
#include <string_view>

#include "lcr/json.hpp"

namespace agentlink::core::protocol::schema::gateway {

// {"type":"gateway:message_complete","roomId":..,"agentId":..,"messageId":..,"fullContent":..}
//
// Terminal answer to one server:send_to_agent. Failures are reported with
// "Error: <reason>" content.
struct MessageComplete {
    static constexpr std::string_view TYPE = "gateway:message_complete";

    std::string room_id;
    std::string agent_id;
    std::string message_id;
    std::string full_content;

    [[nodiscard]]
    std::string to_json() const {
        std::string out;
        out.reserve(128 + full_content.size());
        out += '{';
        lcr::json::append_field(out, "type", TYPE);
        out += ',';
        lcr::json::append_field(out, "roomId", room_id);
        out += ',';
        lcr::json::append_field(out, "agentId", agent_id);
        out += ',';
        lcr::json::append_field(out, "messageId", message_id);
        out += ',';
        lcr::json::append_field(out, "fullContent", full_content);
        out += '}';
        return out;
    }
};

} // namespace agentlink::core::protocol::schema::gateway
