#pragma once

#include <string>

#include "agentlink/core/protocol/schema/server/messages.hpp"
#include "agentlink/core/protocol/parser/helpers.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace agentlink::core::protocol::parser::agent {

// Agent ids address scheduler entries: they must be present and non-empty.
[[nodiscard]]
inline Result parse_agent_id_required(const simdjson::dom::element& root, std::string& out) noexcept {
    auto r = helper::parse_string_required(root, "agentId", out);
    if (r != Result::Parsed) {
        return r;
    }
    return out.empty() ? Result::InvalidValue : Result::Parsed;
}

// {"type":"server:send_to_agent","agentId":..,"roomId":..,"messageId":..,"content":..,"senderName":..}
struct send_to_agent {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::server::SendToAgent& out) noexcept {
        auto r = parse_agent_id_required(root, out.agent_id);
        if (r != Result::Parsed) {
            AL_DEBUG("[PARSER] Field 'agentId' missing or invalid in send_to_agent -> reject message.");
            return r;
        }
        r = helper::parse_string_required(root, "roomId", out.room_id);
        if (r != Result::Parsed) {
            AL_DEBUG("[PARSER] Field 'roomId' missing or invalid in send_to_agent -> reject message.");
            return r;
        }
        r = helper::parse_string_required(root, "messageId", out.message_id);
        if (r != Result::Parsed) {
            AL_DEBUG("[PARSER] Field 'messageId' missing or invalid in send_to_agent -> reject message.");
            return r;
        }
        if (out.message_id.empty()) {
            AL_DEBUG("[PARSER] Field 'messageId' empty in send_to_agent -> reject message.");
            return Result::InvalidValue;
        }
        r = helper::parse_string_required(root, "content", out.content);
        if (r != Result::Parsed) {
            AL_DEBUG("[PARSER] Field 'content' missing or invalid in send_to_agent -> reject message.");
            return r;
        }
        r = helper::parse_string_required(root, "senderName", out.sender_name);
        if (r != Result::Parsed) {
            AL_DEBUG("[PARSER] Field 'senderName' missing or invalid in send_to_agent -> reject message.");
            return r;
        }
        return Result::Parsed;
    }
};

// {"type":"server:stop_agent","agentId":".."}
struct stop_agent {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::server::StopAgent& out) noexcept {
        auto r = parse_agent_id_required(root, out.agent_id);
        if (r != Result::Parsed) {
            AL_DEBUG("[PARSER] Field 'agentId' missing or invalid in stop_agent -> reject message.");
        }
        return r;
    }
};

// {"type":"server:remove_agent","agentId":".."}
struct remove_agent {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::server::RemoveAgent& out) noexcept {
        auto r = parse_agent_id_required(root, out.agent_id);
        if (r != Result::Parsed) {
            AL_DEBUG("[PARSER] Field 'agentId' missing or invalid in remove_agent -> reject message.");
        }
        return r;
    }
};

} // namespace agentlink::core::protocol::parser::agent
