#pragma once

#include <string_view>
#include <utility>

#include <simdjson.h>

#include "agentlink/core/protocol/message.hpp"
#include "agentlink/core/protocol/parser/result.hpp"
#include "agentlink/core/protocol/parser/helpers.hpp"
#include "agentlink/core/protocol/parser/system.hpp"
#include "agentlink/core/protocol/parser/agent.hpp"
#include "lcr/log/logger.hpp"


namespace agentlink::core::protocol::parser {

/*
================================================================================
Inbound Parsing Architecture
================================================================================

1) Router (Message Dispatch)
   Parses the raw text once, reads the "type" discriminator, looks it up in
   the known-type registry (protocol::to_kind) and hands the DOM root to the
   matching message parser. Unknown types return Result::Ignored; the
   Connection turns that into a validation-error event.

2) Message Parsers (Schema Validation)
   One parser per message kind. They validate required vs optional fields,
   log actionable diagnostics and populate the strongly-typed schema struct.

3) Helpers (Low-Level JSON Primitives)
   Strict, allocation-light, exception-free field extraction.

Nothing reaches application handlers unless its parser returned Parsed.
================================================================================
*/

class Router {
public:
    Router() = default;

    // Main entry point
    [[nodiscard]]
    inline Result parse(std::string_view raw_msg, InboundMessage& out) noexcept {
        simdjson::dom::element root;
        auto error = parser_.parse(raw_msg.data(), raw_msg.size()).get(root);
        if (error) {
            AL_WARN("[PARSER] JSON parse error: " << simdjson::error_message(error) << " in message: " << raw_msg);
            return Result::InvalidJson;
        }
        if (helper::require_object(root) != Result::Parsed) {
            AL_DEBUG("[PARSER] Root is not an object -> reject message.");
            return Result::InvalidSchema;
        }
        std::string_view type;
        if (helper::parse_string_required(root, "type", type) != Result::Parsed) {
            AL_DEBUG("[PARSER] Field 'type' missing or invalid -> reject message.");
            return Result::InvalidSchema;
        }
        switch (to_kind(type)) {
            case Kind::AuthResult:  return parse_as_<system::auth_result, schema::server::AuthResult>(root, out);
            case Kind::Pong:        return parse_as_<system::pong, schema::server::Pong>(root, out);
            case Kind::Error:       return parse_as_<system::error, schema::server::ErrorNotice>(root, out);
            case Kind::SendToAgent: return parse_as_<agent::send_to_agent, schema::server::SendToAgent>(root, out);
            case Kind::StopAgent:   return parse_as_<agent::stop_agent, schema::server::StopAgent>(root, out);
            case Kind::RemoveAgent: return parse_as_<agent::remove_agent, schema::server::RemoveAgent>(root, out);
            case Kind::Unknown:
            default:
                AL_DEBUG("[PARSER] Unknown message type '" << type << "' -> reject message.");
                return Result::Ignored;
        }
    }

private:
    // Underlying simdjson parser (buffers reused across messages)
    simdjson::dom::parser parser_;

    template<class Parser, class Schema>
    [[nodiscard]]
    static inline Result parse_as_(const simdjson::dom::element& root, InboundMessage& out) noexcept {
        Schema msg{};
        const auto r = Parser::parse(root, msg);
        if (r == Result::Parsed) {
            out = std::move(msg);
        }
        return r;
    }
};

} // namespace agentlink::core::protocol::parser
