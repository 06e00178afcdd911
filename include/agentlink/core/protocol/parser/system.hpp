#pragma once

#include <string>

#include "agentlink/core/protocol/schema/server/messages.hpp"
#include "agentlink/core/protocol/parser/helpers.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace agentlink::core::protocol::parser::system {

// {"type":"server:auth_result","ok":true|false,"error":"..."}
struct auth_result {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::server::AuthResult& out) noexcept {
        auto r = helper::parse_bool_required(root, "ok", out.ok);
        if (r != Result::Parsed) {
            AL_DEBUG("[PARSER] Field 'ok' missing or invalid in auth result -> reject message.");
            return r;
        }
        r = helper::parse_string_optional(root, "error", out.error);
        if (r != Result::Parsed) {
            AL_DEBUG("[PARSER] Field 'error' invalid in auth result -> reject message.");
            return r;
        }
        return Result::Parsed;
    }
};

// {"type":"server:pong","ts":<number>}
struct pong {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::server::Pong& out) noexcept {
        auto r = helper::parse_uint64_required(root, "ts", out.ts);
        if (r != Result::Parsed) {
            AL_DEBUG("[PARSER] Field 'ts' missing or invalid in pong -> reject message.");
            return r;
        }
        return Result::Parsed;
    }
};

// {"type":"server:error","code":"..","message":".."}
struct error {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::server::ErrorNotice& out) noexcept {
        auto r = helper::parse_string_required(root, "code", out.code);
        if (r != Result::Parsed) {
            AL_DEBUG("[PARSER] Field 'code' missing or invalid in server error -> reject message.");
            return r;
        }
        r = helper::parse_string_required(root, "message", out.message);
        if (r != Result::Parsed) {
            AL_DEBUG("[PARSER] Field 'message' missing or invalid in server error -> reject message.");
            return r;
        }
        return Result::Parsed;
    }
};

} // namespace agentlink::core::protocol::parser::system
