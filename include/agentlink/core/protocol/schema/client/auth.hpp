#pragma once

#include <string>
#include <string_view>

#include "lcr/json.hpp"

namespace agentlink::core::protocol::schema::client {

// {"type":"client:auth","token":"<bearer token>"}
//
// First message on every freshly opened channel. Control message: it is
// never queued while the channel is down.
struct Auth {
    using control_tag = void;
    static constexpr std::string_view TYPE = "client:auth";

    std::string token;

    [[nodiscard]]
    std::string to_json() const {
        std::string out;
        out.reserve(48 + token.size());
        out += '{';
        lcr::json::append_field(out, "type", TYPE);
        out += ',';
        lcr::json::append_field(out, "token", token);
        out += '}';
        return out;
    }
};

} // namespace agentlink::core::protocol::schema::client
