#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "lcr/json.hpp"

namespace agentlink::core::protocol::schema::client {

// {"type":"client:ping","ts":<milliseconds>}
//
// Heartbeat request. Control message: stale pings are meaningless, so they
// are never queued.
struct Ping {
    using control_tag = void;
    static constexpr std::string_view TYPE = "client:ping";

    std::uint64_t ts{0};

    [[nodiscard]]
    static constexpr std::size_t max_json_size() noexcept {
        // {"type":"client:ping","ts":18446744073709551615}
        return 64;
    }

    [[nodiscard]]
    std::string to_json() const {
        std::string out;
        out.reserve(max_json_size());
        out += '{';
        lcr::json::append_field(out, "type", TYPE);
        out += ',';
        lcr::json::append_field(out, "ts", ts);
        out += '}';
        return out;
    }
};

} // namespace agentlink::core::protocol::schema::client
