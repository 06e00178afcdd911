#pragma once

#include <string>
#include <string_view>

#include "lcr/json.hpp"
#include "lcr/optional.hpp"

namespace agentlink::core::protocol::schema::gateway {

// Host the gateway runs on, as announced at authentication
struct DeviceInfo {
    std::string hostname;
    std::string platform;
    std::string arch;
    std::string runtime_version;   // wire name "nodeVersion"
};

// {"type":"gateway:auth","token":"..","gatewayId":"..","protocolVersion":"..",
//  "deviceInfo":{"hostname":"..","platform":"..","arch":"..","nodeVersion":".."},
//  "ephemeral":true}
//
// First message on every freshly opened /ws/gateway channel. Control message.
// protocolVersion and ephemeral are omitted when unset.
struct Auth {
    using control_tag = void;
    static constexpr std::string_view TYPE = "gateway:auth";

    std::string token;
    std::string gateway_id;
    lcr::optional<std::string> protocol_version{};
    DeviceInfo device_info{};
    bool ephemeral{false};

    [[nodiscard]]
    std::string to_json() const {
        std::string out;
        out.reserve(192 + token.size());
        out += '{';
        lcr::json::append_field(out, "type", TYPE);
        out += ',';
        lcr::json::append_field(out, "token", token);
        out += ',';
        lcr::json::append_field(out, "gatewayId", gateway_id);
        if (protocol_version.has()) {
            out += ',';
            lcr::json::append_field(out, "protocolVersion", protocol_version.value());
        }
        out += ",\"deviceInfo\":{";
        lcr::json::append_field(out, "hostname", device_info.hostname);
        out += ',';
        lcr::json::append_field(out, "platform", device_info.platform);
        out += ',';
        lcr::json::append_field(out, "arch", device_info.arch);
        out += ',';
        lcr::json::append_field(out, "nodeVersion", device_info.runtime_version);
        out += '}';
        if (ephemeral) {
            out += ",\"ephemeral\":true";
        }
        out += '}';
        return out;
    }
};

} // namespace agentlink::core::protocol::schema::gateway
