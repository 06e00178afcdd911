#pragma once

#include <string>
#include <string_view>

#include "lcr/json.hpp"
#include "lcr/optional.hpp"

namespace agentlink::core::protocol::schema::gateway {

// Identity of an agent hosted by this gateway
struct AgentInfo {
    std::string id;
    std::string name;
    std::string type;
    lcr::optional<std::string> working_directory{};
};

// {"type":"gateway:register_agent","agent":{"id":..,"name":..,"type":..,"workingDirectory":..}}
struct RegisterAgent {
    static constexpr std::string_view TYPE = "gateway:register_agent";

    AgentInfo agent;

    [[nodiscard]]
    std::string to_json() const {
        std::string out;
        out.reserve(128);
        out += '{';
        lcr::json::append_field(out, "type", TYPE);
        out += ",\"agent\":{";
        lcr::json::append_field(out, "id", agent.id);
        out += ',';
        lcr::json::append_field(out, "name", agent.name);
        out += ',';
        lcr::json::append_field(out, "type", agent.type);
        if (agent.working_directory.has()) {
            out += ',';
            lcr::json::append_field(out, "workingDirectory", agent.working_directory.value());
        }
        out += "}}";
        return out;
    }
};

// {"type":"gateway:unregister_agent","agentId":".."}
struct UnregisterAgent {
    static constexpr std::string_view TYPE = "gateway:unregister_agent";

    std::string agent_id;

    [[nodiscard]]
    std::string to_json() const {
        std::string out;
        out += '{';
        lcr::json::append_field(out, "type", TYPE);
        out += ',';
        lcr::json::append_field(out, "agentId", agent_id);
        out += '}';
        return out;
    }
};

} // namespace agentlink::core::protocol::schema::gateway
