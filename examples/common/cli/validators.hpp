#pragma once

#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "lcr/log/logger.hpp"


namespace agentlink::examples::cli {

// -------------------------------------------------------------
// WebSocket URL validator
// -------------------------------------------------------------
inline auto ws_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.empty() || value.rfind("ws://", 0) == 0 || value.rfind("wss://", 0) == 0) {
            return {};
        }
        return "URL must start with ws:// or wss://";
    },
    "WebSocket URL validator"
);


// -------------------------------------------------------------
// Agent argument validator: id[:name]
// -------------------------------------------------------------
inline auto agent_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.empty() || value.front() == ':') {
            return "Agent must be given as id[:name] (e.g. -a claude:Claude)";
        }
        return {};
    },
    "Agent validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        const auto lvl = lcr::log::parse_level(value);
        if (value == lcr::log::to_string(lvl)) {
            return {};
        }
        return "Log level must be one of: trace, debug, info, warn, error, fatal, off";
    },
    "Log level validator"
);

} // namespace agentlink::examples::cli
