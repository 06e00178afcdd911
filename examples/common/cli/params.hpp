#pragma once

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <CLI/CLI.hpp>

#include "agentlink/core/transport/parse_url.hpp"
#include "common/cli/validators.hpp"
#include "common/logger.hpp"


namespace agentlink::examples::cli {

// -------------------------------------------------------------
// Gateway example parameters
// -------------------------------------------------------------
struct Params {
    std::string url;                                 // explicit endpoint (wins over host)
    std::string host                 = "localhost:3000";
    bool tls                         = false;
    std::string token;
    std::string gateway_id;                          // empty = "agentlink-<hostname>"
    std::string protocol_version;                    // empty = not announced
    std::vector<std::string> agents  = {"echo:Echo"};
    std::string working_directory;
    std::uint32_t reply_delay_ms     = 500;
    std::uint32_t adapter_timeout_ms = 0;            // 0 = disabled
    bool telemetry                   = false;
    std::string log_level            = "info";

    // Endpoint the Connection dials
    [[nodiscard]]
    inline std::string endpoint() const {
        if (!url.empty()) {
            return url;
        }
        return core::transport::endpoint_from_host(host, tls, core::transport::GATEWAY_ENDPOINT_PATH);
    }

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Endpoint        : " << endpoint() << "\n"
           << "  Token           : " << (token.empty() ? "(none)" : "(set)") << "\n"
           << "  Gateway id      : " << (gateway_id.empty() ? "(from hostname)" : gateway_id) << "\n"
           << "  Agents          : ";
        for (const auto& a : agents) { os << a << " "; }
        os << "\n"
           << "  Reply delay     : " << reply_delay_ms << " ms\n"
           << "  Adapter timeout : ";
        if (adapter_timeout_ms == 0) { os << "disabled"; } else { os << adapter_timeout_ms << " ms"; }
        os << "\n"
           << "  Log Level       : " << log_level << "\n";
    }
};

// -------------------------------------------------------------
// Build CLI for the gateway example
// -------------------------------------------------------------
[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    if (const char* env = std::getenv("AGENTLINK_TOKEN")) {
        params.token = env;
    }

    app.add_option("--url", params.url, "Coordinator WebSocket endpoint (overrides --host)")->check(ws_url_validator);
    app.add_option("--host", params.host, "Coordinator host[:port]; endpoint becomes ws(s)://<host>/ws/gateway")->default_val(params.host);
    app.add_flag("--tls", params.tls, "Use wss:// when deriving the endpoint from --host");
    app.add_option("-t,--token", params.token, "Bearer token (default: $AGENTLINK_TOKEN)");
    app.add_option("-g,--gateway-id", params.gateway_id, "Gateway id announced in gateway:auth (default: agentlink-<hostname>)");
    app.add_option("--protocol-version", params.protocol_version, "Protocol version announced in gateway:auth");
    app.add_option("-a,--agent", params.agents, "Agent(s) to host as id[:name] (e.g. -a claude:Claude)")->check(agent_validator);
    app.add_option("-w,--working-directory", params.working_directory, "Working directory announced for every agent");
    app.add_option("--reply-delay", params.reply_delay_ms, "Simulated work duration per message (ms)")->default_val(params.reply_delay_ms);
    app.add_option("--adapter-timeout", params.adapter_timeout_ms, "Fail items running longer than this (ms, 0 = disabled)")->default_val(params.adapter_timeout_ms);
    app.add_flag("--telemetry", params.telemetry, "Dump telemetry counters on exit");
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);

    app.footer(
        "The gateway runs until interrupted.\n"
        "Press Ctrl+C to unregister the agents and exit cleanly."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    set_log_level(params.log_level);
    return params;
}

} // namespace agentlink::examples::cli
