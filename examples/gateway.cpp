/*
===============================================================================
agentlink gateway example
===============================================================================

Hosts one or more echo agents behind a single authenticated connection to
the coordinator:

  - connects to ws(s)://<host>/ws/gateway and authenticates with gateway:auth
  - announces every agent (gateway:register_agent)
  - schedules server:send_to_agent per agent, one item in flight each
  - reports gateway:agent_status on every scheduler transition
  - answers every item with gateway:message_complete
  - survives drops, dead peers and restarts of the coordinator

Run against a local coordinator:

    gateway --host localhost:3000 --token <jwt> -a claude:Claude -a codex:Codex
===============================================================================
*/

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "agentlink.hpp"

#include "common/cli/params.hpp"
#include "common/device.hpp"
#include "common/adapter/echo.hpp"

using WS = agentlink::WebSocketT;

// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
static std::atomic<bool> running{true};

inline void on_signal(int) {
    running.store(false);
}

int main(int argc, char** argv) {
    using namespace agentlink;

    const auto params = examples::cli::configure(argc, argv, "agentlink gateway: host agents for a remote coordinator");
    params.dump("=== agentlink gateway ===", std::cout);

    std::signal(SIGINT, on_signal);

    // -------------------------------------------------------------------------
    // Components
    // -------------------------------------------------------------------------
    core::transport::telemetry::Connection connection_telemetry;
    core::scheduler::telemetry::Scheduler scheduler_telemetry;

    core::scheduler::Config scheduler_config;
    if (params.adapter_timeout_ms > 0) {
        scheduler_config.adapter_timeout = std::chrono::milliseconds(params.adapter_timeout_ms);
    }

    core::protocol::schema::gateway::Auth identity;
    identity.device_info = examples::device_info();
    identity.gateway_id = params.gateway_id.empty()
        ? "agentlink-" + identity.device_info.hostname
        : params.gateway_id;
    if (!params.protocol_version.empty()) {
        identity.protocol_version = params.protocol_version;
    }

    core::Connection<WS> connection(params.endpoint(), connection_telemetry, gateway::connection_config(identity));
    core::scheduler::Scheduler<> scheduler(scheduler_telemetry, scheduler_config);
    gateway::Session<WS> session(connection, scheduler);

    // -------------------------------------------------------------------------
    // Agents
    // -------------------------------------------------------------------------
    for (const auto& arg : params.agents) {
        const auto sep = arg.find(':');
        core::protocol::schema::gateway::AgentInfo info;
        info.id   = arg.substr(0, sep);
        info.name = (sep == std::string::npos) ? info.id : arg.substr(sep + 1);
        info.type = "echo";
        if (!params.working_directory.empty()) {
            info.working_directory = params.working_directory;
        }
        auto adapter = std::make_unique<examples::adapter::Echo>(info.name, std::chrono::milliseconds(params.reply_delay_ms));
        if (session.add_agent(std::move(info), std::move(adapter)) != core::scheduler::Error::None) {
            std::cerr << "[example] Failed to add agent '" << arg << "'\n";
            return 1;
        }
    }

    // -------------------------------------------------------------------------
    // Connect
    // -------------------------------------------------------------------------
    if (params.token.empty()) {
        std::cerr << "[example] No token given (use --token or AGENTLINK_TOKEN)\n";
        return 1;
    }
    if (connection.connect(params.token) == core::transport::Error::InvalidUrl) {
        std::cerr << "[example] Invalid endpoint: " << params.endpoint() << "\n";
        return 1;
    }

    // -------------------------------------------------------------------------
    // Event loop
    // -------------------------------------------------------------------------
    while (running.load(std::memory_order_relaxed)) {
        connection.poll();
        scheduler.poll();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    // -------------------------------------------------------------------------
    // Shutdown
    // -------------------------------------------------------------------------
    std::cout << "\n[example] Shutting down ...\n";
    for (const auto& info : session.agents()) {
        session.remove_agent(info.id);
    }
    // Give the unregistrations a chance to hit the wire
    for (int i = 0; i < 10 && connection.connected(); ++i) {
        connection.poll();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    connection.disconnect();

    if (params.telemetry) {
        connection_telemetry.debug_dump(std::cout);
        scheduler_telemetry.debug_dump(std::cout);
    }
    std::cout << "[example] Done.\n";
    return 0;
}
