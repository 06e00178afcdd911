#pragma once

/*
===============================================================================
agentlink: Public API Entry Point
===============================================================================

Gateway session over the Boost.Beast transport. Link against agentlink_beast.

    agentlink::ConnectionT   Connection over transport::beast::WebSocket
    agentlink::SchedulerT    Scheduler on std::chrono::steady_clock
    agentlink::SessionT      Gateway session wiring both together
===============================================================================
*/

#include "agentlink/core.hpp"
#include "agentlink/core/transport/beast/websocket.hpp"
#include "agentlink/gateway/session.hpp"


namespace agentlink {

    using WebSocketT = core::transport::beast::WebSocket;
    using ConnectionT = core::Connection<WebSocketT>;
    using SchedulerT = core::scheduler::Scheduler<>;
    using SessionT = gateway::Session<WebSocketT>;

} // namespace agentlink
