#pragma once

/*
================================================================================
agentlink Core
================================================================================

Transport-independent building blocks of an agent gateway:

    agentlink::core::Connection<WS, Clock>
        Authenticated, self-healing channel to the coordinator

    agentlink::core::scheduler::Scheduler<Clock>
        Per-agent FIFO scheduling with one item in flight per agent

    agentlink::core::scheduler::StatusReporter<Sink>
        Scheduler transitions -> gateway:agent_status

-------------------------------------------------------------------------------
Execution Model
-------------------------------------------------------------------------------

    [Transport Thread]      (owned by the WebSocket implementation)
        recv -> queue event

    [Application Thread]
        Connection::poll -> drain events -> validate -> handlers
        Scheduler::poll  -> adapter timeouts (when configured)

    [Adapter Threads]       (owned by adapters)
        Completion::complete / fail -> advance agent queue

If progress occurs on the connection, it is because poll() was called.
================================================================================
*/

#include "agentlink/core/transport/websocket_concept.hpp"
#include "agentlink/core/transport/clock.hpp"
#include "agentlink/core/connection.hpp"
#include "agentlink/core/scheduler/scheduler.hpp"
#include "agentlink/core/scheduler/status_reporter.hpp"
