/*
===============================================================================
WebSocketConcept
===============================================================================

Defines the minimal transport contract required by Connection.

The WebSocket implementation:

  • Is constructed from its telemetry block
  • Starts opening on connect() and reports completion asynchronously
    (Open, or Error followed by Close)
  • Queues Message / Close / Error events for poll_event()
  • Is fully lifecycle-managed by Connection (one instance per attempt)

connect() only returns an error for failures detectable before any I/O
(invalid endpoint, transport already started). Everything else arrives as
events.

No callbacks.
No dynamic dispatch.
===============================================================================
*/
#pragma once

#include <string>
#include <concepts>

#include "agentlink/core/transport/error.hpp"
#include "agentlink/core/transport/parse_url.hpp"
#include "agentlink/core/transport/websocket/events.hpp"
#include "agentlink/core/transport/telemetry/websocket.hpp"


namespace agentlink::core::transport {

template<class WS>
concept WebSocketConcept =
    std::constructible_from<WS, telemetry::WebSocket&> &&
    requires(
        WS ws,
        const ParsedUrl& url,
        const std::string& msg,
        websocket::Event& ev
    )
{
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    { ws.connect(url) } noexcept -> std::same_as<Error>;
    { ws.close() } noexcept -> std::same_as<void>;

    // ---------------------------------------------------------------------
    // Sending
    // ---------------------------------------------------------------------

    { ws.send(msg) } noexcept -> std::same_as<bool>;

    // ---------------------------------------------------------------------
    // Event polling
    // ---------------------------------------------------------------------

    { ws.poll_event(ev) } noexcept -> std::same_as<bool>;
};

} // namespace agentlink::core::transport
