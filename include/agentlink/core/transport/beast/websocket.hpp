#pragma once

#include <memory>
#include <string>

#include "agentlink/core/transport/websocket_concept.hpp"
#include "agentlink/core/transport/error.hpp"
#include "agentlink/core/transport/parse_url.hpp"
#include "agentlink/core/transport/websocket/events.hpp"
#include "agentlink/core/transport/telemetry/websocket.hpp"

/*
================================================================================
WebSocket Transport (Boost.Beast)
================================================================================

Production transport for Connection, built on Boost.Beast over Boost.Asio TCP
with OpenSSL TLS for wss:// endpoints.

Design highlights:
  • Single-connection transport primitive: no retries, no reconnection logic
  • Policy-free: authentication, heartbeat and recovery live in Connection
  • Own I/O thread per instance; nothing crosses back into Connection except
    events queued for poll_event()
  • Failure-first signaling: an Error event (if any) followed by exactly one
    Close event
  • Deterministic lifecycle: close() is idempotent and joins the I/O thread

TLS endpoints are verified against the system trust store (peer certificate
chain plus host name), with SNI set to the endpoint host.
================================================================================
*/

namespace agentlink::core::transport::beast {

class WebSocket {
public:
    explicit WebSocket(telemetry::WebSocket& telemetry) noexcept;
    ~WebSocket();

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    // Starts resolving, connecting and handshaking in the background.
    // Completion is reported as an Open event (or Error + Close).
    [[nodiscard]]
    Error connect(const ParsedUrl& url) noexcept;

    // Queues one text frame. Returns false if the channel is not open.
    [[nodiscard]]
    bool send(const std::string& msg) noexcept;

    // Closes the channel (close frame when open) and joins the I/O thread.
    void close() noexcept;

    [[nodiscard]]
    bool poll_event(websocket::Event& out) noexcept;

private:
    struct Runtime;

    telemetry::WebSocket& telemetry_;
    std::unique_ptr<Runtime> rt_;
};

static_assert(WebSocketConcept<WebSocket>);

} // namespace agentlink::core::transport::beast
