#pragma once

/*
===============================================================================
 agentlink::core::transport::websocket::Event
===============================================================================

Event emitted by a WebSocket transport implementation and delivered to the
owning Connection through poll_event().

The transport runs its own I/O thread. Instead of cross-thread callbacks it
queues events, and Connection drains them from its poll loop, so no
Connection state is ever touched from the I/O thread.

-------------------------------------------------------------------------------
 Event types
-------------------------------------------------------------------------------

    • Open     → Channel established (handshake completed)
    • Message  → One complete text message
    • Error    → Transport-level failure (always followed by Close)
    • Close    → Transport closed (local or remote), signalled exactly once

Events of one transport instance are delivered in the order they occurred.
===============================================================================
*/

#include <cstdint>
#include <string>
#include <utility>

#include "agentlink/core/transport/error.hpp"

namespace agentlink::core::transport::websocket {

enum class EventType : std::uint8_t {
    Open    = 0,
    Message = 1,
    Close   = 2,
    Error   = 3,
};

struct Event {

    EventType type{EventType::Close};
    transport::Error error{transport::Error::None}; // valid only if type == EventType::Error
    std::string data;                               // valid only if type == EventType::Message

    static Event make_open() {
        Event ev;
        ev.type = EventType::Open;
        return ev;
    }

    static Event make_message(std::string text) {
        Event ev;
        ev.type = EventType::Message;
        ev.data = std::move(text);
        return ev;
    }

    static Event make_close() {
        Event ev;
        ev.type = EventType::Close;
        return ev;
    }

    static Event make_error(transport::Error e) {
        Event ev;
        ev.type  = EventType::Error;
        ev.error = e;
        return ev;
    }
};

} // namespace agentlink::core::transport::websocket
