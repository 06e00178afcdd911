#pragma once

#include <ostream>
#include <type_traits>

#include "agentlink/core/transport/telemetry/websocket.hpp"

#include "lcr/metrics/atomic/counter.hpp"
#include "lcr/format.hpp"

namespace agentlink::core::transport::telemetry {

// ============================================================================
// Connection Telemetry
//
// Observes connection-level decisions (auth, heartbeat, retry, queueing).
// Does NOT duplicate WebSocket telemetry.
// ============================================================================

struct alignas(64) Connection final {
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    // connect() / reconnect() invoked by user
    lcr::metrics::atomic::counter32 connect_calls_total;

    // Transport opened and credentials accepted
    lcr::metrics::atomic::counter32 auth_success_total;

    // Credentials rejected by the peer
    lcr::metrics::atomic::counter32 auth_rejected_total;

    // Explicit disconnect() invoked by user
    lcr::metrics::atomic::counter32 disconnect_calls_total;

    // Transport closed unexpectedly (any cause)
    lcr::metrics::atomic::counter32 disconnect_events_total;

    // ---------------------------------------------------------------------
    // Heartbeat
    // ---------------------------------------------------------------------

    lcr::metrics::atomic::counter64 pings_sent_total;
    lcr::metrics::atomic::counter64 pongs_received_total;
    lcr::metrics::atomic::counter32 pong_timeouts_total;

    // ---------------------------------------------------------------------
    // Retry mechanics
    // ---------------------------------------------------------------------

    lcr::metrics::atomic::counter32 retry_scheduled_total;
    lcr::metrics::atomic::counter32 retry_attempts_total;
    lcr::metrics::atomic::counter32 retries_exhausted_total;
    lcr::metrics::atomic::counter32 token_refresh_total;
    lcr::metrics::atomic::counter32 token_refresh_failures_total;

    // ---------------------------------------------------------------------
    // Inbound
    // ---------------------------------------------------------------------

    lcr::metrics::atomic::counter64 messages_forwarded_total;
    lcr::metrics::atomic::counter64 validation_errors_total;

    // ---------------------------------------------------------------------
    // Outbound
    // ---------------------------------------------------------------------

    lcr::metrics::atomic::counter64 send_calls_total;
    lcr::metrics::atomic::counter64 send_queued_total;
    lcr::metrics::atomic::counter64 control_dropped_total;
    lcr::metrics::atomic::counter64 queue_overflow_total;
    lcr::metrics::atomic::counter64 queue_flushed_total;
    lcr::metrics::atomic::gauge32   pending_messages;

    // ---------------------------------------------------------------------
    // Sub-telemetry
    // ---------------------------------------------------------------------

    transport::telemetry::WebSocket websocket;

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Connection Telemetry ===\n";
        os << "Lifecycle\n";
        os << "  Connect calls         : " << lcr::format_number_exact(connect_calls_total.load()) << '\n';
        os << "  Auth success          : " << lcr::format_number_exact(auth_success_total.load()) << '\n';
        os << "  Auth rejected         : " << lcr::format_number_exact(auth_rejected_total.load()) << '\n';
        os << "  Disconnect calls      : " << lcr::format_number_exact(disconnect_calls_total.load()) << '\n';
        os << "  Disconnect events     : " << lcr::format_number_exact(disconnect_events_total.load()) << '\n';

        os << "\nHeartbeat\n";
        os << "  Pings sent            : " << lcr::format_number_exact(pings_sent_total.load()) << '\n';
        os << "  Pongs received        : " << lcr::format_number_exact(pongs_received_total.load()) << '\n';
        os << "  Pong timeouts         : " << lcr::format_number_exact(pong_timeouts_total.load()) << '\n';

        os << "\nRetry\n";
        os << "  Retries scheduled     : " << lcr::format_number_exact(retry_scheduled_total.load()) << '\n';
        os << "  Retry attempts        : " << lcr::format_number_exact(retry_attempts_total.load()) << '\n';
        os << "  Retries exhausted     : " << lcr::format_number_exact(retries_exhausted_total.load()) << '\n';
        os << "  Token refreshes       : " << lcr::format_number_exact(token_refresh_total.load())
           << " (failed " << lcr::format_number_exact(token_refresh_failures_total.load()) << ")\n";

        os << "\nInbound\n";
        os << "  Messages forwarded    : " << lcr::format_number_exact(messages_forwarded_total.load()) << '\n';
        os << "  Validation errors     : " << lcr::format_number_exact(validation_errors_total.load()) << '\n';

        os << "\nOutbound\n";
        os << "  Send calls            : " << lcr::format_number_exact(send_calls_total.load()) << '\n';
        os << "  Queued                : " << lcr::format_number_exact(send_queued_total.load()) << '\n';
        os << "  Control dropped       : " << lcr::format_number_exact(control_dropped_total.load()) << '\n';
        os << "  Queue overflow        : " << lcr::format_number_exact(queue_overflow_total.load()) << '\n';
        os << "  Flushed               : " << lcr::format_number_exact(queue_flushed_total.load()) << '\n';
        os << "  Pending (max)         : " << pending_messages.load() << " (" << pending_messages.max() << ")\n";

        websocket.debug_dump(os);
    }
};

static_assert(std::is_standard_layout_v<Connection>, "telemetry::Connection must be standard layout");
static_assert(!std::is_polymorphic_v<Connection>, "telemetry::Connection must not be polymorphic");
static_assert(alignof(Connection) == 64, "telemetry::Connection must be cache-line aligned");

} // namespace agentlink::core::transport::telemetry
