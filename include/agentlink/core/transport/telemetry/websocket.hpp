#pragma once

#include <ostream>
#include <type_traits>

#include "lcr/metrics/atomic/counter.hpp"
#include "lcr/format.hpp"

namespace agentlink::core::transport::telemetry {

// ============================================================================
// WebSocket Telemetry
//
// Mechanical I/O facts observed by a transport instance.
// Updated from the transport I/O thread, read from anywhere.
// ============================================================================

struct alignas(64) WebSocket final {
    lcr::metrics::atomic::counter32 connect_attempts_total;
    lcr::metrics::atomic::counter32 open_total;
    lcr::metrics::atomic::counter32 close_events_total;
    lcr::metrics::atomic::counter32 receive_errors_total;
    lcr::metrics::atomic::counter32 send_failures_total;

    lcr::metrics::atomic::counter64 messages_rx_total;
    lcr::metrics::atomic::counter64 messages_tx_total;
    lcr::metrics::atomic::counter64 bytes_rx_total;
    lcr::metrics::atomic::counter64 bytes_tx_total;

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== WebSocket Telemetry ===\n";
        os << "  Connect attempts      : " << lcr::format_number_exact(connect_attempts_total.load()) << '\n';
        os << "  Opened                : " << lcr::format_number_exact(open_total.load()) << '\n';
        os << "  Close events          : " << lcr::format_number_exact(close_events_total.load()) << '\n';
        os << "  Receive errors        : " << lcr::format_number_exact(receive_errors_total.load()) << '\n';
        os << "  Send failures         : " << lcr::format_number_exact(send_failures_total.load()) << '\n';
        os << "  Messages rx / tx      : " << lcr::format_number_exact(messages_rx_total.load())
           << " / " << lcr::format_number_exact(messages_tx_total.load()) << '\n';
        os << "  Bytes rx / tx         : " << lcr::format_bytes_scaled(bytes_rx_total.load())
           << " / " << lcr::format_bytes_scaled(bytes_tx_total.load()) << '\n';
    }
};

static_assert(std::is_standard_layout_v<WebSocket>, "telemetry::WebSocket must be standard layout");
static_assert(!std::is_polymorphic_v<WebSocket>, "telemetry::WebSocket must not be polymorphic");

} // namespace agentlink::core::transport::telemetry
