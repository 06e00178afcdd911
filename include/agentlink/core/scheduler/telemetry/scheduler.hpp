#pragma once

#include <ostream>
#include <type_traits>

#include "lcr/metrics/atomic/counter.hpp"
#include "lcr/format.hpp"

namespace agentlink::core::scheduler::telemetry {

// ============================================================================
// Scheduler Telemetry
//
// Observes per-agent admission and dispatch decisions.
// Counters are shared by all agents of one Scheduler.
// ============================================================================

struct alignas(64) Scheduler final {
    // ---------------------------------------------------------------------
    // Registry
    // ---------------------------------------------------------------------

    lcr::metrics::atomic::counter32 agents_registered_total;
    lcr::metrics::atomic::counter32 agents_removed_total;
    lcr::metrics::atomic::counter32 duplicate_agent_total;

    // ---------------------------------------------------------------------
    // Admission
    // ---------------------------------------------------------------------

    lcr::metrics::atomic::counter64 enqueue_calls_total;
    lcr::metrics::atomic::counter64 queued_total;          // accepted while busy
    lcr::metrics::atomic::counter64 queue_full_total;      // rejected: queue at capacity
    lcr::metrics::atomic::counter64 unknown_agent_total;   // rejected: not registered
    lcr::metrics::atomic::gauge32   queue_depth;           // last reported depth (any agent)

    // ---------------------------------------------------------------------
    // Execution
    // ---------------------------------------------------------------------

    lcr::metrics::atomic::counter64 dispatched_total;
    lcr::metrics::atomic::counter64 completed_total;
    lcr::metrics::atomic::counter64 failed_total;
    lcr::metrics::atomic::counter64 dispatch_exceptions_total;
    lcr::metrics::atomic::counter32 timeouts_total;
    lcr::metrics::atomic::counter32 stop_calls_total;
    lcr::metrics::atomic::counter64 discarded_total;       // queued items dropped by stop/remove

    // ---------------------------------------------------------------------
    // Status
    // ---------------------------------------------------------------------

    lcr::metrics::atomic::counter64 status_reports_total;

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Scheduler Telemetry ===\n";
        os << "Registry\n";
        os << "  Agents registered     : " << lcr::format_number_exact(agents_registered_total.load()) << '\n';
        os << "  Agents removed        : " << lcr::format_number_exact(agents_removed_total.load()) << '\n';
        os << "  Duplicate registers   : " << lcr::format_number_exact(duplicate_agent_total.load()) << '\n';

        os << "\nAdmission\n";
        os << "  Enqueue calls         : " << lcr::format_number_exact(enqueue_calls_total.load()) << '\n';
        os << "  Queued                : " << lcr::format_number_exact(queued_total.load()) << '\n';
        os << "  Rejected (queue full) : " << lcr::format_number_exact(queue_full_total.load()) << '\n';
        os << "  Rejected (unknown)    : " << lcr::format_number_exact(unknown_agent_total.load()) << '\n';
        os << "  Queue depth (max)     : " << queue_depth.load() << " (" << queue_depth.max() << ")\n";

        os << "\nExecution\n";
        os << "  Dispatched            : " << lcr::format_number_exact(dispatched_total.load()) << '\n';
        os << "  Completed             : " << lcr::format_number_exact(completed_total.load()) << '\n';
        os << "  Failed                : " << lcr::format_number_exact(failed_total.load())
           << " (threw " << lcr::format_number_exact(dispatch_exceptions_total.load())
           << ", timed out " << lcr::format_number_exact(timeouts_total.load()) << ")\n";
        os << "  Stop calls            : " << lcr::format_number_exact(stop_calls_total.load()) << '\n';
        os << "  Discarded             : " << lcr::format_number_exact(discarded_total.load()) << '\n';

        os << "\nStatus\n";
        os << "  Reports               : " << lcr::format_number_exact(status_reports_total.load()) << '\n';
    }
};

static_assert(std::is_standard_layout_v<Scheduler>, "telemetry::Scheduler must be standard layout");
static_assert(!std::is_polymorphic_v<Scheduler>, "telemetry::Scheduler must not be polymorphic");

} // namespace agentlink::core::scheduler::telemetry
