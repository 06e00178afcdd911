#pragma once

#include <concepts>

#include "agentlink/core/scheduler/state.hpp"
#include "agentlink/core/protocol/schema/gateway/agent_status.hpp"
#include "lcr/log/logger.hpp"


namespace agentlink::core::scheduler {

// Anything able to deliver a gateway:agent_status (the Connection)
template<class Sink>
concept StatusSinkConcept =
    requires(Sink& sink, const protocol::schema::gateway::AgentStatus& msg) {
        { sink.send(msg) } -> std::convertible_to<bool>;
    };

// -----------------------------------------------------------------------------
// StatusReporter
// -----------------------------------------------------------------------------
//
// Stateless translator from scheduler transitions to gateway:agent_status
// messages. De-duplication happens in the Scheduler; every update received
// here is sent exactly once.
//
template<StatusSinkConcept Sink>
class StatusReporter {
public:
    explicit StatusReporter(Sink& sink)
        : sink_(sink) {}

    void report(const StatusUpdate& update) const {
        const protocol::schema::gateway::AgentStatus msg{update.agent_id, update.status, update.queue_depth};
        if (!sink_.send(msg)) {
            AL_WARN("[STATUS] Status of agent '" << update.agent_id << "' not delivered ("
                    << to_string(update.status) << ", queue " << update.queue_depth << ")");
            return;
        }
        AL_TRACE("[STATUS] " << update.agent_id << ": " << to_string(update.status) << " (queue " << update.queue_depth << ")");
    }

    // Usable directly as Scheduler::StatusSink
    void operator()(const StatusUpdate& update) const {
        report(update);
    }

private:
    Sink& sink_;
};

} // namespace agentlink::core::scheduler
