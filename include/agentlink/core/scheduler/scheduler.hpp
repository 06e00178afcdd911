#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "agentlink/core/scheduler/adapter.hpp"
#include "agentlink/core/scheduler/config.hpp"
#include "agentlink/core/scheduler/error.hpp"
#include "agentlink/core/scheduler/state.hpp"
#include "agentlink/core/scheduler/work_item.hpp"
#include "agentlink/core/scheduler/telemetry/scheduler.hpp"
#include "agentlink/core/transport/clock.hpp"
#include "agentlink/core/telemetry.hpp"
#include "lcr/optional.hpp"
#include "lcr/format.hpp"
#include "lcr/log/logger.hpp"


namespace agentlink::core::scheduler {

/*
===============================================================================
 agentlink::core::scheduler::Scheduler
===============================================================================

Per-agent work scheduler: at most one item in flight per agent, the rest
queued in arrival order up to a fixed capacity.

-------------------------------------------------------------------------------
 Per-agent lifecycle
-------------------------------------------------------------------------------
    Idle --enqueue--> Busy (dispatch now, report busy/0)
    Busy --enqueue--> Busy (append, report busy/depth) or QueueFull
    Busy --finished, queue non-empty--> Busy (dispatch head, report busy/depth)
    Busy --finished, queue empty--> Idle (report online/0)

Success and failure of an item advance the queue identically. A failed item
never stalls the items behind it.

-------------------------------------------------------------------------------
 Status reporting
-------------------------------------------------------------------------------
Each transition produces one StatusUpdate for the status sink. Consecutive
identical (status, depth) pairs of the same agent are reported once.

-------------------------------------------------------------------------------
 Threading Model
-------------------------------------------------------------------------------
- The registry (id -> entry) is guarded by its own mutex
- Each entry is an independently lockable record
- Adapter dispatch/abort/dispose run outside every lock
- Completions may arrive on any thread, including inside dispatch()
- Different agents never contend during dispatch

Adapters must have stopped signalling completions before the Scheduler is
destroyed. Destruction disposes every remaining adapter.
===============================================================================
*/

template <transport::ClockConcept Clock = std::chrono::steady_clock>
class Scheduler {
public:
    using time_point         = typename Clock::time_point;
    using StatusSink         = std::function<void(const StatusUpdate&)>;
    using CompletionObserver = std::function<void(const WorkResult&)>;

public:
    explicit Scheduler(telemetry::Scheduler& telemetry, Config config = {})
        : telemetry_(telemetry)
        , config_(config)
    {}

    ~Scheduler() {
        std::unordered_map<std::string, std::shared_ptr<Entry>> agents;
        {
            std::lock_guard<std::mutex> lock(registry_mutex_);
            agents.swap(agents_);
        }
        for (auto& [id, entry] : agents) {
            retire_(*entry);
        }
    }

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Receives every de-duplicated status transition. Set before registering
    // agents; invoked under the reporting agent's lock.
    void set_status_sink(StatusSink sink) {
        status_sink_ = std::move(sink);
    }

    // Receives the outcome of every finished item of a registered agent
    void set_completion_observer(CompletionObserver observer) {
        completion_observer_ = std::move(observer);
    }

    // -------------------------------------------------------------------------
    // Registry
    // -------------------------------------------------------------------------

    [[nodiscard]]
    Error register_agent(std::string agent_id, std::unique_ptr<Adapter> adapter) {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        if (agents_.find(agent_id) != agents_.end()) {
            AL_WARN("[SCHED] Agent already registered: " << agent_id);
            AL_TL1( telemetry_.duplicate_agent_total.inc() );
            return Error::DuplicateAgent;
        }
        auto entry = std::make_shared<Entry>();
        entry->id = agent_id;
        entry->adapter = std::shared_ptr<Adapter>(std::move(adapter));
        agents_.emplace(std::move(agent_id), std::move(entry));
        AL_TL1( telemetry_.agents_registered_total.inc() );
        AL_INFO("[SCHED] Agent registered: " << agents_.size() << " agent(s) total");
        return Error::None;
    }

    // Disposes the adapter and discards the queue. Unknown ids are ignored.
    void remove_agent(const std::string& agent_id) {
        std::shared_ptr<Entry> entry;
        {
            std::lock_guard<std::mutex> lock(registry_mutex_);
            auto it = agents_.find(agent_id);
            if (it == agents_.end()) {
                AL_DEBUG("[SCHED] remove_agent() ignored: unknown agent '" << agent_id << "'");
                return;
            }
            entry = std::move(it->second);
            agents_.erase(it);
        }
        retire_(*entry);
        AL_TL1( telemetry_.agents_removed_total.inc() );
        AL_INFO("[SCHED] Agent removed: " << agent_id);
    }

    // -------------------------------------------------------------------------
    // Work
    // -------------------------------------------------------------------------

    [[nodiscard]]
    Error enqueue(const std::string& agent_id, WorkItem item) {
        AL_TL1( telemetry_.enqueue_calls_total.inc() );
        auto entry = find_(agent_id);
        if (!entry) {
            AL_DEBUG("[SCHED] enqueue() rejected: unknown agent '" << agent_id << "'");
            AL_TL1( telemetry_.unknown_agent_total.inc() );
            return Error::UnknownAgent;
        }
        std::shared_ptr<Adapter> adapter;
        std::shared_ptr<detail::Ticket> ticket;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            if (entry->removed) {
                AL_TL1( telemetry_.unknown_agent_total.inc() );
                return Error::UnknownAgent;
            }
            if (entry->state == AgentState::Busy) {
                if (entry->queue.size() >= config_.queue_capacity) {
                    AL_WARN("[SCHED] Queue full for agent '" << agent_id << "' (" << entry->queue.size()
                            << "), rejecting '" << item.correlation_id << "'");
                    AL_TL1( telemetry_.queue_full_total.inc() );
                    return Error::QueueFull;
                }
                entry->queue.push_back(std::move(item));
                AL_TL1( telemetry_.queued_total.inc() );
                report_locked_(*entry, protocol::AgentStatus::Busy, entry->queue.size());
                return Error::None;
            }
            entry->state = AgentState::Busy;
            ticket = arm_locked_(entry, item);
            report_locked_(*entry, protocol::AgentStatus::Busy, 0);
            adapter = entry->adapter;
        }
        dispatch_(*entry, adapter, ticket, item);
        return Error::None;
    }

    // Discards the queued items and asks the adapter to abort the item in
    // flight. The agent stays registered; the in-flight item still finishes
    // through its Completion.
    [[nodiscard]]
    Error stop(const std::string& agent_id) {
        AL_TL1( telemetry_.stop_calls_total.inc() );
        auto entry = find_(agent_id);
        if (!entry) {
            AL_DEBUG("[SCHED] stop() rejected: unknown agent '" << agent_id << "'");
            return Error::UnknownAgent;
        }
        std::shared_ptr<Adapter> adapter;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            if (entry->removed) {
                return Error::UnknownAgent;
            }
            const std::size_t discarded = entry->queue.size();
            entry->queue.clear();
            AL_TL1( telemetry_.discarded_total.inc(discarded) );
            AL_INFO("[SCHED] Stopping agent '" << agent_id << "' (" << discarded << " queued item(s) discarded)");
            if (entry->state != AgentState::Busy) {
                return Error::None;
            }
            report_locked_(*entry, protocol::AgentStatus::Busy, 0);
            adapter = entry->adapter;
        }
        adapter->abort();
        return Error::None;
    }

    // Enforces Config::adapter_timeout. No-op when the timeout is disabled.
    void poll() {
        if (!config_.adapter_timeout.has()) {
            return;
        }
        const auto limit = std::chrono::duration_cast<typename Clock::duration>(config_.adapter_timeout.value());
        const auto now = Clock::now();
        for (const auto& entry : snapshot_()) {
            std::shared_ptr<detail::Ticket> ticket;
            std::shared_ptr<Adapter> adapter;
            {
                std::lock_guard<std::mutex> lock(entry->mutex);
                if (entry->removed || !entry->inflight || now - entry->dispatched_at < limit) {
                    continue;
                }
                ticket = entry->inflight;
                adapter = entry->adapter;
            }
            if (!ticket->try_claim()) {
                continue; // finished concurrently
            }
            AL_WARN("[SCHED] Agent '" << entry->id << "' exceeded " << lcr::format_delay(config_.adapter_timeout.value())
                    << ", failing in-flight item.");
            AL_TL1( telemetry_.timeouts_total.inc() );
            adapter->abort();
            ticket->run_finish(Outcome::Failed, "timed out");
        }
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]]
    bool has_agent(const std::string& agent_id) const {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        return agents_.find(agent_id) != agents_.end();
    }

    [[nodiscard]]
    lcr::optional<AgentState> state(const std::string& agent_id) const {
        auto entry = find_(agent_id);
        if (!entry) {
            return {};
        }
        std::lock_guard<std::mutex> lock(entry->mutex);
        return entry->state;
    }

    // Items accepted but not yet dispatched (0 for unknown agents)
    [[nodiscard]]
    std::size_t queue_depth(const std::string& agent_id) const {
        auto entry = find_(agent_id);
        if (!entry) {
            return 0;
        }
        std::lock_guard<std::mutex> lock(entry->mutex);
        return entry->queue.size();
    }

    // Registered agent ids, sorted
    [[nodiscard]]
    std::vector<std::string> agents() const {
        std::vector<std::string> ids;
        {
            std::lock_guard<std::mutex> lock(registry_mutex_);
            ids.reserve(agents_.size());
            for (const auto& [id, entry] : agents_) {
                ids.push_back(id);
            }
        }
        std::sort(ids.begin(), ids.end());
        return ids;
    }

    [[nodiscard]]
    std::size_t size() const {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        return agents_.size();
    }

private:
    struct Entry {
        std::mutex mutex;
        std::string id;                                 // immutable after registration
        std::shared_ptr<Adapter> adapter;
        AgentState state{AgentState::Idle};
        std::deque<WorkItem> queue;

        // In-flight item
        std::shared_ptr<detail::Ticket> inflight;
        std::uint64_t inflight_seq{0};
        std::uint64_t next_seq{1};
        time_point dispatched_at{};

        lcr::optional<StatusUpdate> last_reported;
        bool removed{false};
    };

private:
    telemetry::Scheduler& telemetry_;
    Config config_;

    mutable std::mutex registry_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> agents_;

    StatusSink status_sink_;
    CompletionObserver completion_observer_;

private:
    [[nodiscard]]
    std::shared_ptr<Entry> find_(const std::string& agent_id) const {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = agents_.find(agent_id);
        return it == agents_.end() ? nullptr : it->second;
    }

    [[nodiscard]]
    std::vector<std::shared_ptr<Entry>> snapshot_() const {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        std::vector<std::shared_ptr<Entry>> out;
        out.reserve(agents_.size());
        for (const auto& [id, entry] : agents_) {
            out.push_back(entry);
        }
        return out;
    }

    // Creates the ticket of the item about to be dispatched (entry lock held)
    std::shared_ptr<detail::Ticket> arm_locked_(const std::shared_ptr<Entry>& entry, const WorkItem& item) {
        const std::uint64_t seq = entry->next_seq++;
        std::weak_ptr<Entry> weak = entry;
        auto ticket = std::make_shared<detail::Ticket>(
            [this, weak, seq, agent_id = entry->id, correlation_id = item.correlation_id, room_id = item.room_id]
            (Outcome outcome, std::string payload) {
                on_finished_(weak, seq, WorkResult{agent_id, correlation_id, room_id, outcome, std::move(payload)});
            });
        entry->inflight = ticket;
        entry->inflight_seq = seq;
        entry->dispatched_at = Clock::now();
        return ticket;
    }

    void dispatch_(const Entry& entry, const std::shared_ptr<Adapter>& adapter,
                   const std::shared_ptr<detail::Ticket>& ticket, const WorkItem& item) {
        AL_TRACE("[SCHED] Dispatching '" << item.correlation_id << "' to agent '" << entry.id << "'");
        AL_TL1( telemetry_.dispatched_total.inc() );
        ticket->begin_dispatch();
        try {
            adapter->dispatch(item, Completion(ticket));
        }
        catch (const std::exception& e) {
            (void)ticket->end_dispatch();
            AL_ERROR("[SCHED] Adapter of agent '" << entry.id << "' threw from dispatch: " << e.what());
            AL_TL1( telemetry_.dispatch_exceptions_total.inc() );
            (void)ticket->settle(Outcome::Failed, e.what());
            return;
        }
        if (ticket->end_dispatch()) {
            AL_WARN("[SCHED] Adapter of agent '" << entry.id << "' dropped its completion.");
            (void)ticket->settle(Outcome::Failed, "adapter dropped completion");
        }
    }

    void on_finished_(const std::weak_ptr<Entry>& weak, std::uint64_t seq, WorkResult result) {
        auto entry = weak.lock();
        if (!entry) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            if (entry->removed || entry->inflight_seq != seq) {
                AL_DEBUG("[SCHED] Stale completion for '" << result.correlation_id << "' ignored.");
                return;
            }
            entry->inflight.reset();
            entry->inflight_seq = 0;
        }
        if (result.ok()) {
            AL_TL1( telemetry_.completed_total.inc() );
            AL_DEBUG("[SCHED] Agent '" << result.agent_id << "' completed '" << result.correlation_id << "'");
        } else {
            AL_TL1( telemetry_.failed_total.inc() );
            AL_WARN("[SCHED] Agent '" << result.agent_id << "' failed '" << result.correlation_id << "': " << result.payload);
        }
        if (completion_observer_) {
            completion_observer_(result);
        }
        advance_(entry);
    }

    // Dispatches the queue head, or goes idle
    void advance_(const std::shared_ptr<Entry>& entry) {
        std::shared_ptr<Adapter> adapter;
        std::shared_ptr<detail::Ticket> ticket;
        WorkItem next;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            if (entry->removed || entry->inflight) {
                return;
            }
            if (entry->queue.empty()) {
                entry->state = AgentState::Idle;
                report_locked_(*entry, protocol::AgentStatus::Online, 0);
                return;
            }
            next = std::move(entry->queue.front());
            entry->queue.pop_front();
            ticket = arm_locked_(entry, next);
            report_locked_(*entry, protocol::AgentStatus::Busy, entry->queue.size());
            adapter = entry->adapter;
        }
        dispatch_(*entry, adapter, ticket, next);
    }

    void report_locked_(Entry& entry, protocol::AgentStatus status, std::size_t depth) {
        StatusUpdate update{entry.id, status, static_cast<std::uint32_t>(depth)};
        if (entry.last_reported.has() && entry.last_reported.value() == update) {
            return;
        }
        AL_DEBUG("[SCHED] Agent '" << entry.id << "' -> " << to_string(status) << " (queue " << depth << ")");
        AL_TL1( telemetry_.status_reports_total.inc() );
        AL_TL1( telemetry_.queue_depth.set(update.queue_depth) );
        entry.last_reported = update;
        if (status_sink_) {
            status_sink_(update);
        }
    }

    // Detaches an entry: late completions are ignored, the adapter disposed
    void retire_(Entry& entry) {
        std::shared_ptr<Adapter> adapter;
        {
            std::lock_guard<std::mutex> lock(entry.mutex);
            entry.removed = true;
            AL_TL1( telemetry_.discarded_total.inc(entry.queue.size()) );
            entry.queue.clear();
            if (entry.inflight) {
                (void)entry.inflight->try_claim();
                entry.inflight.reset();
            }
            adapter = std::move(entry.adapter);
        }
        if (adapter) {
            adapter->dispose();
        }
    }
};

} // namespace agentlink::core::scheduler
