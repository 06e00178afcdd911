#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "agentlink/core/scheduler/work_item.hpp"
#include "lcr/log/logger.hpp"


namespace agentlink::core::scheduler {

/*
===============================================================================
 scheduler::Adapter / scheduler::Completion
===============================================================================

The Adapter is the external collaborator that executes work items for one
agent (spawns a process, calls a model API, ...). The Scheduler only sees
this narrow contract:

    dispatch(item, completion)  start executing one item, return promptly
    abort()                     best-effort cancellation of the item in flight
    dispose()                   release everything, the agent is going away

Every dispatched item is finished through its Completion, exactly once:

    completion.complete(full_content)   success
    completion.fail(reason)             failure

Completion is move-only and once-only. The first signal wins; later signals
are ignored and logged. A Completion destroyed without a signal finishes the
item as failed ("adapter dropped completion"), so an adapter cannot leave its
agent busy by forgetting to call back. A dispatch() that throws a
std::exception finishes the item as failed with the exception message.

Completions may be signalled from any thread, including synchronously from
inside dispatch().
===============================================================================
*/

namespace detail {

// Shared between a Completion and the Scheduler that issued it
class Ticket {
public:
    using Finish = std::function<void(Outcome, std::string)>;

    explicit Ticket(Finish finish)
        : finish_(std::move(finish)) {}

    // Runs finish once. Returns false if the item was already settled.
    bool settle(Outcome outcome, std::string payload) {
        bool expected = false;
        if (!settled_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            return false;
        }
        finish_(outcome, std::move(payload));
        return true;
    }

    // Marks settled without running finish (timeout path runs it itself)
    [[nodiscard]]
    bool try_claim() noexcept {
        bool expected = false;
        return settled_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
    }

    inline void run_finish(Outcome outcome, std::string payload) {
        finish_(outcome, std::move(payload));
    }

    [[nodiscard]]
    inline bool settled() const noexcept {
        return settled_.load(std::memory_order_acquire);
    }

    inline void begin_dispatch() {
        std::lock_guard<std::mutex> lock(mutex_);
        in_dispatch_ = true;
    }

    // Returns true if the Completion was dropped while dispatch() was running
    [[nodiscard]]
    inline bool end_dispatch() {
        std::lock_guard<std::mutex> lock(mutex_);
        in_dispatch_ = false;
        return dropped_;
    }

    // Unsignalled Completion destroyed. Inside dispatch() the decision is
    // deferred to the Scheduler, which may still see an exception.
    inline void dropped() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (in_dispatch_) {
                dropped_ = true;
                return;
            }
        }
        AL_WARN("[SCHED] Adapter dropped a completion without signalling it.");
        (void)settle(Outcome::Failed, "adapter dropped completion");
    }

private:
    Finish finish_;
    std::atomic<bool> settled_{false};

    std::mutex mutex_;
    bool in_dispatch_{false};
    bool dropped_{false};
};

} // namespace detail


class Completion {
public:
    Completion() = default;

    explicit Completion(std::shared_ptr<detail::Ticket> ticket)
        : ticket_(std::move(ticket)) {}

    Completion(const Completion&) = delete;
    Completion& operator=(const Completion&) = delete;

    Completion(Completion&&) noexcept = default;

    Completion& operator=(Completion&& other) noexcept {
        if (this != &other) {
            release_();
            ticket_ = std::move(other.ticket_);
        }
        return *this;
    }

    ~Completion() {
        release_();
    }

    // Returns false if the item was already finished
    bool complete(std::string full_content) {
        return signal_(Outcome::Completed, std::move(full_content));
    }

    // Returns false if the item was already finished
    bool fail(std::string reason) {
        return signal_(Outcome::Failed, std::move(reason));
    }

    // True once this item has been finished (by any party)
    [[nodiscard]]
    bool done() const noexcept {
        return !ticket_ || ticket_->settled();
    }

private:
    std::shared_ptr<detail::Ticket> ticket_;

private:
    bool signal_(Outcome outcome, std::string payload) {
        if (!ticket_) {
            AL_WARN("[SCHED] Completion signalled more than once (" << to_string(outcome) << "), ignored.");
            return false;
        }
        auto ticket = std::move(ticket_);
        if (!ticket->settle(outcome, std::move(payload))) {
            AL_DEBUG("[SCHED] Late completion (" << to_string(outcome) << ") ignored: item already finished.");
            return false;
        }
        return true;
    }

    void release_() {
        if (ticket_ && !ticket_->settled()) {
            ticket_->dropped();
        }
        ticket_.reset();
    }
};


class Adapter {
public:
    virtual ~Adapter() = default;

    // Starts executing one item. Must not block until the item finishes.
    // A std::exception thrown from here fails the item and the queue moves
    // on. Any other thrown type propagates out of Scheduler::enqueue() or out
    // of the Completion call that advanced the queue, and leaves the agent
    // Busy until the adapter timeout (if configured) expires or the agent is
    // removed: throw only std::exception types.
    virtual void dispatch(const WorkItem& item, Completion completion) = 0;

    // Best-effort cancellation of the item in flight. Its Completion still
    // has to be signalled.
    virtual void abort() = 0;

    // The agent was removed. No further calls follow.
    virtual void dispose() = 0;
};

} // namespace agentlink::core::scheduler
