#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include "agentlink/core/scheduler/adapter.hpp"
#include "lcr/log/logger.hpp"


namespace agentlink::examples::adapter {

// -----------------------------------------------------------------------------
// Echo adapter
// -----------------------------------------------------------------------------
//
// Stand-in for a real agent runtime: every item "runs" for a fixed delay on a
// worker thread and completes with an echo of its content. abort() fails the
// running item with "aborted".
//
class Echo final : public core::scheduler::Adapter {
public:
    Echo(std::string name, std::chrono::milliseconds delay)
        : name_(std::move(name))
        , delay_(delay)
        , worker_([this] { run_(); })
    {}

    ~Echo() override {
        dispose();
    }

    void dispatch(const core::scheduler::WorkItem& item, core::scheduler::Completion completion) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            jobs_.push_back(Job{item, std::move(completion)});
            aborted_ = false;
        }
        cv_.notify_all();
    }

    void abort() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            aborted_ = true;
        }
        cv_.notify_all();
    }

    void dispose() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
            worker_.join();
        }
    }

private:
    struct Job {
        core::scheduler::WorkItem item;
        core::scheduler::Completion completion;
    };

    std::string name_;
    std::chrono::milliseconds delay_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> jobs_;
    bool aborted_{false};
    bool stopping_{false};

    std::thread worker_;    // last: starts after every other member exists

private:
    void run_() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (true) {
            cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
            if (stopping_) {
                return;
            }
            Job job = std::move(jobs_.front());
            jobs_.pop_front();
            const bool interrupted = cv_.wait_for(lock, delay_, [this] { return aborted_ || stopping_; });
            lock.unlock();
            if (interrupted) {
                AL_INFO("[ECHO] " << name_ << " aborted '" << job.item.correlation_id << "'");
                job.completion.fail("aborted");
            } else {
                job.completion.complete(name_ + " heard " + job.item.sender_name + ": " + job.item.content);
            }
            lock.lock();
        }
    }
};

} // namespace agentlink::examples::adapter
