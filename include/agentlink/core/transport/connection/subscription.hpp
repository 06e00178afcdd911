#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>


namespace agentlink::core::transport::connection {

// -----------------------------------------------------------------------------
// Subscription
// -----------------------------------------------------------------------------
//
// Handle returned by every on_xxx() registration. unsubscribe() removes the
// handler; it is idempotent and safe after the publisher is gone.
// Destroying the handle does NOT unsubscribe.
//
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> cancel)
        : cancel_(std::move(cancel)) {}

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&&) noexcept = default;
    Subscription& operator=(Subscription&&) noexcept = default;

    inline void unsubscribe() {
        if (cancel_) {
            auto cancel = std::move(cancel_);
            cancel_ = nullptr;
            cancel();
        }
    }

    [[nodiscard]]
    inline bool active() const noexcept {
        return static_cast<bool>(cancel_);
    }

private:
    std::function<void()> cancel_;
};


// -----------------------------------------------------------------------------
// HandlerList
// -----------------------------------------------------------------------------
//
// Thread-safe list of handlers sharing one signature. invoke() runs over a
// snapshot, so handlers may subscribe or unsubscribe while being invoked.
//
template<class... Args>
class HandlerList {
public:
    using Handler = std::function<void(Args...)>;

    [[nodiscard]]
    Subscription add(Handler handler) {
        std::uint64_t id;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            id = state_->next_id++;
            state_->handlers.emplace_back(id, std::make_shared<Handler>(std::move(handler)));
        }
        std::weak_ptr<State> weak = state_;
        return Subscription([weak, id] {
            if (auto state = weak.lock()) {
                std::lock_guard<std::mutex> lock(state->mutex);
                auto& hs = state->handlers;
                for (auto it = hs.begin(); it != hs.end(); ++it) {
                    if (it->first == id) {
                        hs.erase(it);
                        break;
                    }
                }
            }
        });
    }

    template<class... CallArgs>
    void invoke(CallArgs&&... args) const {
        std::vector<std::shared_ptr<Handler>> snapshot;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            snapshot.reserve(state_->handlers.size());
            for (const auto& [id, h] : state_->handlers) {
                snapshot.push_back(h);
            }
        }
        for (const auto& h : snapshot) {
            (*h)(args...);
        }
    }

    [[nodiscard]]
    std::size_t size() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->handlers.size();
    }

private:
    struct State {
        std::mutex mutex;
        std::uint64_t next_id{1};
        std::vector<std::pair<std::uint64_t, std::shared_ptr<Handler>>> handlers;
    };

    std::shared_ptr<State> state_ = std::make_shared<State>();
};

} // namespace agentlink::core::transport::connection
