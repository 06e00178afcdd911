#pragma once

#include <cstdint>
#include <string>
#include <string_view>


namespace agentlink::core::scheduler {

// Unit of work addressed to one agent. Immutable once enqueued.
struct WorkItem {
    std::string correlation_id;   // message id of the originating request
    std::string content;
    std::string room_id;
    std::string sender_name;
};

enum class Outcome : std::uint8_t {
    Completed,
    Failed
};

[[nodiscard]]
inline constexpr std::string_view to_string(Outcome o) noexcept {
    switch (o) {
        case Outcome::Completed: return "completed";
        case Outcome::Failed:    return "failed";
        default:                 return "unknown";
    }
}

// Terminal outcome of one dispatched WorkItem
struct WorkResult {
    std::string agent_id;
    std::string correlation_id;
    std::string room_id;
    Outcome outcome{Outcome::Completed};
    std::string payload;          // full content on success, reason on failure

    [[nodiscard]]
    inline bool ok() const noexcept {
        return outcome == Outcome::Completed;
    }
};

} // namespace agentlink::core::scheduler
