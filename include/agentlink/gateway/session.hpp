#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "agentlink/core/connection.hpp"
#include "agentlink/core/scheduler/scheduler.hpp"
#include "agentlink/core/scheduler/status_reporter.hpp"
#include "agentlink/core/protocol/message.hpp"
#include "agentlink/core/protocol/schema/gateway/auth.hpp"
#include "agentlink/core/protocol/schema/gateway/register_agent.hpp"
#include "agentlink/core/protocol/schema/gateway/message_complete.hpp"
#include "lcr/log/logger.hpp"


namespace agentlink::gateway {

/*
===============================================================================
 agentlink::gateway::Session
===============================================================================

Glue between one Connection and one Scheduler: the agent host side of the
coordinator protocol.

Inbound:
    server:send_to_agent  -> Scheduler::enqueue (queue full answered with a
                             terminal "Error: queue is full" completion)
    server:stop_agent     -> Scheduler::stop
    server:remove_agent   -> Scheduler::remove_agent
    server:error          -> logged
Unknown agent ids are logged and ignored.

Outbound:
    gateway:register_agent    on add_agent() and for every agent after a reconnect
    gateway:unregister_agent  on remove_agent()
    gateway:agent_status      every scheduler transition (StatusReporter)
    gateway:message_complete  every finished item ("Error: <reason>" on failure)

The Session must outlive neither its Connection nor its Scheduler.

The coordinator serves agent hosts on /ws/gateway and expects gateway:auth
there. Build the Connection for that channel with:

    Connection connection(endpoint_from_host(host, tls, GATEWAY_ENDPOINT_PATH),
                          telemetry, gateway::connection_config(identity));
===============================================================================
*/

// Connection settings that authenticate every opened channel with
// gateway:auth: identity with the current token filled in.
[[nodiscard]]
inline core::transport::connection::Config connection_config(core::protocol::schema::gateway::Auth identity,
                                                             core::transport::connection::Config base = {}) {
    base.auth_message = [identity = std::move(identity)](const std::string& token) {
        auto auth = identity;
        auth.token = token;
        return auth.to_json();
    };
    return base;
}

template <
    core::transport::WebSocketConcept WS,
    core::transport::ClockConcept Clock = std::chrono::steady_clock
>
class Session {
public:
    using Connection = core::Connection<WS, Clock>;
    using Scheduler  = core::scheduler::Scheduler<Clock>;
    using AgentInfo  = core::protocol::schema::gateway::AgentInfo;

public:
    Session(Connection& connection, Scheduler& scheduler)
        : connection_(connection)
        , scheduler_(scheduler)
        , reporter_(connection)
    {
        scheduler_.set_status_sink([this](const core::scheduler::StatusUpdate& update) {
            reporter_.report(update);
        });
        scheduler_.set_completion_observer([this](const core::scheduler::WorkResult& result) {
            on_work_finished_(result);
        });

        subscriptions_.push_back(connection_.on_message([this](const core::protocol::InboundMessage& msg) {
            on_message_(msg);
        }));
        subscriptions_.push_back(connection_.on_reconnect([this] {
            register_all_();
        }));
        subscriptions_.push_back(connection_.on_status_change([](core::transport::ConnectionStatus status) {
            AL_INFO("[GATEWAY] Connection " << to_string(status));
        }));
        subscriptions_.push_back(connection_.on_queue_overflow([](std::string_view type) {
            AL_WARN("[GATEWAY] Too many pending messages, dropped '" << type << "'");
        }));
        subscriptions_.push_back(connection_.on_validation_error([](std::string_view raw) {
            AL_WARN("[GATEWAY] Invalid server message ignored: " << raw);
        }));
    }

    ~Session() {
        for (auto& sub : subscriptions_) {
            sub.unsubscribe();
        }
        scheduler_.set_status_sink(nullptr);
        scheduler_.set_completion_observer(nullptr);
    }

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Registers the agent locally and announces it to the coordinator
    [[nodiscard]]
    core::scheduler::Error add_agent(AgentInfo info, std::unique_ptr<core::scheduler::Adapter> adapter) {
        const auto err = scheduler_.register_agent(info.id, std::move(adapter));
        if (err != core::scheduler::Error::None) {
            AL_WARN("[GATEWAY] Cannot add agent '" << info.id << "': " << to_string(err));
            return err;
        }
        const core::protocol::schema::gateway::RegisterAgent msg{info};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            agents_[info.id] = std::move(info);
        }
        if (!connection_.send(msg)) {
            AL_WARN("[GATEWAY] Registration of agent '" << msg.agent.id << "' not delivered.");
        }
        AL_INFO("[GATEWAY] Agent added: " << msg.agent.id << " (" << msg.agent.name << ")");
        return core::scheduler::Error::None;
    }

    // Removes the agent locally and tells the coordinator. Idempotent.
    void remove_agent(const std::string& agent_id) {
        if (!forget_(agent_id)) {
            return;
        }
        const core::protocol::schema::gateway::UnregisterAgent msg{agent_id};
        if (!connection_.send(msg)) {
            AL_WARN("[GATEWAY] Unregistration of agent '" << agent_id << "' not delivered.");
        }
    }

    [[nodiscard]]
    std::vector<AgentInfo> agents() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<AgentInfo> out;
        out.reserve(agents_.size());
        for (const auto& [id, info] : agents_) {
            out.push_back(info);
        }
        return out;
    }

private:
    Connection& connection_;
    Scheduler& scheduler_;
    core::scheduler::StatusReporter<Connection> reporter_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, AgentInfo> agents_;

    std::vector<core::transport::connection::Subscription> subscriptions_;

private:
    void on_message_(const core::protocol::InboundMessage& msg) {
        using namespace core::protocol::schema::server;
        std::visit([this](const auto& m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, SendToAgent>) {
                on_send_to_agent_(m);
            }
            else if constexpr (std::is_same_v<T, StopAgent>) {
                if (scheduler_.stop(m.agent_id) == core::scheduler::Error::UnknownAgent) {
                    AL_WARN("[GATEWAY] stop_agent for unknown agent '" << m.agent_id << "' ignored.");
                }
            }
            else if constexpr (std::is_same_v<T, RemoveAgent>) {
                if (!forget_(m.agent_id)) {
                    AL_WARN("[GATEWAY] remove_agent for unknown agent '" << m.agent_id << "' ignored.");
                }
            }
            else if constexpr (std::is_same_v<T, ErrorNotice>) {
                AL_WARN("[GATEWAY] Server error " << m.code << ": " << m.message);
            }
            else if constexpr (std::is_same_v<T, AuthResult> || std::is_same_v<T, Pong>) {
                // Consumed by the Connection
            }
            else {
                static_assert(sizeof(T) == 0, "unhandled inbound message kind");
            }
        }, msg);
    }

    void on_send_to_agent_(const core::protocol::schema::server::SendToAgent& m) {
        core::scheduler::WorkItem item{m.message_id, m.content, m.room_id, m.sender_name};
        switch (scheduler_.enqueue(m.agent_id, std::move(item))) {
        case core::scheduler::Error::None:
            break;
        case core::scheduler::Error::QueueFull:
            complete_(m.room_id, m.agent_id, m.message_id, "Error: queue is full");
            break;
        case core::scheduler::Error::UnknownAgent:
            AL_WARN("[GATEWAY] Message '" << m.message_id << "' for unknown agent '" << m.agent_id << "' ignored.");
            break;
        default:
            break;
        }
    }

    void on_work_finished_(const core::scheduler::WorkResult& result) {
        if (result.ok()) {
            complete_(result.room_id, result.agent_id, result.correlation_id, result.payload);
        } else {
            complete_(result.room_id, result.agent_id, result.correlation_id, "Error: " + result.payload);
        }
    }

    void complete_(const std::string& room_id, const std::string& agent_id,
                   const std::string& message_id, std::string content) {
        const core::protocol::schema::gateway::MessageComplete msg{room_id, agent_id, message_id, std::move(content)};
        if (!connection_.send(msg)) {
            AL_WARN("[GATEWAY] Completion of '" << message_id << "' not delivered.");
        }
    }

    // Re-announces every agent: the coordinator forgets them with the session
    void register_all_() {
        const auto infos = agents();
        AL_INFO("[GATEWAY] Re-registering " << infos.size() << " agent(s) after reconnect.");
        for (const auto& info : infos) {
            const core::protocol::schema::gateway::RegisterAgent msg{info};
            if (!connection_.send(msg)) {
                AL_WARN("[GATEWAY] Registration of agent '" << info.id << "' not delivered.");
            }
        }
    }

    // Returns false if the agent was not known
    bool forget_(const std::string& agent_id) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (agents_.erase(agent_id) == 0) {
                return false;
            }
        }
        scheduler_.remove_agent(agent_id);
        return true;
    }
};

} // namespace agentlink::gateway
