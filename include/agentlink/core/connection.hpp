#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "agentlink/core/transport/websocket_concept.hpp"
#include "agentlink/core/transport/clock.hpp"
#include "agentlink/core/transport/timer.hpp"
#include "agentlink/core/transport/parse_url.hpp"
#include "agentlink/core/transport/state.hpp"
#include "agentlink/core/transport/connection/config.hpp"
#include "agentlink/core/transport/connection/signal.hpp"
#include "agentlink/core/transport/connection/subscription.hpp"
#include "agentlink/core/transport/telemetry/connection.hpp"
#include "agentlink/core/transport/websocket/events.hpp"
#include "agentlink/core/protocol/message.hpp"
#include "agentlink/core/protocol/parser/router.hpp"
#include "agentlink/core/protocol/schema/client/auth.hpp"
#include "agentlink/core/protocol/schema/client/ping.hpp"
#include "agentlink/core/telemetry.hpp"
#include "lcr/optional.hpp"
#include "lcr/format.hpp"
#include "lcr/log/logger.hpp"


namespace agentlink::core {

/*
===============================================================================
 agentlink::core::Connection
===============================================================================

Authenticated, self-healing client channel to the coordinator, parameterized
by a WebSocket transport conforming to transport::WebSocketConcept and by a
clock conforming to transport::ClockConcept.

A Connection represents a *logical* connection whose identity remains stable
across transport failures, dead peers, network outages and token refreshes.

-------------------------------------------------------------------------------
 Responsibilities
-------------------------------------------------------------------------------
- Own exactly one transport instance at a time (fresh instance per attempt)
- Authenticate every freshly opened channel with the latest known token
  (client:auth, or the frame built by Config::auth_message)
- Detect dead peers with ping/pong heartbeats
- Reconnect with capped exponential backoff, refreshing the token first
- Queue application traffic while the channel is down (bounded, FIFO)
- Validate inbound traffic against the known message registry

-------------------------------------------------------------------------------
 Status Model
-------------------------------------------------------------------------------
    Disconnected --connect()--> Connecting --auth ok--> Connected
    Connected --unexpected close / pong timeout / offline--> Reconnecting
    Reconnecting --retry timer (after token refresh)--> Connecting

- Connected is reported only after the peer accepted the credentials
- Reaching the attempt cap, an expired session (refresher returned no token)
  or a rejected token without a refresher ends in Disconnected
- Every status change is published exactly once; repeats are suppressed

-------------------------------------------------------------------------------
 Outbound Model
-------------------------------------------------------------------------------
- Connected: messages are transmitted immediately
- Otherwise: control messages (auth, client:ping) are discarded,
  everything else is queued up to the configured capacity; overflow drops
  the newest message and raises an overflow notification
- Every successful authentication flushes the queue oldest first before any
  further application traffic

-------------------------------------------------------------------------------
 Threading Model
-------------------------------------------------------------------------------
- All progress is driven by poll(); timers are deadlines checked there
- Public methods are safe to call from any thread (internal mutex)
- Handlers run on the calling thread after the internal lock is released,
  so they may call back into the Connection
- The transport I/O thread never touches Connection state; it only queues
  events drained by poll()

===============================================================================
*/

template <
    transport::WebSocketConcept WS,
    transport::ClockConcept Clock = std::chrono::steady_clock
>
class Connection {
public:
    using time_point     = typename Clock::time_point;
    using TokenFuture    = std::future<lcr::optional<std::string>>;
    using TokenRefresher = std::function<TokenFuture()>;
    using Subscription   = transport::connection::Subscription;
    using Status         = transport::ConnectionStatus;

    // Serialized message waiting for the channel
    struct PendingMessage {
        std::string type;
        std::string json;
    };

public:
    Connection(std::string url,
               transport::telemetry::Connection& telemetry,
               transport::connection::Config config = {})
        : url_(std::move(url))
        , telemetry_(telemetry)
        , config_(config)
    {
        transport::ParsedUrl tmp;
        url_error_ = transport::parse_url(url_, tmp);
        if (url_error_ == transport::Error::None) {
            parsed_url_ = std::move(tmp);
        } else {
            AL_ERROR("[CONN] Invalid endpoint URL: " << url_);
        }
    }

    // Transport is torn down on destruction. Handlers are not invoked:
    // their owners may already be gone.
    ~Connection() {
        std::lock_guard<std::mutex> lock(mutex_);
        should_reconnect_ = false;
        listening_ = false;
        cancel_timers_();
        teardown_transport_();
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    // Starts a fresh session with the given token. A no-op while an attempt is
    // already in flight. Transport open failures are returned and also fed
    // into the reconnect policy.
    [[nodiscard]]
    transport::Error connect(std::string token) {
        AL_TL1( telemetry_.connect_calls_total.inc() );
        Notifications out;
        transport::Error result = transport::Error::None;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!parsed_url_.has()) {
                AL_ERROR("[CONN] connect() rejected: invalid endpoint URL '" << url_ << "'");
                return url_error_;
            }
            if (attempt_in_flight_()) {
                AL_DEBUG("[CONN] connect() ignored: connection attempt already in flight.");
                return transport::Error::None;
            }
            token_ = std::move(token);
            should_reconnect_ = true;
            listening_ = true;
            was_connected_ = false;
            attempts_ = 0;
            result = transition_(transport::Event::ConnectRequested, out);
        }
        out.dispatch();
        return result;
    }

    // Freshest token wins: used by the next auth message, including one for a
    // channel that is already opening.
    void update_token(std::string token) {
        std::lock_guard<std::mutex> lock(mutex_);
        token_ = std::move(token);
        AL_DEBUG("[CONN] Token updated.");
    }

    // Unconditional shutdown: closes the transport, clears the pending queue,
    // cancels every timer and stops listening for network signals. Idempotent.
    void disconnect() {
        AL_TL1( telemetry_.disconnect_calls_total.inc() );
        Notifications out;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            (void)transition_(transport::Event::DisconnectRequested, out);
        }
        out.dispatch();
    }

    // Manual reconnect with the stored token. Resets the attempt counter.
    // While reconnecting, the token refresher (if any) runs first.
    // No-op if no token was ever set.
    void reconnect() {
        Notifications out;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!token_.has()) {
                AL_DEBUG("[CONN] reconnect() ignored: no token.");
                return;
            }
            attempts_ = 0;
            should_reconnect_ = true;
            listening_ = true;
            if (attempt_in_flight_()) {
                AL_DEBUG("[CONN] reconnect() ignored: connection attempt already in flight.");
                return;
            }
            AL_TL1( telemetry_.connect_calls_total.inc() );
            (void)transition_(transport::Event::ReconnectRequested, out);
        }
        out.dispatch();
    }

    // Host reports the network as reachable again
    void notify_network_online() {
        Notifications out;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!listening_) {
                return;
            }
            AL_INFO("[CONN] Network online.");
            attempts_ = 0;
            (void)transition_(transport::Event::NetworkOnline, out);
        }
        out.dispatch();
    }

    // Host reports the network as unreachable
    void notify_network_offline() {
        Notifications out;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!listening_) {
                return;
            }
            AL_INFO("[CONN] Network offline.");
            (void)transition_(transport::Event::NetworkOffline, out);
        }
        out.dispatch();
    }

    // The refresher is invoked (under the internal lock) before every retry.
    // Its future resolves to a new token, to an empty optional when the
    // session is gone, or to an exception on transient failure. It must not
    // call back into the Connection synchronously.
    void set_token_refresher(TokenRefresher refresher) {
        std::lock_guard<std::mutex> lock(mutex_);
        refresher_ = std::move(refresher);
    }

    // -------------------------------------------------------------------------
    // Sending
    // -------------------------------------------------------------------------

    // Returns true if the message was transmitted or queued.
    template<class Message>
    [[nodiscard]]
    bool send(const Message& msg) {
        constexpr bool control = requires { typename Message::control_tag; };
        return send_(Message::TYPE, msg.to_json(), control);
    }

    // Untyped variant for pre-serialized application messages
    [[nodiscard]]
    bool send_text(std::string_view type, std::string json) {
        return send_(type, std::move(json), false);
    }

    // -------------------------------------------------------------------------
    // Event loop
    // -------------------------------------------------------------------------

    void poll() {
        Notifications out;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            // === Drain transport events ===
            transport::websocket::Event ev;
            while (ws_ && ws_->poll_event(ev)) {
                switch (ev.type) {
                    case transport::websocket::EventType::Open:
                        (void)transition_(transport::Event::TransportOpened, out);
                        break;
                    case transport::websocket::EventType::Message:
                        on_transport_message_(std::move(ev.data), out);
                        break;
                    case transport::websocket::EventType::Error:
                        on_transport_error_(ev.error);
                        break;
                    case transport::websocket::EventType::Close:
                        (void)transition_(transport::Event::TransportClosed, out);
                        break;
                }
            }
            const auto now = Clock::now();
            // === Liveness ===
            if (pong_timer_.fire_if_due(now)) {
                (void)transition_(transport::Event::PongTimeout, out);
            }
            if (heartbeat_timer_.fire_if_due(now)) {
                send_ping_(now);
            }
            // === Token refresh ===
            if (pending_refresh_.valid() &&
                pending_refresh_.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                resolve_token_refresh_(out);
            }
            // === Reconnection ===
            if (reconnect_timer_.fire_if_due(now)) {
                (void)transition_(transport::Event::RetryTimerExpired, out);
            }
        }
        out.dispatch();
    }

    [[nodiscard]]
    bool poll_signal(transport::connection::Signal& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (signals_.empty()) {
            return false;
        }
        out = signals_.front();
        signals_.pop_front();
        return true;
    }

    // -------------------------------------------------------------------------
    // Observable events
    // -------------------------------------------------------------------------

    [[nodiscard]]
    Subscription on_status_change(std::function<void(Status)> handler) {
        return status_handlers_.add(std::move(handler));
    }

    // Fired once per authentication that recovers a previous session
    [[nodiscard]]
    Subscription on_reconnect(std::function<void()> handler) {
        return reconnect_handlers_.add(std::move(handler));
    }

    // Receives the type of the dropped message
    [[nodiscard]]
    Subscription on_queue_overflow(std::function<void(std::string_view)> handler) {
        return overflow_handlers_.add(std::move(handler));
    }

    // Receives the raw text of an unknown or malformed message
    [[nodiscard]]
    Subscription on_validation_error(std::function<void(std::string_view)> handler) {
        return validation_handlers_.add(std::move(handler));
    }

    // Application messages (auth results and pongs are consumed internally)
    [[nodiscard]]
    Subscription on_message(std::function<void(const protocol::InboundMessage&)> handler) {
        return message_handlers_.add(std::move(handler));
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    // True iff the transport is open AND authenticated
    [[nodiscard]]
    bool connected() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connected_();
    }

    [[nodiscard]]
    Status status() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_;
    }

    [[nodiscard]]
    std::uint32_t attempts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return attempts_;
    }

    [[nodiscard]]
    std::size_t pending_size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return outbound_.size();
    }

    // Snapshot of the pending queue, oldest first
    [[nodiscard]]
    std::vector<PendingMessage> pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<PendingMessage>(outbound_.begin(), outbound_.end());
    }

    [[nodiscard]]
    bool has_token() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return token_.has();
    }

    [[nodiscard]]
    bool reconnect_scheduled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return reconnect_timer_.armed() || pending_refresh_.valid();
    }

    [[nodiscard]]
    bool listening_network() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listening_;
    }

    [[nodiscard]]
    const std::string& url() const noexcept {
        return url_;
    }

#ifdef AL_UNIT_TEST
public:
    WS& ws() {
        return *ws_;
    }

    [[nodiscard]]
    bool has_transport() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<bool>(ws_);
    }

    [[nodiscard]]
    bool pong_pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pong_timer_.armed();
    }
#endif // AL_UNIT_TEST

private:
    // Handler invocations collected under the lock, run after it is released
    class Notifications {
    public:
        template<class F>
        void push(F&& f) {
            calls_.emplace_back(std::forward<F>(f));
        }

        void dispatch() {
            for (auto& call : calls_) {
                call();
            }
            calls_.clear();
        }

    private:
        std::vector<std::function<void()>> calls_;
    };

private:
    std::string url_;
    lcr::optional<transport::ParsedUrl> parsed_url_;   // Invariant: has() -> valid endpoint
    transport::Error url_error_{transport::Error::None};

    transport::telemetry::Connection& telemetry_;      // Telemetry reference (not owned)
    transport::connection::Config config_;

    mutable std::mutex mutex_;

    std::unique_ptr<WS> ws_;                           // Current transport (owned)
    bool transport_open_{false};
    bool authenticated_{false};

    Status status_{Status::Disconnected};
    transport::DisconnectReason disconnect_reason_{transport::DisconnectReason::None};
    transport::Error last_error_{transport::Error::None};

    // Session intent
    lcr::optional<std::string> token_;
    bool should_reconnect_{false};
    bool was_connected_{false};
    bool listening_{false};

    // Reconnect state
    std::uint32_t attempts_{0};
    TokenRefresher refresher_;
    TokenFuture pending_refresh_;

    // Owned timers
    transport::Timer<Clock> reconnect_timer_;
    transport::Timer<Clock> heartbeat_timer_;
    transport::Timer<Clock> pong_timer_;

    // Outbound queue (oldest first)
    std::deque<PendingMessage> outbound_;

    // Inbound validation
    protocol::parser::Router router_;

    // Edge-triggered signals (bounded, drop-oldest)
    std::deque<transport::connection::Signal> signals_;

    // Subscribers
    transport::connection::HandlerList<Status> status_handlers_;
    transport::connection::HandlerList<> reconnect_handlers_;
    transport::connection::HandlerList<std::string_view> overflow_handlers_;
    transport::connection::HandlerList<std::string_view> validation_handlers_;
    transport::connection::HandlerList<const protocol::InboundMessage&> message_handlers_;

private:
    [[nodiscard]]
    inline bool connected_() const noexcept {
        return ws_ && transport_open_ && authenticated_;
    }

    // An attempt is in flight from transport creation until the auth result,
    // and while a token refresh is pending.
    [[nodiscard]]
    inline bool attempt_in_flight_() const noexcept {
        return status_ == Status::Connecting || pending_refresh_.valid();
    }

    inline void emit_(transport::connection::Signal sig) {
        AL_TRACE("[CONN] Emitting signal: " << to_string(sig));
        if (signals_.size() >= transport::SIGNAL_RING_CAPACITY) {
            AL_WARN("[CONN] Signal buffer full, dropping oldest signal '" << to_string(signals_.front()) << "'");
            signals_.pop_front();
        }
        signals_.push_back(sig);
    }

    inline void set_status_(Status s, Notifications& out) {
        if (s == status_) {
            return;
        }
        AL_DEBUG("[CONN] Status: " << to_string(status_) << " -> " << to_string(s));
        status_ = s;
        out.push([this, s] { status_handlers_.invoke(s); });
    }

    // State machine transition function
    transport::Error transition_(transport::Event event, Notifications& out) {
        using transport::Event;
        AL_TRACE("[FSM] (" << to_string(status_) << ") --" << to_string(event) << "-->");

        // User intent is honored from every state
        if (event == Event::DisconnectRequested) {
            shutdown_(out);
            return transport::Error::None;
        }

        switch (status_) {

        // ================================================================
        case Status::Disconnected:
            switch (event) {
            case Event::ConnectRequested:
            case Event::ReconnectRequested:
                return begin_attempt_(out);

            case Event::NetworkOnline:
                if (should_reconnect_ && token_.has()) {
                    return begin_attempt_(out);
                }
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case Status::Connecting:
            switch (event) {
            case Event::TransportOpened:
                on_transport_opened_();
                break;

            case Event::TransportOpenFailed:
            case Event::TransportClosed:
                AL_TL1( telemetry_.disconnect_events_total.inc() );
                handle_unexpected_close_(out);
                break;

            case Event::AuthSucceeded:
                on_authenticated_(out);
                break;

            case Event::AuthRejected:
                on_auth_rejected_(out);
                break;

            case Event::PongTimeout:
            case Event::NetworkOffline:
                on_liveness_lost_(event, out);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case Status::Connected:
            switch (event) {
            case Event::ConnectRequested:
            case Event::ReconnectRequested:
                // Explicit request replaces the current channel
                return begin_attempt_(out);

            case Event::TransportClosed:
                AL_TL1( telemetry_.disconnect_events_total.inc() );
                handle_unexpected_close_(out);
                break;

            case Event::AuthRejected:
                on_auth_rejected_(out);
                break;

            case Event::PongTimeout:
            case Event::NetworkOffline:
                on_liveness_lost_(event, out);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case Status::Reconnecting:
            switch (event) {
            case Event::ConnectRequested:
                // Caller supplied the token: skip the remaining backoff
                reconnect_timer_.cancel();
                return begin_attempt_(out);

            case Event::ReconnectRequested:
            case Event::NetworkOnline:
                // Skip the remaining backoff, the stored token may be stale
                reconnect_timer_.cancel();
                return retry_now_(out);

            case Event::RetryTimerExpired:
                return retry_now_(out);

            case Event::TokenExpired:
                AL_WARN("[CONN] Session expired (token refresher returned no token). Giving up.");
                token_.reset();
                should_reconnect_ = false;
                disconnect_reason_ = transport::DisconnectReason::TokenExpired;
                emit_(transport::connection::Signal::Disconnected);
                set_status_(Status::Disconnected, out);
                break;

            default:
                break;
            }
            break;
        }
        return transport::Error::None;
    }

    // Creates a fresh transport and starts opening it
    transport::Error begin_attempt_(Notifications& out) {
        cancel_timers_();
        pending_refresh_ = TokenFuture{};
        teardown_transport_();
        disconnect_reason_ = transport::DisconnectReason::None;
        last_error_ = transport::Error::None;
        set_status_(Status::Connecting, out);

        AL_DEBUG("[CONN] Connecting to: " << url_ << " (attempt " << attempts_ << ")");
        ws_ = std::make_unique<WS>(telemetry_.websocket);
        const auto& u = parsed_url_.value();
        const transport::Error err = ws_->connect(u);
        if (err != transport::Error::None) {
            AL_ERROR("[CONN] Connection attempt failed (" << to_string(err) << ")");
            last_error_ = err;
            (void)transition_(transport::Event::TransportOpenFailed, out);
        }
        return err;
    }

    // Retries with a refreshed token when a refresher is configured
    transport::Error retry_now_(Notifications& out) {
        if (refresher_) {
            start_token_refresh_(out);
            return transport::Error::None;
        }
        AL_TL1( telemetry_.retry_attempts_total.inc() );
        return begin_attempt_(out);
    }

    inline void on_transport_opened_() {
        AL_INFO("[CONN] Transport open: " << url_ << " (authenticating)");
        transport_open_ = true;
        const std::string token = token_.value_or(std::string{});
        const std::string auth = config_.auth_message
            ? config_.auth_message(token)
            : protocol::schema::client::Auth{token}.to_json();
        if (!transmit_(auth)) {
            AL_WARN("[CONN] Failed to send the authentication message");
        }
    }

    inline void on_authenticated_(Notifications& out) {
        AL_TL1( telemetry_.auth_success_total.inc() );
        authenticated_ = true;
        attempts_ = 0;
        const bool recovered = was_connected_;
        was_connected_ = true;
        set_status_(Status::Connected, out);
        emit_(transport::connection::Signal::Connected);
        AL_INFO("[CONN] Connected to server: " << url_);
        heartbeat_timer_.arm(config_.heartbeat_interval);
        flush_pending_();
        if (recovered) {
            AL_INFO("[CONN] Session recovered after reconnect.");
            emit_(transport::connection::Signal::Reconnected);
            out.push([this] { reconnect_handlers_.invoke(); });
        }
    }

    inline void on_auth_rejected_(Notifications& out) {
        AL_TL1( telemetry_.auth_rejected_total.inc() );
        emit_(transport::connection::Signal::AuthRejected);
        disconnect_reason_ = transport::DisconnectReason::AuthRejected;
        last_error_ = transport::Error::AuthFailed;
        if (refresher_) {
            AL_WARN("[CONN] Authentication rejected. Retrying with a refreshed token.");
            handle_unexpected_close_(out);
            return;
        }
        AL_ERROR("[CONN] Authentication rejected and no token refresher configured. Giving up.");
        cancel_timers_();
        teardown_transport_();
        should_reconnect_ = false;
        emit_(transport::connection::Signal::Disconnected);
        set_status_(Status::Disconnected, out);
    }

    // Dead peer or network gone: the channel is dropped and recovered
    inline void on_liveness_lost_(transport::Event event, Notifications& out) {
        if (event == transport::Event::PongTimeout) {
            AL_WARN("[CONN] No pong within " << lcr::format_delay(config_.pong_timeout) << ", dropping channel.");
            AL_TL1( telemetry_.pong_timeouts_total.inc() );
            emit_(transport::connection::Signal::PongTimeout);
            disconnect_reason_ = transport::DisconnectReason::PongTimeout;
            last_error_ = transport::Error::Timeout;
        } else {
            disconnect_reason_ = transport::DisconnectReason::NetworkOffline;
        }
        handle_unexpected_close_(out);
    }

    // Transport lost for any reason other than disconnect()
    void handle_unexpected_close_(Notifications& out) {
        cancel_timers_();
        teardown_transport_();
        emit_(transport::connection::Signal::Disconnected);
        AL_INFO("[CONN] Connection lost: " << url_ << " (reason: " << to_string(disconnect_reason_)
                << ", error: " << to_string(last_error_) << ")");
        if (!should_reconnect_) {
            set_status_(Status::Disconnected, out);
            return;
        }
        schedule_next_retry_(out);
    }

    void schedule_next_retry_(Notifications& out) {
        if (attempts_ >= config_.max_reconnect_attempts) {
            AL_WARN("[CONN] Giving up after " << attempts_ << " reconnection attempts.");
            AL_TL1( telemetry_.retries_exhausted_total.inc() );
            disconnect_reason_ = transport::DisconnectReason::RetriesExhausted;
            reconnect_timer_.cancel();
            set_status_(Status::Disconnected, out);
            return;
        }
        const auto delay = backoff_(attempts_);
        ++attempts_;
        reconnect_timer_.arm(delay);
        AL_TL1( telemetry_.retry_scheduled_total.inc() );
        emit_(transport::connection::Signal::RetryScheduled);
        set_status_(Status::Reconnecting, out);
        AL_INFO("[CONN] Next reconnection attempt in " << lcr::format_delay(delay) << " (attempt " << attempts_ << ")");
    }

    [[nodiscard]]
    inline std::chrono::milliseconds backoff_(std::uint32_t attempt) const noexcept {
        // Clamp exponent to avoid overflow (base * 2^20 exceeds any sane cap)
        const std::uint32_t exp = std::min<std::uint32_t>(attempt, 20);
        const auto delay = config_.reconnect_base_delay * (std::int64_t{1} << exp);
        return std::min(delay, config_.reconnect_max_delay);
    }

    void start_token_refresh_(Notifications& out) {
        AL_DEBUG("[CONN] Refreshing token before reconnecting ...");
        AL_TL1( telemetry_.token_refresh_total.inc() );
        try {
            pending_refresh_ = refresher_();
        }
        catch (const std::exception& e) {
            AL_WARN("[CONN] Token refresher failed (" << e.what() << "), reusing previous token.");
            AL_TL1( telemetry_.token_refresh_failures_total.inc() );
            (void)begin_attempt_(out);
            return;
        }
        if (!pending_refresh_.valid()) {
            AL_WARN("[CONN] Token refresher returned no future, reusing previous token.");
            (void)begin_attempt_(out);
        }
    }

    void resolve_token_refresh_(Notifications& out) {
        lcr::optional<std::string> refreshed;
        try {
            refreshed = pending_refresh_.get();
        }
        catch (const std::exception& e) {
            // Transient failure (network, server): retry with the token we have
            pending_refresh_ = TokenFuture{};
            AL_WARN("[CONN] Token refresh failed (" << e.what() << "), reusing previous token.");
            AL_TL1( telemetry_.token_refresh_failures_total.inc() );
            AL_TL1( telemetry_.retry_attempts_total.inc() );
            (void)begin_attempt_(out);
            return;
        }
        pending_refresh_ = TokenFuture{};
        if (!refreshed.has()) {
            (void)transition_(transport::Event::TokenExpired, out);
            return;
        }
        AL_DEBUG("[CONN] Token refreshed.");
        token_ = refreshed.take();
        AL_TL1( telemetry_.retry_attempts_total.inc() );
        (void)begin_attempt_(out);
    }

    void shutdown_(Notifications& out) {
        if (ws_) {
            AL_DEBUG("[CONN] Disconnecting from: " << url_);
        }
        should_reconnect_ = false;
        listening_ = false;
        was_connected_ = false;
        attempts_ = 0;
        cancel_timers_();
        pending_refresh_ = TokenFuture{};
        outbound_.clear();
        AL_TL1( telemetry_.pending_messages.set(0) );
        teardown_transport_();
        if (status_ != Status::Disconnected) {
            disconnect_reason_ = transport::DisconnectReason::LocalClose;
            emit_(transport::connection::Signal::Disconnected);
            AL_INFO("[CONN] Disconnected from server: " << url_);
        }
        set_status_(Status::Disconnected, out);
    }

    inline void cancel_timers_() noexcept {
        reconnect_timer_.cancel();
        heartbeat_timer_.cancel();
        pong_timer_.cancel();
    }

    // Closes and destroys the current transport. Events still queued in it
    // are discarded with it.
    inline void teardown_transport_() {
        if (ws_) {
            ws_->close();
            ws_.reset();
        }
        transport_open_ = false;
        authenticated_ = false;
    }

    inline void on_transport_error_(transport::Error error) {
        AL_WARN("[CONN] Transport error: " << to_string(error));
        last_error_ = error;
        disconnect_reason_ = transport::DisconnectReason::TransportError;
    }

    void on_transport_message_(std::string&& raw, Notifications& out) {
        protocol::InboundMessage msg;
        const auto r = router_.parse(raw, msg);
        if (r == protocol::parser::Result::InvalidJson) {
            return; // not JSON at all: ignored
        }
        if (r != protocol::parser::Result::Parsed) {
            AL_WARN("[CONN] Dropping invalid inbound message (" << to_string(r) << ")");
            AL_TL1( telemetry_.validation_errors_total.inc() );
            out.push([this, raw = std::move(raw)] { validation_handlers_.invoke(std::string_view(raw)); });
            return;
        }
        if (const auto* auth = std::get_if<protocol::schema::server::AuthResult>(&msg)) {
            if (auth->ok) {
                if (!authenticated_) {
                    (void)transition_(transport::Event::AuthSucceeded, out);
                }
            } else {
                AL_WARN("[CONN] Server rejected credentials: " << auth->error.value_or("unspecified"));
                (void)transition_(transport::Event::AuthRejected, out);
            }
            return;
        }
        if (std::holds_alternative<protocol::schema::server::Pong>(msg)) {
            AL_TRACE("[CONN] Pong received.");
            AL_TL1( telemetry_.pongs_received_total.inc() );
            pong_timer_.cancel();
            return;
        }
        AL_TL1( telemetry_.messages_forwarded_total.inc() );
        out.push([this, m = std::move(msg)] { message_handlers_.invoke(m); });
    }

    void send_ping_(time_point now) {
        if (!connected_()) {
            return;
        }
        const protocol::schema::client::Ping ping{transport::epoch_ms<Clock>(now)};
        if (transmit_(ping.to_json())) {
            AL_TL1( telemetry_.pings_sent_total.inc() );
            pong_timer_.arm(config_.pong_timeout);
        }
        heartbeat_timer_.arm(config_.heartbeat_interval);
    }

    [[nodiscard]]
    bool send_(std::string_view type, std::string json, bool control) {
        AL_TL1( telemetry_.send_calls_total.inc() );
        Notifications out;
        bool accepted = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (control) {
                if (ws_ && transport_open_) {
                    accepted = transmit_(json);
                } else {
                    AL_DEBUG("[CONN] Dropping control message '" << type << "' (channel not open)");
                    AL_TL1( telemetry_.control_dropped_total.inc() );
                }
            }
            else if (connected_()) {
                accepted = transmit_(json);
            }
            else if (outbound_.size() >= config_.outbound_queue_capacity) {
                AL_WARN("[CONN] Outbound queue full (" << outbound_.size() << "), dropping '" << type << "'");
                AL_TL1( telemetry_.queue_overflow_total.inc() );
                emit_(transport::connection::Signal::QueueOverflow);
                out.push([this, t = std::string(type)] { overflow_handlers_.invoke(std::string_view(t)); });
            }
            else {
                AL_TRACE("[CONN] Queueing '" << type << "' (pending: " << outbound_.size() + 1 << ")");
                outbound_.push_back(PendingMessage{std::string(type), std::move(json)});
                AL_TL1( telemetry_.send_queued_total.inc() );
                AL_TL1( telemetry_.pending_messages.set(static_cast<std::uint32_t>(outbound_.size())) );
                accepted = true;
            }
        }
        out.dispatch();
        return accepted;
    }

    [[nodiscard]]
    inline bool transmit_(const std::string& json) {
        if (!ws_ || !transport_open_) {
            return false;
        }
        if (!ws_->send(json)) {
            AL_WARN("[CONN] Transport rejected outbound message.");
            return false;
        }
        return true;
    }

    void flush_pending_() {
        std::size_t flushed = 0;
        while (!outbound_.empty()) {
            if (!transmit_(outbound_.front().json)) {
                AL_WARN("[CONN] Flush interrupted, " << outbound_.size() << " message(s) kept pending.");
                break;
            }
            outbound_.pop_front();
            ++flushed;
        }
        if (flushed > 0) {
            AL_INFO("[CONN] Flushed " << flushed << " pending message(s).");
            AL_TL1( telemetry_.queue_flushed_total.inc(flushed) );
        }
        AL_TL1( telemetry_.pending_messages.set(static_cast<std::uint32_t>(outbound_.size())) );
    }
};

} // namespace agentlink::core
