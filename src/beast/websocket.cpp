#include "agentlink/core/transport/beast/websocket.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <exception>
#include <mutex>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "agentlink/core/telemetry.hpp"
#include "lcr/log/logger.hpp"


namespace agentlink::core::transport::beast {

namespace net  = boost::asio;
namespace ssl  = boost::asio::ssl;
namespace bb   = boost::beast;
namespace http = boost::beast::http;
namespace bws  = boost::beast::websocket;
using tcp      = boost::asio::ip::tcp;

namespace {

constexpr auto CONNECT_TIMEOUT = std::chrono::seconds(30);
constexpr auto CLOSE_TIMEOUT   = std::chrono::seconds(2);
constexpr std::string_view USER_AGENT = "agentlink-gateway/1.0";

using PlainStream = bws::stream<bb::tcp_stream>;
using TlsStream   = bws::stream<bb::ssl_stream<bb::tcp_stream>>;

// Maps Boost / OpenSSL error codes onto transport::Error
[[nodiscard]]
Error map_error(const bb::error_code& ec) noexcept {
    if (ec == bws::error::closed || ec == net::error::eof || ec == net::error::connection_reset) {
        return Error::RemoteClosed;
    }
    if (ec == net::error::operation_aborted) {
        return Error::LocalShutdown;
    }
    if (ec == bb::error::timeout || ec == net::error::timed_out) {
        return Error::Timeout;
    }
    if (ec == net::error::connection_refused ||
        ec == net::error::host_unreachable ||
        ec == net::error::network_unreachable ||
        ec == net::error::host_not_found ||
        ec == net::error::host_not_found_try_again) {
        return Error::ConnectionFailed;
    }
    if (ec.category() == net::error::get_ssl_category() || ec == ssl::error::stream_truncated) {
        return Error::HandshakeFailed;
    }
    if (ec == bws::condition::handshake_failed) {
        return Error::HandshakeFailed;
    }
    if (ec == bws::condition::protocol_violation) {
        return Error::ProtocolError;
    }
    return Error::TransportFailure;
}

} // namespace


namespace detail {

// Events handed from the I/O thread to poll_event()
class EventQueue {
public:
    void push(websocket::Event ev) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!closed_) {
            events_.push_back(std::move(ev));
        }
    }

    // Queues Error (if any) then Close, exactly once
    void close(Error err) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        if (err != Error::None) {
            events_.push_back(websocket::Event::make_error(err));
        }
        events_.push_back(websocket::Event::make_close());
        closed_ = true;
    }

    [[nodiscard]]
    bool pop(websocket::Event& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (events_.empty()) {
            return false;
        }
        out = std::move(events_.front());
        events_.pop_front();
        return true;
    }

private:
    std::mutex mutex_;
    std::deque<websocket::Event> events_;
    bool closed_{false};
};


// One connection attempt. Every member except open_ is touched only on the
// I/O thread.
class Session {
public:
    virtual ~Session() = default;

    virtual void start(ParsedUrl url) = 0;
    virtual void send(std::string msg) = 0;
    virtual void close() = 0;

    [[nodiscard]]
    bool is_open() const noexcept {
        return open_.load(std::memory_order_acquire);
    }

protected:
    std::atomic<bool> open_{false};
};


template<class Stream>
class StreamSession final
    : public Session
    , public std::enable_shared_from_this<StreamSession<Stream>> {

    static constexpr bool secure = std::is_same_v<Stream, TlsStream>;

public:
    template<class... StreamArgs>
    StreamSession(net::io_context& ioc,
                  std::shared_ptr<EventQueue> queue,
                  telemetry::WebSocket& telemetry,
                  StreamArgs&&... args)
        : resolver_(net::make_strand(ioc))
        , ws_(net::make_strand(ioc), std::forward<StreamArgs>(args)...)
        , queue_(std::move(queue))
        , telemetry_(telemetry)
    {}

    void start(ParsedUrl url) override {
        url_ = std::move(url);
        AL_DEBUG("[WS] Resolving " << url_.host << ":" << url_.port << " ...");
        resolver_.async_resolve(url_.host, url_.port,
            bb::bind_front_handler(&StreamSession::on_resolve_, this->shared_from_this()));
    }

    void send(std::string msg) override {
        net::post(ws_.get_executor(),
            bb::bind_front_handler(&StreamSession::on_send_, this->shared_from_this(), std::move(msg)));
    }

    void close() override {
        net::post(ws_.get_executor(),
            bb::bind_front_handler(&StreamSession::on_close_request_, this->shared_from_this()));
    }

private:
    tcp::resolver resolver_;
    Stream ws_;
    bb::flat_buffer buffer_;
    std::deque<std::string> outbox_;

    ParsedUrl url_;
    std::string host_header_;
    bool closing_{false};
    bool finished_{false};

    std::shared_ptr<EventQueue> queue_;
    telemetry::WebSocket& telemetry_;

private:
    void on_resolve_(bb::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            return fail_(ec, "resolve");
        }
        bb::get_lowest_layer(ws_).expires_after(CONNECT_TIMEOUT);
        bb::get_lowest_layer(ws_).async_connect(results,
            bb::bind_front_handler(&StreamSession::on_connect_, this->shared_from_this()));
    }

    void on_connect_(bb::error_code ec, tcp::resolver::results_type::endpoint_type endpoint) {
        if (ec) {
            return fail_(ec, "connect");
        }
        host_header_ = url_.host + ':' + std::to_string(endpoint.port());
        if constexpr (secure) {
            if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), url_.host.c_str())) {
                bb::error_code sni{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
                return fail_(sni, "sni");
            }
            ws_.next_layer().set_verify_callback(ssl::host_name_verification(url_.host));
            bb::get_lowest_layer(ws_).expires_after(CONNECT_TIMEOUT);
            ws_.next_layer().async_handshake(ssl::stream_base::client,
                bb::bind_front_handler(&StreamSession::on_tls_handshake_, this->shared_from_this()));
        } else {
            start_ws_handshake_();
        }
    }

    void on_tls_handshake_(bb::error_code ec) {
        if (ec) {
            return fail_(ec, "tls handshake");
        }
        start_ws_handshake_();
    }

    void start_ws_handshake_() {
        // The websocket stream manages its own timeouts from here on
        bb::get_lowest_layer(ws_).expires_never();
        ws_.set_option(bws::stream_base::timeout::suggested(bb::role_type::client));
        ws_.set_option(bws::stream_base::decorator([](bws::request_type& req) {
            req.set(http::field::user_agent, bb::string_view{USER_AGENT.data(), USER_AGENT.size()});
        }));
        ws_.text(true);
        ws_.async_handshake(host_header_, url_.path,
            bb::bind_front_handler(&StreamSession::on_ws_handshake_, this->shared_from_this()));
    }

    void on_ws_handshake_(bb::error_code ec) {
        if (ec) {
            return fail_(ec, "websocket handshake");
        }
        if (closing_) {
            return do_close_();
        }
        AL_INFO("[WS] Connected to " << (secure ? "wss://" : "ws://") << host_header_ << url_.path);
        AL_TL1( telemetry_.open_total.inc() );
        open_.store(true, std::memory_order_release);
        queue_->push(websocket::Event::make_open());
        do_read_();
    }

    void do_read_() {
        ws_.async_read(buffer_,
            bb::bind_front_handler(&StreamSession::on_read_, this->shared_from_this()));
    }

    void on_read_(bb::error_code ec, std::size_t bytes) {
        if (ec) {
            return fail_(ec, "read");
        }
        AL_TL1( telemetry_.messages_rx_total.inc() );
        AL_TL1( telemetry_.bytes_rx_total.inc(bytes) );
        queue_->push(websocket::Event::make_message(bb::buffers_to_string(buffer_.data())));
        buffer_.consume(buffer_.size());
        do_read_();
    }

    void on_send_(std::string msg) {
        if (!open_.load(std::memory_order_acquire) || closing_) {
            AL_TL1( telemetry_.send_failures_total.inc() );
            return;
        }
        outbox_.push_back(std::move(msg));
        if (outbox_.size() > 1) {
            return; // write in progress
        }
        do_write_();
    }

    void do_write_() {
        ws_.async_write(net::buffer(outbox_.front()),
            bb::bind_front_handler(&StreamSession::on_write_, this->shared_from_this()));
    }

    void on_write_(bb::error_code ec, std::size_t bytes) {
        if (ec) {
            AL_TL1( telemetry_.send_failures_total.inc() );
            return fail_(ec, "write");
        }
        AL_TL1( telemetry_.messages_tx_total.inc() );
        AL_TL1( telemetry_.bytes_tx_total.inc(bytes) );
        outbox_.pop_front();
        if (!outbox_.empty()) {
            do_write_();
        }
    }

    void on_close_request_() {
        if (closing_ || finished_) {
            return;
        }
        closing_ = true;
        if (open_.load(std::memory_order_acquire)) {
            do_close_();
            return;
        }
        // Still opening: abort whatever step is pending
        resolver_.cancel();
        bb::error_code ignored;
        bb::get_lowest_layer(ws_).socket().close(ignored);
        finish_(Error::None);
    }

    void do_close_() {
        AL_TRACE("[WS] Sending close frame ...");
        bws::stream_base::timeout opt{CLOSE_TIMEOUT, bws::stream_base::none(), false};
        ws_.set_option(opt);
        ws_.async_close(bws::close_code::normal,
            bb::bind_front_handler(&StreamSession::on_close_, this->shared_from_this()));
    }

    void on_close_(bb::error_code ec) {
        if (ec && ec != net::error::operation_aborted) {
            AL_DEBUG("[WS] Close handshake incomplete: " << ec.message());
        }
        bb::error_code ignored;
        bb::get_lowest_layer(ws_).socket().close(ignored);
        finish_(Error::None);
    }

    void fail_(bb::error_code ec, const char* what) {
        if (finished_) {
            return;
        }
        if (closing_ || ec == net::error::operation_aborted) {
            finish_(Error::None);
            return;
        }
        const Error err = map_error(ec);
        if (err == Error::RemoteClosed) {
            AL_INFO("[WS] Connection closed by peer (" << what << ": " << ec.message() << ")");
            finish_(Error::None);
        } else {
            AL_WARN("[WS] " << what << " failed: " << ec.message() << " (" << to_string(err) << ")");
            AL_TL1( telemetry_.receive_errors_total.inc() );
            finish_(err);
        }
        bb::error_code ignored;
        bb::get_lowest_layer(ws_).socket().close(ignored);
    }

    void finish_(Error err) {
        if (finished_) {
            return;
        }
        finished_ = true;
        open_.store(false, std::memory_order_release);
        AL_TL1( telemetry_.close_events_total.inc() );
        queue_->close(err);
    }
};

} // namespace detail


struct WebSocket::Runtime {
    net::io_context ioc{1};
    ssl::context tls{ssl::context::tls_client};
    std::shared_ptr<detail::EventQueue> queue = std::make_shared<detail::EventQueue>();
    std::shared_ptr<detail::Session> session;
    std::thread thread;
};


WebSocket::WebSocket(telemetry::WebSocket& telemetry) noexcept
    : telemetry_(telemetry)
{}

WebSocket::~WebSocket() {
    close();
}

Error WebSocket::connect(const ParsedUrl& url) noexcept {
    if (rt_) {
        AL_ERROR("[WS] connect() called twice on the same transport");
        return Error::InvalidState;
    }
    AL_TL1( telemetry_.connect_attempts_total.inc() );
    try {
        auto rt = std::make_unique<Runtime>();
        if (url.secure) {
            rt->tls.set_default_verify_paths();
            rt->tls.set_verify_mode(ssl::verify_peer);
            rt->session = std::make_shared<detail::StreamSession<TlsStream>>(rt->ioc, rt->queue, telemetry_, rt->tls);
        } else {
            rt->session = std::make_shared<detail::StreamSession<PlainStream>>(rt->ioc, rt->queue, telemetry_);
        }
        net::post(rt->ioc, [session = rt->session, url] { session->start(url); });

        Runtime* raw = rt.get();
        rt->thread = std::thread([raw] {
            try {
                raw->ioc.run();
            }
            catch (const std::exception& e) {
                AL_ERROR("[WS] I/O thread terminated: " << e.what());
                raw->queue->close(Error::TransportFailure);
            }
        });
        rt_ = std::move(rt);
    }
    catch (const std::exception& e) {
        AL_ERROR("[WS] Failed to start transport: " << e.what());
        return Error::TransportFailure;
    }
    return Error::None;
}

bool WebSocket::send(const std::string& msg) noexcept {
    if (!rt_ || !rt_->session->is_open()) {
        AL_WARN("[WS] send() called on a transport that is not open");
        AL_TL1( telemetry_.send_failures_total.inc() );
        return false;
    }
    try {
        rt_->session->send(msg);
    }
    catch (const std::exception& e) {
        AL_ERROR("[WS] send() failed: " << e.what());
        AL_TL1( telemetry_.send_failures_total.inc() );
        return false;
    }
    return true;
}

void WebSocket::close() noexcept {
    if (!rt_ || !rt_->thread.joinable()) {
        return;
    }
    AL_TRACE("[WS] Closing transport ...");
    try {
        rt_->session->close();
    }
    catch (const std::exception& e) {
        AL_ERROR("[WS] close() failed: " << e.what() << ", stopping I/O");
        rt_->ioc.stop();
    }
    rt_->thread.join();
    rt_->queue->close(Error::None);
}

bool WebSocket::poll_event(websocket::Event& out) noexcept {
    return rt_ && rt_->queue->pop(out);
}

} // namespace agentlink::core::transport::beast
