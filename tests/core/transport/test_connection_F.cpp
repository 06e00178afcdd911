/*
===============================================================================
 core::Connection: Group F Unit Tests
===============================================================================

Scope:
------
Host network signals and token refresh of agentlink::core::Connection.

Covered Requirements:
---------------------
F1. Network offline / online
    - Offline closes the channel and enters reconnecting
    - Online resets the attempt counter and reconnects immediately

F2. Network signals are ignored when not listening
    - Before connect() and after disconnect()

F3. Refresher returns a new token
    - The next attempt presents it

F4. Refresher returns no token
    - The session is over: disconnected, token cleared, no more attempts

F5. Refresher fails
    - The previous token is reused

F6. connect() while a refresh is pending
    - No parallel attempt is started

F7. Early retries refresh the token too
    - Network online and reconnect() while reconnecting run the refresher
      before the attempt
    - connect(token) uses the caller's token without refreshing

===============================================================================
*/

#include <future>
#include <iostream>
#include <stdexcept>
#include <string>

#include "common/harness/connection.hpp"


namespace {

using TokenPromise = std::promise<lcr::optional<std::string>>;

bool last_auth_carries(const std::string& token) {
    const auto auths = WebSocketUnderTest::sent_of("client:auth");
    return !auths.empty() && auths.back().find("\"token\":\"" + token + "\"") != std::string::npos;
}

// Drops the channel of an authenticated connection and runs the first backoff
void lose_and_wait_first_retry(test::harness::Connection& h) {
    h.drop_transport();
    TEST_CHECK(h.connection->status() == ConnectionStatus::Reconnecting);
    h.advance(RECONNECT_BASE_DELAY);
}

} // namespace

// -----------------------------------------------------------------------------
// Group F1: Network offline / online
// -----------------------------------------------------------------------------
void test_network_offline_online() {
    std::cout << "[TEST] Group F1: offline drops the channel, online reconnects now\n";
    test::harness::Connection h;
    h.open_and_authenticate();
    h.reset_counters();

    h.connection->notify_network_offline();
    h.poll();
    TEST_CHECK(WebSocketUnderTest::close_count() == 1);
    TEST_CHECK(!h.connection->connected());
    TEST_CHECK(h.connection->status() == ConnectionStatus::Reconnecting);
    TEST_CHECK(h.connection->attempts() == 1);
    TEST_CHECK(h.disconnect_signals == 1);

    h.connection->notify_network_online();
    h.poll();
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 2);
    TEST_CHECK(h.connection->attempts() == 0);
    TEST_CHECK(h.connection->status() == ConnectionStatus::Connecting);
    TEST_CHECK(!h.connection->reconnect_scheduled());

    h.connection->ws().emit_open();
    h.poll();
    h.deliver(agentlink::test::wire::auth_ok());
    TEST_CHECK(h.connection->connected());
    TEST_CHECK(h.reconnect_events == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group F2: Network signals when not listening
// -----------------------------------------------------------------------------
void test_network_signals_ignored_when_not_listening() {
    std::cout << "[TEST] Group F2: network signals need a listening connection\n";
    test::harness::Connection h;

    h.connection->notify_network_online();
    h.connection->notify_network_offline();
    h.poll();
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 0);
    TEST_CHECK(h.statuses.empty());

    h.open_and_authenticate();
    h.connection->disconnect();
    TEST_CHECK(!h.connection->listening_network());

    h.connection->notify_network_online();
    h.poll();
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);
    TEST_CHECK(h.connection->status() == ConnectionStatus::Disconnected);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group F3: Refresher returns a new token
// -----------------------------------------------------------------------------
void test_refresher_new_token() {
    std::cout << "[TEST] Group F3: refreshed token is used by the next attempt\n";
    test::harness::Connection h;

    int calls = 0;
    h.connection->set_token_refresher([&calls] {
        ++calls;
        TokenPromise p;
        p.set_value(lcr::optional<std::string>(std::string("token-2")));
        return p.get_future();
    });

    h.open_and_authenticate();
    TEST_CHECK(calls == 0);

    lose_and_wait_first_retry(h);
    TEST_CHECK(calls == 1);
    h.poll();
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 2);

    h.connection->ws().emit_open();
    h.poll();
    TEST_CHECK(last_auth_carries("token-2"));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group F4: Refresher returns no token
// -----------------------------------------------------------------------------
void test_refresher_session_expired() {
    std::cout << "[TEST] Group F4: empty refresh ends the session\n";
    test::harness::Connection h;

    h.connection->set_token_refresher([] {
        TokenPromise p;
        p.set_value(lcr::optional<std::string>{});
        return p.get_future();
    });

    h.open_and_authenticate();
    h.reset_counters();

    lose_and_wait_first_retry(h);
    h.poll();

    TEST_CHECK(h.connection->status() == ConnectionStatus::Disconnected);
    TEST_CHECK(!h.connection->has_token());
    TEST_CHECK(!h.connection->reconnect_scheduled());
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);
    TEST_CHECK(h.disconnect_signals == 2);

    h.advance(std::chrono::minutes(5));
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);

    // Without a token a manual reconnect has nothing to present
    h.connection->reconnect();
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group F5: Refresher fails
// -----------------------------------------------------------------------------
void test_refresher_failure_reuses_token() {
    std::cout << "[TEST] Group F5: failed refresh reuses the previous token\n";
    test::harness::Connection h;

    h.connection->set_token_refresher([] {
        TokenPromise p;
        p.set_exception(std::make_exception_ptr(std::runtime_error("refresh endpoint unreachable")));
        return p.get_future();
    });

    h.open_and_authenticate("token-1");
    lose_and_wait_first_retry(h);
    h.poll();

    TEST_CHECK(WebSocketUnderTest::connect_calls() == 2);
    TEST_CHECK(h.connection->has_token());
    h.connection->ws().emit_open();
    h.poll();
    TEST_CHECK(WebSocketUnderTest::sent_count("client:auth") == 2);
    TEST_CHECK(last_auth_carries("token-1"));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group F6: connect() while a refresh is pending
// -----------------------------------------------------------------------------
void test_connect_during_pending_refresh() {
    std::cout << "[TEST] Group F6: no parallel attempt while refreshing\n";
    test::harness::Connection h;

    TokenPromise promise;
    h.connection->set_token_refresher([&promise] {
        return promise.get_future();
    });

    h.open_and_authenticate();
    lose_and_wait_first_retry(h);
    TEST_CHECK(h.connection->reconnect_scheduled());

    TEST_CHECK(h.connection->connect("other") == Error::None);
    h.poll();
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);

    promise.set_value(lcr::optional<std::string>(std::string("token-3")));
    h.poll();
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 2);

    h.connection->ws().emit_open();
    h.poll();
    TEST_CHECK(last_auth_carries("token-3"));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group F7: Early retries refresh the token too
// -----------------------------------------------------------------------------
void test_early_retry_refreshes_token() {
    std::cout << "[TEST] Group F7: skipping the backoff still refreshes the token\n";
    test::harness::Connection h;

    int calls = 0;
    h.connection->set_token_refresher([&calls] {
        ++calls;
        TokenPromise p;
        p.set_value(lcr::optional<std::string>("token-r" + std::to_string(calls)));
        return p.get_future();
    });

    // Network back before the backoff elapsed
    h.open_and_authenticate();
    h.drop_transport();
    h.connection->notify_network_online();
    TEST_CHECK(calls == 1);
    h.poll();
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 2);
    h.connection->ws().emit_open();
    h.poll();
    TEST_CHECK(last_auth_carries("token-r1"));
    h.deliver(agentlink::test::wire::auth_ok());

    // Manual reconnect while reconnecting
    h.drop_transport();
    TEST_CHECK(h.connection->status() == ConnectionStatus::Reconnecting);
    h.connection->reconnect();
    TEST_CHECK(calls == 2);
    h.poll();
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 3);
    h.connection->ws().emit_open();
    h.poll();
    TEST_CHECK(last_auth_carries("token-r2"));
    h.deliver(agentlink::test::wire::auth_ok());

    // An explicit token is presented as given
    h.drop_transport();
    TEST_CHECK(h.connection->connect("token-explicit") == Error::None);
    TEST_CHECK(calls == 2);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 4);
    h.connection->ws().emit_open();
    h.poll();
    TEST_CHECK(last_auth_carries("token-explicit"));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_network_offline_online();
    test_network_signals_ignored_when_not_listening();
    test_refresher_new_token();
    test_refresher_session_expired();
    test_refresher_failure_reuses_token();
    test_connect_during_pending_refresh();
    test_early_retry_refreshes_token();

    std::cout << "\n[GROUP F — NETWORK & TOKEN REFRESH TESTS PASSED]\n";
    return 0;
}
