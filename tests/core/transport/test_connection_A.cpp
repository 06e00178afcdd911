/*
===============================================================================
 core::Connection: Group A Unit Tests
===============================================================================

Scope:
------
These tests validate *construction and lifecycle guarantees* of
agentlink::core::Connection<WS, Clock>.

It focuses exclusively on:

- Correct initial state
- Status publication on connect / authenticate / disconnect
- Endpoint validation
- RAII correctness and deterministic cleanup

Covered Requirements:
---------------------
A1. Default construction
    - Initial state is Disconnected
    - No handler is invoked
    - No transport instance is created implicitly

A2. Connect and authenticate
    - connect() reports connecting exactly once
    - The channel is connected only after the auth result
    - client:auth is the first frame on the channel

A3. Disconnect
    - Exactly one disconnected status, repeated calls are no-ops
    - The transport is closed exactly once

A4. Invalid endpoint
    - connect() returns InvalidUrl and creates no transport

A5. Destructor
    - Destruction closes the transport exactly once
    - No handler is invoked during destruction

A6. Synchronous open failure
    - Returned to the caller and fed into the retry policy

===============================================================================
*/

#include <iostream>
#include <string>

#include "common/harness/connection.hpp"


// -----------------------------------------------------------------------------
// Group A1: Default construction
// -----------------------------------------------------------------------------
void test_default_construction() {
    std::cout << "[TEST] Group A1: default construction\n";
    test::harness::Connection h;

    TEST_CHECK(h.connection->status() == ConnectionStatus::Disconnected);
    TEST_CHECK(!h.connection->connected());
    TEST_CHECK(!h.connection->has_transport());
    TEST_CHECK(!h.connection->has_token());
    TEST_CHECK(h.connection->pending_size() == 0);

    // disconnect() on a fresh connection must be safe and silent
    h.connection->disconnect();
    h.poll();

    TEST_CHECK(h.statuses.empty());
    TEST_CHECK(h.signals.empty());
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 0);
    TEST_CHECK(WebSocketUnderTest::close_count() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group A2: Connect and authenticate
// -----------------------------------------------------------------------------
void test_connect_and_authenticate() {
    std::cout << "[TEST] Group A2: connect and authenticate\n";
    test::harness::Connection h;

    TEST_CHECK(h.connection->connect(TEST_TOKEN) == Error::None);
    TEST_CHECK(h.connection->status() == ConnectionStatus::Connecting);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);
    TEST_CHECK(WebSocketUnderTest::last_url().secure);
    TEST_CHECK(WebSocketUnderTest::last_url().host == "gateway.test");
    TEST_CHECK(WebSocketUnderTest::last_url().path == "/ws/client");

    // Transport open: not yet connected
    h.connection->ws().emit_open();
    h.poll();
    TEST_CHECK(h.connection->status() == ConnectionStatus::Connecting);
    TEST_CHECK(!h.connection->connected());
    TEST_CHECK(WebSocketUnderTest::sent().size() == 1);
    TEST_CHECK(WebSocketUnderTest::sent_count("client:auth") == 1);

    // Auth accepted
    h.deliver(agentlink::test::wire::auth_ok());
    TEST_CHECK(h.connection->connected());
    TEST_CHECK(h.connection->status() == ConnectionStatus::Connected);

    TEST_CHECK(h.statuses.size() == 2);
    TEST_CHECK(h.statuses[0] == ConnectionStatus::Connecting);
    TEST_CHECK(h.statuses[1] == ConnectionStatus::Connected);
    TEST_CHECK(h.connect_signals == 1);
    TEST_CHECK(h.reconnect_signals == 0);
    TEST_CHECK(h.reconnect_events == 0);

    // A duplicate auth result changes nothing
    h.deliver(agentlink::test::wire::auth_ok());
    TEST_CHECK(h.statuses.size() == 2);
    TEST_CHECK(h.connect_signals == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group A3: Disconnect
// -----------------------------------------------------------------------------
void test_disconnect() {
    std::cout << "[TEST] Group A3: disconnect reports exactly once\n";
    test::harness::Connection h;
    h.open_and_authenticate();
    h.reset_counters();

    h.connection->disconnect();
    h.poll();

    TEST_CHECK(h.connection->status() == ConnectionStatus::Disconnected);
    TEST_CHECK(!h.connection->connected());
    TEST_CHECK(!h.connection->has_transport());
    TEST_CHECK(!h.connection->listening_network());
    TEST_CHECK(WebSocketUnderTest::close_count() == 1);
    TEST_CHECK(h.count_status(ConnectionStatus::Disconnected) == 1);
    TEST_CHECK(h.disconnect_signals == 1);

    // Idempotent
    h.connection->disconnect();
    h.poll();
    TEST_CHECK(h.count_status(ConnectionStatus::Disconnected) == 1);
    TEST_CHECK(h.disconnect_signals == 1);
    TEST_CHECK(WebSocketUnderTest::close_count() == 1);

    // No retry follows a user disconnect
    h.advance(std::chrono::minutes(5));
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);
    TEST_CHECK(h.retry_schedule_signals == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group A4: Invalid endpoint
// -----------------------------------------------------------------------------
void test_invalid_url() {
    std::cout << "[TEST] Group A4: invalid endpoint is rejected\n";
    test::harness::Connection h{"http://gateway.test/ws/client"};

    TEST_CHECK(h.connection->connect(TEST_TOKEN) == Error::InvalidUrl);
    h.poll();

    TEST_CHECK(h.connection->status() == ConnectionStatus::Disconnected);
    TEST_CHECK(!h.connection->has_transport());
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 0);
    TEST_CHECK(h.statuses.empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group A5: Destructor
// -----------------------------------------------------------------------------
void test_destructor_closes_transport() {
    std::cout << "[TEST] Group A5: destructor closes transport\n";
    test::harness::Connection h;
    h.open_and_authenticate();

    const auto statuses = h.statuses.size();
    const auto signals = h.signals.size();

    // Destroy without unsubscribing first
    h.connection.reset();

    TEST_CHECK(WebSocketUnderTest::close_count() == 1);
    TEST_CHECK(h.statuses.size() == statuses);
    TEST_CHECK(h.signals.size() == signals);

    // A fresh instance is independent from the destroyed one
    h.subscriptions.clear();
    h.make_connection();
    TEST_CHECK(h.connection->status() == ConnectionStatus::Disconnected);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group A6: Synchronous open failure
// -----------------------------------------------------------------------------
void test_open_failure_enters_retry() {
    std::cout << "[TEST] Group A6: synchronous open failure schedules a retry\n";
    test::harness::Connection h;
    WebSocketUnderTest::set_next_connect_result(Error::ConnectionFailed);

    TEST_CHECK(h.connection->connect(TEST_TOKEN) == Error::ConnectionFailed);
    h.poll();

    TEST_CHECK(h.connection->status() == ConnectionStatus::Reconnecting);
    TEST_CHECK(h.connection->reconnect_scheduled());
    TEST_CHECK(h.connection->attempts() == 1);
    TEST_CHECK(h.retry_schedule_signals == 1);
    TEST_CHECK(h.statuses.size() == 2);
    TEST_CHECK(h.statuses[0] == ConnectionStatus::Connecting);
    TEST_CHECK(h.statuses[1] == ConnectionStatus::Reconnecting);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_default_construction();
    test_connect_and_authenticate();
    test_disconnect();
    test_invalid_url();
    test_destructor_closes_transport();
    test_open_failure_enters_retry();

    std::cout << "\n[GROUP A — CONSTRUCTION & LIFECYCLE TESTS PASSED]\n";
    return 0;
}
