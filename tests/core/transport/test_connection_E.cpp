/*
===============================================================================
 core::Connection: Group E Unit Tests
===============================================================================

Scope:
------
Heartbeat and dead-peer detection of agentlink::core::Connection.

Covered Requirements:
---------------------
E1. Ping cadence
    - client:ping every 30s while connected (open and authenticated)
    - server:pong cancels the pong deadline

E2. Pong timeout
    - No pong within 10s closes the transport
    - PongTimeout signal, status reconnecting

E3. Heartbeat stops with the channel
    - No ping after disconnect()

E4. Heartbeat starts with authentication
    - An open but unauthenticated channel is not pinged
    - The first ping follows 30s after the auth result

===============================================================================
*/

#include <iostream>
#include <string>

#include "common/harness/connection.hpp"


// -----------------------------------------------------------------------------
// Group E1: Ping cadence
// -----------------------------------------------------------------------------
void test_ping_cadence() {
    std::cout << "[TEST] Group E1: ping every 30s, pong cancels the deadline\n";
    test::harness::Connection h;
    h.open_and_authenticate();

    h.advance(std::chrono::milliseconds(29999));
    TEST_CHECK(WebSocketUnderTest::sent_count("client:ping") == 0);

    h.advance(std::chrono::milliseconds(1));
    TEST_CHECK(WebSocketUnderTest::sent_count("client:ping") == 1);
    TEST_CHECK(h.connection->pong_pending());

    h.deliver(agentlink::test::wire::pong(1));
    TEST_CHECK(!h.connection->pong_pending());
    TEST_CHECK(h.messages.empty());

    // Deadline cancelled: the channel survives past it
    h.advance(std::chrono::seconds(15));
    TEST_CHECK(h.connection->connected());
    TEST_CHECK(h.pong_timeout_signals == 0);

    h.advance(std::chrono::seconds(15));
    TEST_CHECK(WebSocketUnderTest::sent_count("client:ping") == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group E2: Pong timeout
// -----------------------------------------------------------------------------
void test_pong_timeout() {
    std::cout << "[TEST] Group E2: missing pong drops the channel\n";
    test::harness::Connection h;
    h.open_and_authenticate();

    h.advance(HEARTBEAT_INTERVAL);
    TEST_CHECK(WebSocketUnderTest::sent_count("client:ping") == 1);

    h.advance(std::chrono::milliseconds(9999));
    TEST_CHECK(h.connection->connected());
    TEST_CHECK(WebSocketUnderTest::close_count() == 0);

    h.advance(std::chrono::milliseconds(1));
    TEST_CHECK(h.pong_timeout_signals == 1);
    TEST_CHECK(WebSocketUnderTest::close_count() == 1);
    TEST_CHECK(!h.connection->connected());
    TEST_CHECK(h.connection->status() == ConnectionStatus::Reconnecting);
    TEST_CHECK(h.connection->reconnect_scheduled());
    TEST_CHECK(h.disconnect_signals == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group E3: Heartbeat stops with the channel
// -----------------------------------------------------------------------------
void test_no_ping_after_disconnect() {
    std::cout << "[TEST] Group E3: heartbeat stops on disconnect\n";
    test::harness::Connection h;
    h.open_and_authenticate();

    h.connection->disconnect();
    h.advance(std::chrono::minutes(2));

    TEST_CHECK(WebSocketUnderTest::sent_count("client:ping") == 0);
    TEST_CHECK(h.pong_timeout_signals == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group E4: Heartbeat starts with authentication
// -----------------------------------------------------------------------------
void test_heartbeat_armed_on_auth() {
    std::cout << "[TEST] Group E4: no ping before the auth result\n";
    test::harness::Connection h;
    h.connect_and_open();
    TEST_CHECK(h.connection->status() == ConnectionStatus::Connecting);

    h.advance(std::chrono::seconds(45));
    TEST_CHECK(WebSocketUnderTest::sent_count("client:ping") == 0);
    TEST_CHECK(!h.connection->pong_pending());

    h.deliver(agentlink::test::wire::auth_ok());
    TEST_CHECK(h.connection->connected());

    h.advance(HEARTBEAT_INTERVAL - std::chrono::milliseconds(1));
    TEST_CHECK(WebSocketUnderTest::sent_count("client:ping") == 0);
    h.advance(std::chrono::milliseconds(1));
    TEST_CHECK(WebSocketUnderTest::sent_count("client:ping") == 1);
    TEST_CHECK(h.connection->pong_pending());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_ping_cadence();
    test_pong_timeout();
    test_no_ping_after_disconnect();
    test_heartbeat_armed_on_auth();

    std::cout << "\n[GROUP E — HEARTBEAT TESTS PASSED]\n";
    return 0;
}
