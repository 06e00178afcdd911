/*
===============================================================================
 core::Connection: Group G Unit Tests
===============================================================================

Scope:
------
Inbound validation and delivery of agentlink::core::Connection.

Covered Requirements:
---------------------
G1. Known, valid messages reach the message handlers
G2. Unknown types raise a validation error with the raw text
G3. Known types with a broken shape raise a validation error
G4. Text that is not JSON is ignored silently
G5. Auth results and pongs are consumed internally
G6. Unsubscribed handlers are no longer invoked

===============================================================================
*/

#include <iostream>
#include <string>
#include <variant>

#include "common/harness/connection.hpp"


// -----------------------------------------------------------------------------
// Group G1: Valid messages are delivered
// -----------------------------------------------------------------------------
void test_valid_message_delivered() {
    std::cout << "[TEST] Group G1: valid messages reach handlers\n";
    test::harness::Connection h;
    h.open_and_authenticate();

    h.deliver(agentlink::test::wire::send_to_agent("agent-1", "m-1", "do it", "room-9", "bob"));
    h.deliver(agentlink::test::wire::stop_agent("agent-1"));
    h.deliver(agentlink::test::wire::error("RATE_LIMIT", "slow down"));

    TEST_CHECK(h.messages.size() == 3);
    TEST_CHECK(h.validation_errors.empty());

    const auto* msg = std::get_if<protocol::schema::server::SendToAgent>(&h.messages[0]);
    TEST_CHECK(msg != nullptr);
    TEST_CHECK(msg->agent_id == "agent-1");
    TEST_CHECK(msg->message_id == "m-1");
    TEST_CHECK(msg->content == "do it");
    TEST_CHECK(msg->room_id == "room-9");
    TEST_CHECK(msg->sender_name == "bob");

    TEST_CHECK(std::holds_alternative<protocol::schema::server::StopAgent>(h.messages[1]));
    const auto* err = std::get_if<protocol::schema::server::ErrorNotice>(&h.messages[2]);
    TEST_CHECK(err != nullptr);
    TEST_CHECK(err->code == "RATE_LIMIT");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group G2: Unknown types
// -----------------------------------------------------------------------------
void test_unknown_type_raises_validation_error() {
    std::cout << "[TEST] Group G2: unknown type raises a validation error\n";
    test::harness::Connection h;
    h.open_and_authenticate();

    const std::string raw = R"({"type":"server:something_new","x":1})";
    h.deliver(raw);

    TEST_CHECK(h.messages.empty());
    TEST_CHECK(h.validation_errors.size() == 1);
    TEST_CHECK(h.validation_errors[0] == raw);
    TEST_CHECK(h.connection->connected());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group G3: Broken shape
// -----------------------------------------------------------------------------
void test_malformed_known_type() {
    std::cout << "[TEST] Group G3: broken shapes raise validation errors\n";
    test::harness::Connection h;
    h.open_and_authenticate();

    h.deliver(R"({"type":"server:send_to_agent","agentId":"a1","roomId":"r","messageId":"m"})");
    h.deliver(R"({"type":"server:stop_agent","agentId":""})");
    h.deliver(R"({"kind":"server:pong"})");
    h.deliver(R"([1,2,3])");

    TEST_CHECK(h.messages.empty());
    TEST_CHECK(h.validation_errors.size() == 4);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group G4: Not JSON
// -----------------------------------------------------------------------------
void test_invalid_json_ignored() {
    std::cout << "[TEST] Group G4: non-JSON text is ignored\n";
    test::harness::Connection h;
    h.open_and_authenticate();

    h.deliver("hello there");
    h.deliver(R"({"type":"server:pong",)");

    TEST_CHECK(h.messages.empty());
    TEST_CHECK(h.validation_errors.empty());
    TEST_CHECK(h.connection->connected());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group G5: Internally consumed messages
// -----------------------------------------------------------------------------
void test_internal_messages_not_forwarded() {
    std::cout << "[TEST] Group G5: auth results and pongs stay internal\n";
    test::harness::Connection h;
    h.open_and_authenticate();

    h.deliver(agentlink::test::wire::pong(123));
    h.deliver(agentlink::test::wire::auth_ok());

    TEST_CHECK(h.messages.empty());
    TEST_CHECK(h.validation_errors.empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group G6: Unsubscribe
// -----------------------------------------------------------------------------
void test_unsubscribe() {
    std::cout << "[TEST] Group G6: unsubscribed handlers are not invoked\n";
    test::harness::Connection h;
    h.open_and_authenticate();

    int extra = 0;
    auto sub = h.connection->on_message([&extra](const protocol::InboundMessage&) {
        ++extra;
    });
    h.deliver(agentlink::test::wire::remove_agent("a1"));
    TEST_CHECK(extra == 1);

    sub.unsubscribe();
    TEST_CHECK(!sub.active());
    sub.unsubscribe();

    h.deliver(agentlink::test::wire::remove_agent("a2"));
    TEST_CHECK(extra == 1);
    TEST_CHECK(h.messages.size() == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_valid_message_delivered();
    test_unknown_type_raises_validation_error();
    test_malformed_known_type();
    test_invalid_json_ignored();
    test_internal_messages_not_forwarded();
    test_unsubscribe();

    std::cout << "\n[GROUP G — INBOUND VALIDATION TESTS PASSED]\n";
    return 0;
}
