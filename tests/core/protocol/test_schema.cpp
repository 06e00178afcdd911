/*
===============================================================================
 protocol::schema: Outbound Serialization Unit Tests
===============================================================================

Scope:
------
Wire shape of every message the gateway sends to the coordinator.

Covered Requirements:
---------------------
S1. client:auth and client:ping carry the control tag and their fields
S2. gateway:register_agent (with and without working directory)
S3. gateway:unregister_agent and gateway:agent_status
S4. gateway:message_complete escapes arbitrary content
S5. gateway:auth is a control message; optional fields only when set

===============================================================================
*/

#include <iostream>
#include <string>
#include <string_view>

#include "agentlink/core/protocol/schema/client/auth.hpp"
#include "agentlink/core/protocol/schema/client/ping.hpp"
#include "agentlink/core/protocol/schema/gateway/agent_status.hpp"
#include "agentlink/core/protocol/schema/gateway/auth.hpp"
#include "agentlink/core/protocol/schema/gateway/message_complete.hpp"
#include "agentlink/core/protocol/schema/gateway/register_agent.hpp"
#include "agentlink/core/protocol/parser/router.hpp"
#include "common/test_check.hpp"
#include "lcr/log/logger.hpp"

using namespace agentlink::core::protocol;

template<class Message>
concept ControlMessage = requires { typename Message::control_tag; };


// -----------------------------------------------------------------------------
// Group S1: Control messages
// -----------------------------------------------------------------------------
void test_control_messages() {
    std::cout << "[TEST] Group S1: control messages\n";

    static_assert(ControlMessage<schema::client::Auth>);
    static_assert(ControlMessage<schema::client::Ping>);
    static_assert(!ControlMessage<schema::gateway::AgentStatus>);
    static_assert(!ControlMessage<schema::gateway::MessageComplete>);

    const schema::client::Auth auth{"secret-token"};
    TEST_CHECK(auth.to_json() == R"({"type":"client:auth","token":"secret-token"})");

    const schema::client::Ping ping{1700000000123ULL};
    TEST_CHECK(ping.to_json() == R"({"type":"client:ping","ts":1700000000123})");
    TEST_CHECK(ping.to_json().size() <= schema::client::Ping::max_json_size());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group S2: register_agent
// -----------------------------------------------------------------------------
void test_register_agent() {
    std::cout << "[TEST] Group S2: register_agent\n";

    schema::gateway::AgentInfo info{"a1", "Echo", "echo"};
    TEST_CHECK(schema::gateway::RegisterAgent{info}.to_json() ==
               R"({"type":"gateway:register_agent","agent":{"id":"a1","name":"Echo","type":"echo"}})");

    info.working_directory = std::string("/srv/work");
    TEST_CHECK(schema::gateway::RegisterAgent{info}.to_json() ==
               R"({"type":"gateway:register_agent","agent":{"id":"a1","name":"Echo","type":"echo","workingDirectory":"/srv/work"}})");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group S3: unregister_agent / agent_status
// -----------------------------------------------------------------------------
void test_unregister_and_status() {
    std::cout << "[TEST] Group S3: unregister_agent and agent_status\n";

    TEST_CHECK(schema::gateway::UnregisterAgent{"a1"}.to_json() ==
               R"({"type":"gateway:unregister_agent","agentId":"a1"})");

    const schema::gateway::AgentStatus busy{"a1", AgentStatus::Busy, 4};
    TEST_CHECK(busy.to_json() == R"({"type":"gateway:agent_status","agentId":"a1","status":"busy","queueDepth":4})");

    const schema::gateway::AgentStatus online{"a1", AgentStatus::Online, 0};
    TEST_CHECK(online.to_json() == R"({"type":"gateway:agent_status","agentId":"a1","status":"online","queueDepth":0})");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group S4: message_complete
// -----------------------------------------------------------------------------
void test_message_complete_escaping() {
    std::cout << "[TEST] Group S4: message_complete escapes content\n";

    const std::string content = "line 1\nsays \"hi\"\t\\ done\x01";
    const schema::gateway::MessageComplete msg{"room-1", "a1", "m-7", content};
    const std::string json = msg.to_json();

    TEST_CHECK(json.find(R"("roomId":"room-1")") != std::string::npos);
    TEST_CHECK(json.find(R"("messageId":"m-7")") != std::string::npos);
    TEST_CHECK(json.find(R"(line 1\nsays \"hi\"\t\\ done\u0001)") != std::string::npos);

    // The escaped document is valid JSON and round-trips the content
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    TEST_CHECK(!parser.parse(json).get(root));
    std::string_view full;
    TEST_CHECK(!root["fullContent"].get(full));
    TEST_CHECK(full == content);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group S5: gateway:auth
// -----------------------------------------------------------------------------
void test_gateway_auth() {
    std::cout << "[TEST] Group S5: gateway:auth\n";

    static_assert(ControlMessage<schema::gateway::Auth>);

    schema::gateway::Auth auth;
    auth.token = "tk";
    auth.gateway_id = "gw-1";
    auth.device_info = {"box", "linux", "arm64", "agentlink/0.1.0"};
    TEST_CHECK(auth.to_json() ==
               R"({"type":"gateway:auth","token":"tk","gatewayId":"gw-1",)"
               R"("deviceInfo":{"hostname":"box","platform":"linux","arch":"arm64","nodeVersion":"agentlink/0.1.0"}})");

    auth.protocol_version = std::string("2");
    auth.ephemeral = true;
    TEST_CHECK(auth.to_json() ==
               R"({"type":"gateway:auth","token":"tk","gatewayId":"gw-1","protocolVersion":"2",)"
               R"("deviceInfo":{"hostname":"box","platform":"linux","arch":"arm64","nodeVersion":"agentlink/0.1.0"},)"
               R"("ephemeral":true})");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Info);

    test_control_messages();
    test_register_agent();
    test_unregister_and_status();
    test_message_complete_escaping();
    test_gateway_auth();

    std::cout << "\n[GROUP S — OUTBOUND SCHEMA TESTS PASSED]\n";
    return 0;
}
