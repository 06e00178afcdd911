/*
===============================================================================
 transport::parse_url: Unit Tests
===============================================================================

Scope:
------
Endpoint validation used by Connection before any transport is created.

Covered Requirements:
---------------------
U1. ws:// and wss:// with default and explicit ports
U2. Missing path defaults to "/"
U3. Malformed input is rejected (scheme, host, port)
U4. Endpoint derivation from a host context
    - /ws/client by default, /ws/gateway for the agent host channel

===============================================================================
*/

#include <iostream>
#include <string>

#include "agentlink/core/transport/parse_url.hpp"
#include "common/test_check.hpp"
#include "lcr/log/logger.hpp"

using namespace agentlink::core::transport;


// -----------------------------------------------------------------------------
// Group U1: Valid endpoints
// -----------------------------------------------------------------------------
void test_valid_endpoints() {
    std::cout << "[TEST] Group U1: valid endpoints\n";
    ParsedUrl u;

    TEST_CHECK(parse_url("wss://agents.example.com/ws/client", u) == Error::None);
    TEST_CHECK(u.secure);
    TEST_CHECK(u.host == "agents.example.com");
    TEST_CHECK(u.port == "443");
    TEST_CHECK(u.path == "/ws/client");

    TEST_CHECK(parse_url("ws://localhost:3000/ws/client?v=2", u) == Error::None);
    TEST_CHECK(!u.secure);
    TEST_CHECK(u.host == "localhost");
    TEST_CHECK(u.port == "3000");
    TEST_CHECK(u.path == "/ws/client?v=2");

    TEST_CHECK(parse_url("ws://10.0.0.7", u) == Error::None);
    TEST_CHECK(u.port == "80");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group U2: Default path
// -----------------------------------------------------------------------------
void test_default_path() {
    std::cout << "[TEST] Group U2: missing path defaults to /\n";
    ParsedUrl u;
    TEST_CHECK(parse_url("wss://agents.example.com:8443", u) == Error::None);
    TEST_CHECK(u.path == "/");
    TEST_CHECK(u.port == "8443");
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group U3: Malformed input
// -----------------------------------------------------------------------------
void test_malformed_rejected() {
    std::cout << "[TEST] Group U3: malformed endpoints are rejected\n";
    ParsedUrl u;
    TEST_CHECK(parse_url("", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("https://agents.example.com/ws/client", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("wss://", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("wss:///ws/client", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("wss://host:/ws", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("wss://:443/ws", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("wss://host:abc/ws", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("wss://host:0/ws", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("wss://host:70000/ws", u) == Error::InvalidUrl);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group U4: Endpoint derivation
// -----------------------------------------------------------------------------
void test_endpoint_from_host() {
    std::cout << "[TEST] Group U4: endpoints from host context\n";
    TEST_CHECK(endpoint_from_host("agents.example.com", true) == "wss://agents.example.com/ws/client");
    TEST_CHECK(endpoint_from_host("localhost:3000", false) == "ws://localhost:3000/ws/client");
    TEST_CHECK(endpoint_from_host("localhost:3000", false, GATEWAY_ENDPOINT_PATH) == "ws://localhost:3000/ws/gateway");
    TEST_CHECK(endpoint_from_host("agents.example.com", true, GATEWAY_ENDPOINT_PATH) == "wss://agents.example.com/ws/gateway");

    ParsedUrl u;
    TEST_CHECK(parse_url(endpoint_from_host("localhost:3000", false), u) == Error::None);
    TEST_CHECK(u.port == "3000");
    TEST_CHECK(parse_url(endpoint_from_host("localhost:3000", false, GATEWAY_ENDPOINT_PATH), u) == Error::None);
    TEST_CHECK(u.path == "/ws/gateway");
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Info);

    test_valid_endpoints();
    test_default_path();
    test_malformed_rejected();
    test_endpoint_from_host();

    std::cout << "\n[GROUP U — URL PARSING TESTS PASSED]\n";
    return 0;
}
