#pragma once

#include <cstdlib>
#include <iostream>

namespace agentlink::test {

[[noreturn]] inline void fail_check(const char* expr, const char* file, int line) {
    std::cerr << "[TEST FAILED] " << expr << " at " << file << ":" << line << std::endl;
    std::abort();
}

} // namespace agentlink::test

// Aborts the test executable when expr is false
#define TEST_CHECK(expr)                                                      \
    do {                                                                      \
        if (!(expr)) {                                                        \
            ::agentlink::test::fail_check(#expr, __FILE__, __LINE__);         \
        }                                                                     \
    } while (0)
