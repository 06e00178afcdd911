#pragma once

#include <string>

#include <sys/utsname.h>

#include "agentlink/core/protocol/schema/gateway/auth.hpp"


namespace agentlink::examples {

inline constexpr const char* RUNTIME_VERSION = "agentlink/0.1.0";

// -------------------------------------------------------------
// Host description announced in gateway:auth
// -------------------------------------------------------------
[[nodiscard]]
inline core::protocol::schema::gateway::DeviceInfo device_info() {
    core::protocol::schema::gateway::DeviceInfo info;
    info.runtime_version = RUNTIME_VERSION;

    struct utsname u{};
    if (::uname(&u) == 0) {
        info.hostname = u.nodename;
        info.platform = u.sysname;
        info.arch     = u.machine;
    } else {
        info.hostname = "unknown";
        info.platform = "unknown";
        info.arch     = "unknown";
    }
    return info;
}

} // namespace agentlink::examples
