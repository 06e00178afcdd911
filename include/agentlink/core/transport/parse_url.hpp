#pragma once

#include <charconv>
#include <string>
#include <string_view>
#include <system_error>

#include "agentlink/core/transport/error.hpp"


namespace agentlink::core::transport {

    // Paths of the coordinator channels
    inline constexpr std::string_view CLIENT_ENDPOINT_PATH  = "/ws/client";
    inline constexpr std::string_view GATEWAY_ENDPOINT_PATH = "/ws/gateway";

    // Contains parsed URL components
    struct ParsedUrl {
        bool secure{false};   // true = wss, false = ws
        std::string host;
        std::string port;
        std::string path;
    };


    // ---------------------------------------------------------------------
    // Minimal, invariant-validated ws:// and wss:// URL parser. It accepts
    // the URLs a coordinator exposes and rejects malformed input without
    // attempting full RFC compliance.
    //
    // Example inputs:
    //   wss://agents.example.com/ws/client
    //   ws://localhost:3000/ws/client
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error parse_url(std::string_view url, ParsedUrl& out) noexcept {
        out = ParsedUrl{};

        std::string_view rest;
        if (url.starts_with("wss://")) {
            out.secure = true;
            rest = url.substr(6);
        }
        else if (url.starts_with("ws://")) {
            rest = url.substr(5);
        }
        else {
            return Error::InvalidUrl;
        }

        const auto slash = rest.find('/');
        const std::string_view authority = rest.substr(0, slash);
        out.path = (slash == std::string_view::npos) ? std::string("/") : std::string(rest.substr(slash));

        const auto colon = authority.find(':');
        const std::string_view host = authority.substr(0, colon);
        if (host.empty()) {
            return Error::InvalidUrl;
        }
        out.host = host;

        if (colon == std::string_view::npos) {
            out.port = out.secure ? "443" : "80";
            return Error::None;
        }

        // Explicit port: digits only, 1..65535
        const std::string_view port = authority.substr(colon + 1);
        unsigned int value = 0;
        const auto [end, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
        if (port.empty() || ec != std::errc{} || end != port.data() + port.size() || value == 0 || value > 65535) {
            return Error::InvalidUrl;
        }
        out.port = port;
        return Error::None;
    }


    // ---------------------------------------------------------------------
    // Derives a channel URL from the host context the process runs in:
    // "agents.example.com" -> "wss://agents.example.com/ws/client".
    // host may carry a port ("localhost:3000").
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline std::string endpoint_from_host(std::string_view host, bool secure,
                                          std::string_view path = CLIENT_ENDPOINT_PATH) {
        std::string url = secure ? "wss://" : "ws://";
        url.append(host);
        url.append(path);
        return url;
    }

} // namespace agentlink::core::transport
