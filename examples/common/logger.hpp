#pragma once

#include <string_view>

#include "lcr/log/logger.hpp"


namespace agentlink::examples {

    inline void set_log_level(std::string_view log_level) {
        lcr::log::Logger::instance().set_level(lcr::log::parse_level(log_level));
    }

} // namespace agentlink::examples
