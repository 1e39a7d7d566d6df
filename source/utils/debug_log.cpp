#include "utils/debug_log.hpp"
#include "config/server_config.hpp"

#include <iostream>

namespace debug_log {

bool is_debug_enabled() {
    static const bool enabled = config::env_flag("FMCPS_DEBUG");
    return enabled;
}

void log(const std::string &message) {
    if (!is_debug_enabled()) {
        return;
    }
    std::cerr << "[fmcps] " << message << std::endl;
}

} // namespace debug_log
