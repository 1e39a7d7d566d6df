#ifndef FMCPS_SERVER_CONFIG_HPP
#define FMCPS_SERVER_CONFIG_HPP

// Server identity and behavior switches.
// Built once at startup and passed by const reference to the components that need it.

#include <string>

namespace config {

struct ServerConfig {
    // MCP protocol revision reported by "initialize".
    std::string protocol_version = "2024-11-05";
    std::string server_name = "fmcps";
    std::string server_version = "1.0.0";
    // When true, messages without an "id" are handled as JSON-RPC notifications
    // and get no response. When false, every message is answered (id echoed as null).
    bool strict_notifications = false;
};

// Returns true if the environment variable is set to 1, true or yes (case-insensitive).
bool env_flag(const char *name);

// Returns the environment variable's value, or fallback if unset or empty.
std::string env_or(const char *name, const std::string &fallback);

// Defaults overridden by FMCPS_SERVER_NAME, FMCPS_SERVER_VERSION and
// FMCPS_STRICT_NOTIFICATIONS.
ServerConfig load_server_config();

} // namespace config

#endif // FMCPS_SERVER_CONFIG_HPP
