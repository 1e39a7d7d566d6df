#include "config/server_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace config {

static std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

bool env_flag(const char *name) {
    const char *value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return false;
    }
    std::string normalized = to_lower(std::string(value));
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

std::string env_or(const char *name, const std::string &fallback) {
    const char *value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return fallback;
    }
    return std::string(value);
}

ServerConfig load_server_config() {
    ServerConfig server_config;
    server_config.server_name = env_or("FMCPS_SERVER_NAME", server_config.server_name);
    server_config.server_version = env_or("FMCPS_SERVER_VERSION", server_config.server_version);
    server_config.strict_notifications = env_flag("FMCPS_STRICT_NOTIFICATIONS");
    return server_config;
}

} // namespace config
