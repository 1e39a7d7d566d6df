#ifndef FMCPS_MCP_DISPATCH_HPP
#define FMCPS_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch.
// Routes decoded requests to the initialize, tools/list and tools/call handlers.

#include <nlohmann/json.hpp>
#include <string>

#include "config/server_config.hpp"
#include "mcp/mcp_tools.hpp"
#include "protocol/json_rpc.hpp"

namespace mcp_dispatch {

using json = nlohmann::json;

// The fixed set of methods this server understands.
enum class MethodKind {
    Initialize,
    ToolsList,
    ToolsCall,
    Unknown
};

MethodKind classify_method(const std::string &method);

class Dispatcher {
public:
    // Both references must outlive the dispatcher.
    Dispatcher(const config::ServerConfig &server_config, const mcp_tools::ToolRegistry &tool_registry);

    // Dispatch a single decoded message. Returns the response envelope, or a
    // null json value when no response is due (notifications in strict mode).
    json dispatch_message(const json_rpc::Request &request) const;

private:
    json route(const json_rpc::Request &request) const;
    json handle_initialize(const json &request_id, const json &params) const;
    json handle_tools_list(const json &request_id, const json &params) const;
    json handle_tools_call(const json &request_id, const json &params) const;

    const config::ServerConfig &server_config_;
    const mcp_tools::ToolRegistry &tool_registry_;
};

} // namespace mcp_dispatch

#endif // FMCPS_MCP_DISPATCH_HPP
