#include "mcp/mcp_dispatch.hpp"
#include "utils/debug_log.hpp"

namespace mcp_dispatch {

MethodKind classify_method(const std::string &method) {
    if (method == "initialize") {
        return MethodKind::Initialize;
    }
    if (method == "tools/list") {
        return MethodKind::ToolsList;
    }
    if (method == "tools/call") {
        return MethodKind::ToolsCall;
    }
    return MethodKind::Unknown;
}

Dispatcher::Dispatcher(const config::ServerConfig &server_config, const mcp_tools::ToolRegistry &tool_registry)
    : server_config_(server_config), tool_registry_(tool_registry) {}

json Dispatcher::dispatch_message(const json_rpc::Request &request) const {
    debug_log::log("Dispatching method: " + request.method);

    json response = route(request);

    // Strict JSON-RPC: notifications are handled but never answered.
    if (!request.has_id && server_config_.strict_notifications) {
        return nullptr;
    }
    return response;
}

json Dispatcher::route(const json_rpc::Request &request) const {
    switch (classify_method(request.method)) {
    case MethodKind::Initialize:
        return handle_initialize(request.id, request.params);
    case MethodKind::ToolsList:
        return handle_tools_list(request.id, request.params);
    case MethodKind::ToolsCall:
        return handle_tools_call(request.id, request.params);
    case MethodKind::Unknown:
        break;
    }
    return json_rpc::build_error_response(request.id, json_rpc::METHOD_NOT_FOUND,
                                          "Method not found: " + request.method);
}

// Handle the "initialize" request.
json Dispatcher::handle_initialize(const json &request_id, const json &params) const {
    (void)params; // Any client capabilities are accepted.

    json capabilities;
    capabilities["tools"] = json::object();

    json server_info;
    server_info["name"] = server_config_.server_name;
    server_info["version"] = server_config_.server_version;

    json result;
    result["protocolVersion"] = server_config_.protocol_version;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;

    return json_rpc::build_response(request_id, result);
}

json Dispatcher::handle_tools_list(const json &request_id, const json &params) const {
    (void)params;
    return json_rpc::build_response(request_id, tool_registry_.build_tools_list_response());
}

json Dispatcher::handle_tools_call(const json &request_id, const json &params) const {
    // A missing or non-string name is looked up by its JSON text ("null" when absent)
    // and reported by the registry as an unknown tool.
    std::string tool_name = "null";
    if (params.contains("name")) {
        tool_name = params["name"].is_string() ? params["name"].get<std::string>() : params["name"].dump();
    }

    json arguments = json::object();
    if (params.contains("arguments") && params["arguments"].is_object()) {
        arguments = params["arguments"];
    }

    mcp_tools::ToolResult tool_result = tool_registry_.invoke(tool_name, arguments);
    return json_rpc::build_response(request_id, mcp_tools::build_tool_result_response(tool_result));
}

} // namespace mcp_dispatch
