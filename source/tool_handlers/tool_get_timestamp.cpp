#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "platform/platform_abi.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static mcp_tools::ToolResult handle_get_timestamp(const json &arguments) {
    (void)arguments;
    return mcp_tools::text_result("Current timestamp: " + platform::local_timestamp_iso8601());
}

namespace tool_get_timestamp {

bool register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["required"] = json::array();

    return registry.register_tool({
        "get_timestamp",
        "Get current timestamp",
        input_schema,
        handle_get_timestamp
    });
}

} // namespace tool_get_timestamp
