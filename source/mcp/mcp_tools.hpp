#ifndef FMCPS_MCP_TOOLS_HPP
#define FMCPS_MCP_TOOLS_HPP

// MCP tool registry: registration, listing, and invocation of tools.

#include <nlohmann/json.hpp>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcp_tools {

using json = nlohmann::json;

// One block of tool output. Only the "text" type is produced.
struct ContentBlock {
    std::string type = "text";
    std::string text;
};

// Outcome of a tool call. is_error marks a tool-level failure; it is still
// returned to the client as a successful JSON-RPC result.
struct ToolResult {
    std::vector<ContentBlock> content;
    bool is_error = false;
};

// Thrown by tool handlers for missing arguments and I/O failures.
// Caught by ToolRegistry::invoke and turned into an isError result.
class ToolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A tool handler: receives the "arguments" object of tools/call.
// May block on I/O and may throw.
using ToolHandler = std::function<ToolResult(const json &arguments)>;

// Description of a registered tool, matching the MCP tool schema.
struct ToolDefinition {
    std::string name;
    std::string description;
    json input_schema; // JSON Schema object
    ToolHandler handler;
};

// Single text block results.
ToolResult text_result(const std::string &text);
ToolResult error_result(const std::string &text);

// Build the tools/call result payload: {"content": [...], "isError": bool}.
json build_tool_result_response(const ToolResult &result);

// Return arguments[key] as a string. Throws ToolError("<key> is required") if it
// is missing or not a string, or if it is empty and allow_empty is false.
std::string require_string_argument(const json &arguments, const std::string &key, bool allow_empty = false);

// Return arguments[key] as a string, or fallback if the key is absent.
// Throws ToolError if the key is present but not a string.
std::string optional_string_argument(const json &arguments, const std::string &key, const std::string &fallback);

class ToolRegistry {
public:
    // Register a tool. Returns false if the name is empty, already taken,
    // or the handler is empty.
    bool register_tool(ToolDefinition definition);

    // Build the response payload for tools/list, in registration order.
    json build_tools_list_response() const;

    // Run a tool. Never throws: unknown tools and handler failures come back
    // as results with is_error set.
    ToolResult invoke(const std::string &tool_name, const json &arguments) const;

    // All registered tool definitions, in registration order.
    const std::vector<ToolDefinition> &get_registered_tools() const;

private:
    const ToolDefinition *find_tool(const std::string &tool_name) const;

    std::vector<ToolDefinition> registered_tools_;
};

} // namespace mcp_tools

#endif // FMCPS_MCP_TOOLS_HPP
