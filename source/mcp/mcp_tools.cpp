#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8.hpp"

#include <utility>

namespace mcp_tools {

namespace {

// Either the handler's result or the reason it failed.
struct InvocationOutcome {
    bool success = false;
    ToolResult result;
    std::string failure_detail;
};

InvocationOutcome run_handler(const ToolDefinition &tool, const json &arguments) {
    InvocationOutcome outcome;
    try {
        outcome.result = tool.handler(arguments);
        outcome.success = true;
    } catch (const std::exception &error) {
        outcome.failure_detail = error.what();
    } catch (...) {
        outcome.failure_detail = "unknown exception";
    }
    return outcome;
}

ToolResult flatten(const std::string &tool_name, InvocationOutcome outcome) {
    if (outcome.success) {
        return std::move(outcome.result);
    }
    utf8::sanitize(outcome.failure_detail);
    debug_log::log("Tool " + tool_name + " failed: " + outcome.failure_detail);
    return error_result("Error executing tool " + tool_name + ": " + outcome.failure_detail);
}

} // namespace

ToolResult text_result(const std::string &text) {
    ToolResult result;
    result.content.push_back(ContentBlock{"text", text});
    return result;
}

ToolResult error_result(const std::string &text) {
    ToolResult result = text_result(text);
    result.is_error = true;
    return result;
}

json build_tool_result_response(const ToolResult &result) {
    json content_array = json::array();
    for (const auto &block : result.content) {
        json content_entry;
        content_entry["type"] = block.type;
        content_entry["text"] = block.text;
        content_array.push_back(content_entry);
    }

    json payload;
    payload["content"] = content_array;
    payload["isError"] = result.is_error;
    return payload;
}

std::string require_string_argument(const json &arguments, const std::string &key, bool allow_empty) {
    if (!arguments.is_object() || !arguments.contains(key) || !arguments[key].is_string()) {
        throw ToolError(key + " is required");
    }
    std::string value = arguments[key].get<std::string>();
    if (value.empty() && !allow_empty) {
        throw ToolError(key + " is required");
    }
    return value;
}

std::string optional_string_argument(const json &arguments, const std::string &key, const std::string &fallback) {
    if (!arguments.is_object() || !arguments.contains(key)) {
        return fallback;
    }
    if (!arguments[key].is_string()) {
        throw ToolError(key + " must be a string");
    }
    return arguments[key].get<std::string>();
}

bool ToolRegistry::register_tool(ToolDefinition definition) {
    if (definition.name.empty() || !definition.handler) {
        debug_log::log("Rejected tool registration with empty name or handler.");
        return false;
    }
    if (find_tool(definition.name) != nullptr) {
        debug_log::log("Rejected duplicate tool registration: " + definition.name);
        return false;
    }
    registered_tools_.push_back(std::move(definition));
    return true;
}

json ToolRegistry::build_tools_list_response() const {
    json tools_array = json::array();
    for (const auto &tool : registered_tools_) {
        json tool_entry;
        tool_entry["name"] = tool.name;
        tool_entry["description"] = tool.description;
        tool_entry["inputSchema"] = tool.input_schema;
        tools_array.push_back(tool_entry);
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

ToolResult ToolRegistry::invoke(const std::string &tool_name, const json &arguments) const {
    const ToolDefinition *tool = find_tool(tool_name);
    if (tool == nullptr) {
        return error_result("Unknown tool: " + tool_name);
    }

    debug_log::log("Invoking tool " + tool_name);
    return flatten(tool_name, run_handler(*tool, arguments));
}

const std::vector<ToolDefinition> &ToolRegistry::get_registered_tools() const {
    return registered_tools_;
}

const ToolDefinition *ToolRegistry::find_tool(const std::string &tool_name) const {
    for (const auto &tool : registered_tools_) {
        if (tool.name == tool_name) {
            return &tool;
        }
    }
    return nullptr;
}

} // namespace mcp_tools
