#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8.hpp"

#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

// Tool handler for "write_file".
// Creates missing parent directories, then replaces the file with the given text.

static mcp_tools::ToolResult handle_write_file(const json &arguments) {
    std::string path = mcp_tools::require_string_argument(arguments, "path");
    std::string content = mcp_tools::require_string_argument(arguments, "content", true);

    debug_log::log("write_file invoked path=" + path + " bytes=" + std::to_string(content.size()));
    platform::FileWriteResult write_result = platform::write_file_contents(path, content);

    if (!write_result.success) {
        return mcp_tools::error_result("Failed to write file: " + write_result.error_detail);
    }

    return mcp_tools::text_result("Successfully wrote " + std::to_string(utf8::count_code_points(content)) +
                                  " characters to " + path);
}

namespace tool_write_file {

bool register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"path", {{"type", "string"}, {"description", "Path to the file to write"}}},
        {"content", {{"type", "string"}, {"description", "Content to write to the file"}}}
    };
    input_schema["required"] = json::array({"path", "content"});

    return registry.register_tool({
        "write_file",
        "Write content to a file",
        input_schema,
        handle_write_file
    });
}

} // namespace tool_write_file
