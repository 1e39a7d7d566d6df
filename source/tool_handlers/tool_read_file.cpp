#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "read_file".
// Returns the whole file as text. Bytes that are not valid UTF-8 are replaced
// with U+FFFD so the response stays valid JSON.

static mcp_tools::ToolResult handle_read_file(const json &arguments) {
    std::string path = mcp_tools::require_string_argument(arguments, "path");

    debug_log::log("read_file invoked path=" + path);
    platform::FileReadResult read_result = platform::read_file_contents(path);

    if (read_result.status == platform::PathStatus::NotFound) {
        return mcp_tools::error_result("File not found: " + path);
    }
    if (read_result.status != platform::PathStatus::Ok) {
        throw mcp_tools::ToolError("cannot read " + path + ": " + read_result.error_detail);
    }

    utf8::sanitize(read_result.contents);
    return mcp_tools::text_result("File content from " + path + ":\n" + read_result.contents);
}

namespace tool_read_file {

bool register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"path", {{"type", "string"}, {"description", "Path to the file to read"}}}
    };
    input_schema["required"] = json::array({"path"});

    return registry.register_tool({
        "read_file",
        "Read the contents of a file",
        input_schema,
        handle_read_file
    });
}

} // namespace tool_read_file
