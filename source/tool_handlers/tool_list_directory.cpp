#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <string>

using json = nlohmann::json;

// Tool handler for "list_directory".
// One line per entry, sorted by name: "<name> (<file|directory>, <size> bytes)".

static std::string format_entry(const platform::DirectoryEntry &entry) {
    std::string name = entry.name;
    utf8::sanitize(name);
    return name + " (" + (entry.is_directory ? "directory" : "file") + ", " +
           std::to_string(entry.size) + " bytes)";
}

static mcp_tools::ToolResult handle_list_directory(const json &arguments) {
    std::string path = mcp_tools::optional_string_argument(arguments, "path", ".");

    debug_log::log("list_directory invoked path=" + path);
    platform::DirectoryListResult list_result = platform::list_directory(path);

    switch (list_result.status) {
    case platform::PathStatus::NotFound:
        return mcp_tools::error_result("Directory not found: " + path);
    case platform::PathStatus::NotADirectory:
        return mcp_tools::error_result("Path is not a directory: " + path);
    case platform::PathStatus::Failed:
        return mcp_tools::error_result("Failed to list directory: " + list_result.error_detail);
    case platform::PathStatus::Ok:
        break;
    }

    std::sort(list_result.entries.begin(), list_result.entries.end(),
              [](const platform::DirectoryEntry &left, const platform::DirectoryEntry &right) {
                  return left.name < right.name;
              });

    std::string text = "Contents of " + path + ":\n";
    for (size_t index = 0; index < list_result.entries.size(); ++index) {
        if (index > 0) {
            text += "\n";
        }
        text += format_entry(list_result.entries[index]);
    }

    return mcp_tools::text_result(text);
}

namespace tool_list_directory {

bool register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"path", {{"type", "string"}, {"description", "Path to the directory to list (defaults to \".\")"}}}
    };
    input_schema["required"] = json::array();

    return registry.register_tool({
        "list_directory",
        "List contents of a directory",
        input_schema,
        handle_list_directory
    });
}

} // namespace tool_list_directory
