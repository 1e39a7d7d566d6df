#include "tool_handlers/tool_handlers.hpp"

// Forward declarations of individual tool registration functions.
// Each tool_*.cpp defines its own namespace with a register_tool() function.

namespace tool_read_file { bool register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_write_file { bool register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_list_directory { bool register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_get_timestamp { bool register_tool(mcp_tools::ToolRegistry &registry); }

namespace tool_handlers {

bool register_all_tools(mcp_tools::ToolRegistry &registry) {
    bool all_registered = true;
    all_registered &= tool_read_file::register_tool(registry);
    all_registered &= tool_write_file::register_tool(registry);
    all_registered &= tool_list_directory::register_tool(registry);
    all_registered &= tool_get_timestamp::register_tool(registry);
    return all_registered;
}

} // namespace tool_handlers
