#ifndef FMCPS_TOOL_HANDLERS_HPP
#define FMCPS_TOOL_HANDLERS_HPP

// Tool handler registration.
// Each tool_*.cpp file provides a register function that is called during startup.

#include "mcp/mcp_tools.hpp"

namespace tool_handlers {

// Register all available tool handlers with registry.
// Returns false if any tool could not be registered.
bool register_all_tools(mcp_tools::ToolRegistry &registry);

} // namespace tool_handlers

#endif // FMCPS_TOOL_HANDLERS_HPP
