// fmcps – File MCP Server
// Entry point: stdio MCP server loop.
//
// Reads newline-delimited JSON-RPC 2.0 messages from stdin, dispatches them,
// writes one response line per message to stdout.
// Logs go to stderr; stdout carries protocol traffic only.

#include <csignal>
#include <iostream>
#include <string>

#include "config/server_config.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_tools.hpp"
#include "platform/platform_abi.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

static void signal_handler(int signal_number) {
    (void)signal_number;
    mcp_stdio::request_shutdown();
}

int main() {
    std::cerr << "[fmcps] fmcps – File MCP Server, build " << __DATE__ << " " << __TIME__ << std::endl;

    if (!platform::install_signal_handler(SIGINT, signal_handler) ||
        !platform::install_signal_handler(SIGTERM, signal_handler)) {
        mcp_stdio::log_message("Could not install signal handlers; interrupts will not stop the loop cleanly.");
    }
    if (!platform::ignore_signal(SIGPIPE)) {
        mcp_stdio::log_message("Could not ignore SIGPIPE; a closed stdout will kill the process.");
    }

    const config::ServerConfig server_config = config::load_server_config();
    debug_log::log("Server identity: " + server_config.server_name + " " + server_config.server_version +
                   (server_config.strict_notifications ? " (strict notifications)" : ""));

    mcp_tools::ToolRegistry tool_registry;
    if (!tool_handlers::register_all_tools(tool_registry)) {
        mcp_stdio::log_message("Tool registration failed. Exiting.");
        return 1;
    }

    const mcp_dispatch::Dispatcher dispatcher(server_config, tool_registry);

    mcp_stdio::log_message("fmcps started with " + std::to_string(tool_registry.get_registered_tools().size()) +
                           " tools. Waiting for MCP messages on stdin.");

    int exit_code = mcp_stdio::serve(std::cin, std::cout, dispatcher);

    mcp_stdio::log_message("fmcps shut down.");
    return exit_code;
}
