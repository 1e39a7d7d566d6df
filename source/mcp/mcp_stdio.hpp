#ifndef FMCPS_MCP_STDIO_HPP
#define FMCPS_MCP_STDIO_HPP

// MCP stdio transport: newline-delimited JSON-RPC on stdin/stdout.
// Exactly one message per line; stdout carries nothing but responses.

#include <iosfwd>
#include <string>

#include "mcp/mcp_dispatch.hpp"

namespace mcp_stdio {

// Read one line (without the terminating '\n' or a trailing '\r').
// Returns false on EOF, stream error or an interrupted read.
bool read_line(std::istream &input, std::string &line);

// Write a complete, newline-terminated message and flush.
// Returns false if the stream is no longer writable.
bool write_message(std::ostream &output, const std::string &line);

// Write a log message to stderr.
void log_message(const std::string &message);

// Decode, dispatch and encode one input line. Returns the newline-terminated
// response, or an empty string when nothing must be written (blank line,
// suppressed notification). Never throws for malformed or failing messages.
std::string process_line(const std::string &line, const mcp_dispatch::Dispatcher &dispatcher);

// Ask serve() to stop. Async-signal-safe.
void request_shutdown();
bool shutdown_requested();

// Clear a pending shutdown request so serve() can run again.
void reset_shutdown_request();

// Main message loop. Returns 0 on EOF or shutdown request, 1 if output
// could not be written.
int serve(std::istream &input, std::ostream &output, const mcp_dispatch::Dispatcher &dispatcher);

} // namespace mcp_stdio

#endif // FMCPS_MCP_STDIO_HPP
