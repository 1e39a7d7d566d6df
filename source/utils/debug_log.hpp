#ifndef FMCPS_DEBUG_LOG_HPP
#define FMCPS_DEBUG_LOG_HPP

#include <string>

namespace debug_log {

// Returns true if FMCPS_DEBUG env is set to a truthy value (1, true, yes).
bool is_debug_enabled();

// Writes message to stderr with [fmcps] prefix only when is_debug_enabled().
// Never writes to stdout, which carries the protocol channel.
void log(const std::string &message);

} // namespace debug_log

#endif // FMCPS_DEBUG_LOG_HPP
