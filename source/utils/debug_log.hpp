#ifndef CDPDBG_DEBUG_LOG_HPP
#define CDPDBG_DEBUG_LOG_HPP

#include <string>

namespace debug_log {

// True if CDPDBG_DEBUG is 1, true or yes (any case). Read once.
bool is_debug_enabled();

// Writes "[cdpdbg <seconds since start>] message" to stderr when is_debug_enabled().
void log(const std::string &message);

// Same line format, regardless of CDPDBG_DEBUG.
void log_always(const std::string &message);

} // namespace debug_log

#endif // CDPDBG_DEBUG_LOG_HPP
