#ifndef CDPDBG_PATH_OVERRIDES_HPP
#define CDPDBG_PATH_OVERRIDES_HPP

// Source-map path overrides: glob-style pattern -> local replacement.
// A replacement may start with ${webRoot}, which is substituted with the
// configured web root before the table is used.

#include <map>
#include <string>

#include "utils/session_events.hpp"

namespace path_overrides {

using PathOverrideTable = std::map<std::string, std::string>;

static const char WEB_ROOT_PLACEHOLDER[] = "${webRoot}";

// Table used when the launch request does not supply one.
const PathOverrideTable &default_path_overrides();

// Returns a copy of table with ${webRoot} resolved in every entry.
// Entries whose placeholder is not at position 0 are reported and kept
// unmodified. An empty web_root leaves entries unmodified, reported only
// when warn_on_missing is set.
PathOverrideTable resolve_web_root_pattern(const std::string &web_root, const PathOverrideTable &table,
                                           bool warn_on_missing, session_events::EventSink &events);

// User table if one was given (warnings on), else the default table (warnings off).
PathOverrideTable get_path_overrides(const std::string &web_root, const PathOverrideTable *user_table,
                                     session_events::EventSink &events);

} // namespace path_overrides

#endif // CDPDBG_PATH_OVERRIDES_HPP
