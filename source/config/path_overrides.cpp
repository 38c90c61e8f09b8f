#include "config/path_overrides.hpp"

namespace path_overrides {

const PathOverrideTable &default_path_overrides() {
    static const PathOverrideTable defaults = {
        {"webpack:///./*", "${webRoot}/*"},
        {"webpack:///*", "*"},
        {"meteor://\xF0\x9F\x92\xBB" "app/*", "${webRoot}/*"},
    };
    return defaults;
}

PathOverrideTable resolve_web_root_pattern(const std::string &web_root, const PathOverrideTable &table,
                                           bool warn_on_missing, session_events::EventSink &events) {
    const std::string placeholder = WEB_ROOT_PLACEHOLDER;
    PathOverrideTable resolved;

    for (const auto &entry : table) {
        const std::string &pattern = entry.first;
        const std::string &replacement = entry.second;
        resolved[pattern] = replacement;

        size_t placeholder_position = replacement.find(placeholder);
        if (placeholder_position == 0) {
            if (!web_root.empty()) {
                resolved[pattern] = web_root + replacement.substr(placeholder.size());
            } else if (warn_on_missing) {
                events.warning("path_override.web_root_missing",
                               "sourceMapPathOverrides entry contains ${webRoot}, but webRoot is not set",
                               {{"pattern", pattern}});
            }
        } else if (placeholder_position != std::string::npos) {
            events.warning("path_override.malformed",
                           "in a sourceMapPathOverrides entry, ${webRoot} is only valid at the beginning of the path",
                           {{"pattern", pattern}, {"replacement", replacement}});
        }
    }

    return resolved;
}

PathOverrideTable get_path_overrides(const std::string &web_root, const PathOverrideTable *user_table,
                                     session_events::EventSink &events) {
    if (user_table != nullptr) {
        return resolve_web_root_pattern(web_root, *user_table, /*warn_on_missing=*/true, events);
    }
    return resolve_web_root_pattern(web_root, default_path_overrides(), /*warn_on_missing=*/false, events);
}

} // namespace path_overrides
