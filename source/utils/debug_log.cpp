#include "utils/debug_log.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

namespace debug_log {

// Reference point for the elapsed time printed on every line.
static const std::chrono::steady_clock::time_point process_start = std::chrono::steady_clock::now();

static bool read_debug_flag() {
    const char *value = std::getenv("CDPDBG_DEBUG");
    if (value == nullptr) {
        return false;
    }
    std::string normalized;
    for (const char *cursor = value; *cursor != '\0'; cursor++) {
        normalized += static_cast<char>(std::tolower(static_cast<unsigned char>(*cursor)));
    }
    return normalized == "1" || normalized == "true" || normalized == "yes";
}

bool is_debug_enabled() {
    // The environment is read once; spawned debuggees inherit it unchanged.
    static const bool enabled = read_debug_flag();
    return enabled;
}

void log(const std::string &message) {
    if (is_debug_enabled()) {
        log_always(message);
    }
}

void log_always(const std::string &message) {
    long long elapsed_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - process_start).count();
    char elapsed_text[32];
    std::snprintf(elapsed_text, sizeof(elapsed_text), "%lld.%03lld", elapsed_milliseconds / 1000,
                  elapsed_milliseconds % 1000);
    std::cerr << "[cdpdbg " << elapsed_text << "] " << message << std::endl;
}

} // namespace debug_log
