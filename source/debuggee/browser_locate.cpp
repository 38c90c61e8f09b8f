#include "debuggee/browser_locate.hpp"
#include "platform/platform_abi.hpp"

#include <filesystem>

namespace browser_locate {

// Well-known browser executable paths on Linux.
static const std::vector<std::string> LINUX_BROWSER_PATHS = {
    "google-chrome",
    "google-chrome-stable",
    "chromium",
    "chromium-browser",
    "/usr/bin/google-chrome",
    "/usr/bin/google-chrome-stable",
    "/usr/bin/chromium-browser",
    "/usr/bin/chromium",
    "/snap/bin/chromium",
};

std::string find_browser_executable() {
    for (const auto &candidate : LINUX_BROWSER_PATHS) {
        if (candidate.find('/') != std::string::npos) {
            std::error_code error;
            if (std::filesystem::exists(candidate, error)) {
                return candidate;
            }
        } else {
            std::string full_path = platform::find_on_path(candidate);
            if (!full_path.empty()) {
                return full_path;
            }
        }
    }
    return "";
}

} // namespace browser_locate
