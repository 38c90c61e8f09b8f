#ifndef CDPDBG_LAUNCH_CONFIG_HPP
#define CDPDBG_LAUNCH_CONFIG_HPP

// Launch and attach request parsing.
// A request arrives as the JSON "params" of a launch/attach call; the
// parsed config is immutable for the rest of the session.

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "config/path_overrides.hpp"
#include "platform/platform_abi.hpp"

namespace launch_config {

using json = nlohmann::json;

static constexpr int DEFAULT_ATTACH_TIMEOUT_MILLISECONDS = 10000;
static const char DEFAULT_ADDRESS[] = "127.0.0.1";

// Inputs for the build collaborator run before the debuggee is spawned.
struct BuildSettings {
    std::string kha_path;    // empty: no build step
    std::string ffmpeg_path;
};

struct LaunchConfig {
    std::string working_directory;
    std::string executable_path;
    // False when the executable was located on the system instead.
    bool using_explicit_executable = false;
    std::string file;
    std::string url;
    int port = 0;
    bool port_was_explicit = false;
    std::string address = DEFAULT_ADDRESS;
    int timeout_milliseconds = DEFAULT_ATTACH_TIMEOUT_MILLISECONDS;
    bool disable_network_cache = true;
    bool no_debug = false;
    std::string web_root;
    std::optional<path_overrides::PathOverrideTable> user_path_overrides;
    // Placed right after the remote-debugging flag.
    std::vector<std::string> runtime_arguments;
    BuildSettings build;
    platform::PlatformCapabilities capabilities;
};

struct AttachConfig {
    int port = 0;
    std::string address = DEFAULT_ADDRESS;
    std::string url;
    int timeout_milliseconds = DEFAULT_ATTACH_TIMEOUT_MILLISECONDS;
    bool disable_network_cache = true;
    std::string web_root;
    std::optional<path_overrides::PathOverrideTable> user_path_overrides;
};

struct LaunchConfigResult {
    bool success = false;
    LaunchConfig config;
    std::string error_message;
};

struct AttachConfigResult {
    bool success = false;
    AttachConfig config;
    std::string error_message;
};

// Parse a launch request. "cwd" is required; when "runtimeExecutable" is
// missing a browser is located on the system. The remote-debugging port is
// fixed here (explicit, or random in [10000, 20000)).
LaunchConfigResult parse_launch_request(const json &arguments);

// Parse an attach request against an already running debuggee. "port" is required.
AttachConfigResult parse_attach_request(const json &arguments);

} // namespace launch_config

#endif // CDPDBG_LAUNCH_CONFIG_HPP
