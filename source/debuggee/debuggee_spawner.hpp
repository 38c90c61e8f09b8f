#ifndef CDPDBG_DEBUGGEE_SPAWNER_HPP
#define CDPDBG_DEBUGGEE_SPAWNER_HPP

// Debuggee command line construction and spawning.

#include <optional>
#include <string>
#include <vector>

#include "config/launch_config.hpp"
#include "debuggee/debuggee_process.hpp"
#include "platform/platform_abi.hpp"
#include "utils/session_events.hpp"

namespace debuggee_spawner {

// Random ports are drawn from [MINIMUM_RANDOM_PORT, MAXIMUM_RANDOM_PORT).
static constexpr int MINIMUM_RANDOM_PORT = 10000;
static constexpr int MAXIMUM_RANDOM_PORT = 20000;

static const char REMOTE_DEBUGGING_PORT_FLAG[] = "--remote-debugging-port=";

// The requested port if there is one, else a random one in [10000, 20000).
int select_port(std::optional<int> requested_port);

// "file://" URL for an absolute path, percent-encoded the way encodeURI does.
std::string path_to_file_url(const std::string &absolute_path);

// file against working_directory (absolute files are kept), lexically normalised.
std::string resolve_against(const std::string &working_directory, const std::string &file);

// file joined under working_directory even when it starts with '/', lexically normalised.
std::string join_under(const std::string &working_directory, const std::string &file);

// file://<cwd>/<file>/index.html if file is set, else url (may be empty).
std::string build_launch_url(const std::string &working_directory, const std::string &file,
                             const std::string &url);

struct DebuggeeCommandLine {
    std::string executable_path;
    std::vector<std::string> arguments;
    std::string launch_url; // empty when none was appended
};

// --remote-debugging-port=<port>, runtime arguments, the resolved target
// file (if any), then the launch URL (if any).
DebuggeeCommandLine build_debuggee_command_line(const launch_config::LaunchConfig &config);

struct SpawnOutcome {
    bool success = false;
    debuggee_process::DebuggeeProcessHandle handle;
    std::string error_message;
};

// Spawn the debuggee with the strategy the platform calls for.
SpawnOutcome spawn(const std::string &executable_path, const std::vector<std::string> &arguments,
                   bool using_explicit_executable, const platform::PlatformCapabilities &capabilities,
                   session_events::EventSink &events);

} // namespace debuggee_spawner

#endif // CDPDBG_DEBUGGEE_SPAWNER_HPP
