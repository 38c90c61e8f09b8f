#ifndef CDPDBG_PLATFORM_ABI_HPP
#define CDPDBG_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <string>
#include <vector>

namespace platform {

// Platform the debuggee is launched for. Usually the host, but a launch
// request may name another one (e.g. to force the helper-mediated spawn).
enum class HostPlatform {
    Linux,
    MacOS,
    Windows
};

// Platform traits that decide how a debuggee gets spawned.
struct PlatformCapabilities {
    HostPlatform platform = HostPlatform::Linux;
    // The immediate child id is not the debuggee id; a helper reports the real one.
    bool indirect_pid_discovery = false;
    // Helper executable used when indirect_pid_discovery is set.
    std::string spawn_helper_path;
};

HostPlatform current_platform();
PlatformCapabilities capabilities_for(HostPlatform platform);

const char *platform_name(HostPlatform platform);

// Parses "linux", "osx"/"macos"/"darwin", "windows"/"win32". Returns false on anything else.
bool parse_platform_name(const std::string &name, HostPlatform &output_platform);

// How the standard streams of a spawned child are wired.
enum class StreamMode {
    Inherit,
    DevNull,
    Pipe
};

struct SpawnOptions {
    // Empty keeps the parent's working directory.
    std::string working_directory;
    // Put the child in its own process group so it outlives terminal signals
    // aimed at ours.
    bool detached = false;
    StreamMode stdin_mode = StreamMode::Inherit;
    StreamMode stdout_mode = StreamMode::Inherit;
    // Pipe here shares the stdout pipe; stdout_mode must then be Pipe as well.
    StreamMode stderr_mode = StreamMode::Inherit;
};

// Result of spawning a child process.
struct SpawnResult {
    bool success = false;
    int process_id = -1;
    // Read end of the child's stdout when stdout_mode is Pipe, else -1.
    // The caller owns it and must close_descriptor() it.
    int stdout_descriptor = -1;
    std::string error_message;
};

// Spawn a child process with the given executable path and arguments.
// The child is not waited on; a bare name is searched on $PATH.
SpawnResult spawn_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments,
                          const SpawnOptions &options);

// Result of running a process to completion.
struct RunResult {
    bool success = false;   // spawned and exited with status 0
    bool spawned = false;
    int exit_code = -1;
    std::vector<std::string> output_lines; // combined stdout/stderr
    std::string error_message;
};

// Run a process to completion, capturing stdout and stderr line by line.
RunResult run_process(const std::string &executable_path,
                      const std::vector<std::string> &arguments,
                      const std::string &working_directory);

// Read one '\n'-terminated line from descriptor, waiting at most
// timeout_milliseconds in total. Returns false on timeout, EOF before any
// newline, or read error. A line cut by EOF is still returned.
bool read_line(int descriptor, int timeout_milliseconds, std::string &output_line);

void close_descriptor(int descriptor);

// Read the entire contents of a text file into a string.
// Returns true on success, false on failure (file not found, permission, etc.).
bool read_file_contents(const std::string &file_path, std::string &output_contents);

// Search $PATH for an executable with the given bare name. Returns "" if not found.
std::string find_on_path(const std::string &executable_name);

// Send SIGINT to the process. Cooperative: the process may clean up first.
bool interrupt_process(int process_id);

// Synchronously SIGKILL the process and every descendant. Returns true if
// the root process was signalled.
bool force_kill_process_tree(int process_id);

// True while a process with this id exists (zombies count as gone).
bool is_process_alive(int process_id);

// Non-blocking exit check. Children of ours are reaped with WNOHANG; for
// any other process this falls back to !is_process_alive().
bool reap_if_exited(int process_id);

} // namespace platform

#endif // CDPDBG_PLATFORM_ABI_HPP
