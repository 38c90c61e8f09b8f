#include "platform/platform_abi.hpp"

#include <unistd.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <spawn.h>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>

extern char **environ;

namespace platform {

HostPlatform current_platform() {
    return HostPlatform::Linux;
}

PlatformCapabilities capabilities_for(HostPlatform platform) {
    PlatformCapabilities capabilities;
    capabilities.platform = platform;
    // Launching through the installed application launcher on Windows hands
    // back the launcher's id, not the browser's.
    capabilities.indirect_pid_discovery = (platform == HostPlatform::Windows);
    return capabilities;
}

const char *platform_name(HostPlatform platform) {
    switch (platform) {
    case HostPlatform::Linux:
        return "linux";
    case HostPlatform::MacOS:
        return "osx";
    case HostPlatform::Windows:
        return "windows";
    }
    return "linux";
}

bool parse_platform_name(const std::string &name, HostPlatform &output_platform) {
    if (name == "linux") {
        output_platform = HostPlatform::Linux;
        return true;
    }
    if (name == "osx" || name == "macos" || name == "darwin") {
        output_platform = HostPlatform::MacOS;
        return true;
    }
    if (name == "windows" || name == "win32") {
        output_platform = HostPlatform::Windows;
        return true;
    }
    return false;
}

// Owns a posix_spawn_file_actions_t / posix_spawnattr_t for one spawn call.
struct SpawnAttributes {
    posix_spawn_file_actions_t file_actions;
    posix_spawnattr_t attributes;

    SpawnAttributes() {
        posix_spawn_file_actions_init(&file_actions);
        posix_spawnattr_init(&attributes);
    }

    ~SpawnAttributes() {
        posix_spawn_file_actions_destroy(&file_actions);
        posix_spawnattr_destroy(&attributes);
    }

    SpawnAttributes(const SpawnAttributes &) = delete;
    SpawnAttributes &operator=(const SpawnAttributes &) = delete;
};

static int add_dev_null(posix_spawn_file_actions_t *file_actions, int target_descriptor, int open_flags) {
    return posix_spawn_file_actions_addopen(file_actions, target_descriptor, "/dev/null", open_flags, 0);
}

SpawnResult spawn_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments,
                          const SpawnOptions &options) {
    SpawnResult result;

    if (options.stderr_mode == StreamMode::Pipe && options.stdout_mode != StreamMode::Pipe) {
        result.error_message = "stderr can only be piped together with stdout";
        return result;
    }
    if (options.stdin_mode == StreamMode::Pipe) {
        result.error_message = "piping stdin is not supported";
        return result;
    }

    // Build argv array: [executable, arg1, arg2, ..., nullptr]
    std::vector<char *> argv_pointers;
    // We need mutable copies of strings for posix_spawn.
    std::vector<std::string> argv_strings;
    argv_strings.push_back(executable_path);
    for (const auto &argument : arguments) {
        argv_strings.push_back(argument);
    }

    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);

    SpawnAttributes spawn_attributes;
    int setup_status = 0;

    if (options.stdin_mode == StreamMode::DevNull) {
        setup_status |= add_dev_null(&spawn_attributes.file_actions, STDIN_FILENO, O_RDONLY);
    }
    if (options.stdout_mode == StreamMode::DevNull) {
        setup_status |= add_dev_null(&spawn_attributes.file_actions, STDOUT_FILENO, O_WRONLY);
    }
    if (options.stderr_mode == StreamMode::DevNull) {
        setup_status |= add_dev_null(&spawn_attributes.file_actions, STDERR_FILENO, O_WRONLY);
    }

    int pipe_descriptors[2] = {-1, -1};
    if (options.stdout_mode == StreamMode::Pipe) {
        if (pipe2(pipe_descriptors, O_CLOEXEC) != 0) {
            result.error_message = "pipe2 failed: " + std::string(strerror(errno));
            return result;
        }
        // dup2 clears O_CLOEXEC on the target, both pipe ends close on exec.
        setup_status |= posix_spawn_file_actions_adddup2(&spawn_attributes.file_actions,
                                                         pipe_descriptors[1], STDOUT_FILENO);
        if (options.stderr_mode == StreamMode::Pipe) {
            setup_status |= posix_spawn_file_actions_adddup2(&spawn_attributes.file_actions,
                                                             pipe_descriptors[1], STDERR_FILENO);
        }
    }

    if (!options.working_directory.empty()) {
        setup_status |= posix_spawn_file_actions_addchdir_np(&spawn_attributes.file_actions,
                                                             options.working_directory.c_str());
    }

    short spawn_flags = POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK;
    if (options.detached) {
        spawn_flags |= POSIX_SPAWN_SETPGROUP;
        setup_status |= posix_spawnattr_setpgroup(&spawn_attributes.attributes, 0);
    }
    // An ignored SIGINT survives exec; the debuggee must honour the interrupt
    // sent on disconnect even if our own shell ignores it.
    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGINT);
    sigaddset(&default_signals, SIGTERM);
    sigaddset(&default_signals, SIGPIPE);
    setup_status |= posix_spawnattr_setsigdefault(&spawn_attributes.attributes, &default_signals);
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    setup_status |= posix_spawnattr_setsigmask(&spawn_attributes.attributes, &empty_mask);
    setup_status |= posix_spawnattr_setflags(&spawn_attributes.attributes, spawn_flags);

    if (setup_status != 0) {
        close_descriptor(pipe_descriptors[0]);
        close_descriptor(pipe_descriptors[1]);
        result.error_message = "Failed to prepare posix_spawn attributes";
        return result;
    }

    pid_t child_pid = 0;
    int spawn_status = posix_spawnp(&child_pid, executable_path.c_str(),
                                    &spawn_attributes.file_actions, &spawn_attributes.attributes,
                                    argv_pointers.data(), environ);

    // The write end now belongs to the child (or nobody, on failure).
    close_descriptor(pipe_descriptors[1]);

    if (spawn_status != 0) {
        close_descriptor(pipe_descriptors[0]);
        result.success = false;
        result.error_message = "posix_spawn failed for " + executable_path + ": " + std::string(strerror(spawn_status));
        return result;
    }

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    result.stdout_descriptor = pipe_descriptors[0];
    return result;
}

RunResult run_process(const std::string &executable_path,
                      const std::vector<std::string> &arguments,
                      const std::string &working_directory) {
    RunResult result;

    SpawnOptions options;
    options.working_directory = working_directory;
    options.stdin_mode = StreamMode::DevNull;
    options.stdout_mode = StreamMode::Pipe;
    options.stderr_mode = StreamMode::Pipe;

    SpawnResult spawn_result = spawn_process(executable_path, arguments, options);
    if (!spawn_result.success) {
        result.error_message = spawn_result.error_message;
        return result;
    }
    result.spawned = true;

    // Drain until EOF: the child closes its end when it exits.
    std::string pending;
    char buffer[4096];
    for (;;) {
        ssize_t bytes_read = read(spawn_result.stdout_descriptor, buffer, sizeof(buffer));
        if (bytes_read < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (bytes_read == 0) {
            break;
        }
        pending.append(buffer, static_cast<size_t>(bytes_read));
        size_t newline_position;
        while ((newline_position = pending.find('\n')) != std::string::npos) {
            result.output_lines.push_back(pending.substr(0, newline_position));
            pending.erase(0, newline_position + 1);
        }
    }
    if (!pending.empty()) {
        result.output_lines.push_back(pending);
    }
    close_descriptor(spawn_result.stdout_descriptor);

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(static_cast<pid_t>(spawn_result.process_id), &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited < 0) {
        result.error_message = "waitpid failed: " + std::string(strerror(errno));
        return result;
    }
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.success = (result.exit_code == 0);
        if (!result.success) {
            result.error_message = executable_path + " exited with code " + std::to_string(result.exit_code);
        }
    } else if (WIFSIGNALED(status)) {
        result.error_message = executable_path + " killed by signal " + std::to_string(WTERMSIG(status));
    }
    return result;
}

bool read_line(int descriptor, int timeout_milliseconds, std::string &output_line) {
    output_line.clear();
    if (descriptor < 0) {
        return false;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            return false;
        }

        struct pollfd poll_descriptor;
        poll_descriptor.fd = descriptor;
        poll_descriptor.events = POLLIN;
        poll_descriptor.revents = 0;
        int poll_status = poll(&poll_descriptor, 1, static_cast<int>(remaining));
        if (poll_status < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        if (poll_status == 0) {
            return false;
        }

        char character;
        ssize_t bytes_read = read(descriptor, &character, 1);
        if (bytes_read < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            return false;
        }
        if (bytes_read == 0) {
            return !output_line.empty();
        }
        if (character == '\n') {
            return true;
        }
        output_line += character;
    }
}

void close_descriptor(int descriptor) {
    if (descriptor >= 0) {
        close(descriptor);
    }
}

bool read_file_contents(const std::string &file_path, std::string &output_contents) {
    std::ifstream file_stream(file_path);
    if (!file_stream.is_open()) {
        return false;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    output_contents = string_stream.str();
    return true;
}

std::string find_on_path(const std::string &executable_name) {
    const char *path_environment = std::getenv("PATH");
    if (path_environment == nullptr) {
        return "";
    }
    std::istringstream path_stream(path_environment);
    std::string directory;
    while (std::getline(path_stream, directory, ':')) {
        if (directory.empty()) {
            continue;
        }
        std::string full_path = directory + "/" + executable_name;
        if (access(full_path.c_str(), X_OK) == 0) {
            return full_path;
        }
    }
    return "";
}

bool interrupt_process(int process_id) {
    if (process_id <= 0) {
        return false;
    }
    return kill(static_cast<pid_t>(process_id), SIGINT) == 0;
}

// Parent id from /proc/<pid>/stat. The command name may contain spaces and
// parentheses, so fields are counted from the last ')'.
static bool read_parent_process_id(const std::string &stat_path, int &output_parent_id) {
    std::string contents;
    if (!read_file_contents(stat_path, contents)) {
        return false;
    }
    size_t name_end = contents.rfind(')');
    if (name_end == std::string::npos) {
        return false;
    }
    std::istringstream field_stream(contents.substr(name_end + 1));
    std::string state;
    int parent_id = -1;
    if (!(field_stream >> state >> parent_id)) {
        return false;
    }
    output_parent_id = parent_id;
    return true;
}

static std::vector<int> collect_descendants(int root_process_id) {
    std::multimap<int, int> children_by_parent;
    std::error_code error;
    for (std::filesystem::directory_iterator entry("/proc", error), end; !error && entry != end;
         entry.increment(error)) {
        const std::string name = entry->path().filename().string();
        if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos) {
            continue;
        }
        int parent_id = -1;
        if (read_parent_process_id(entry->path().string() + "/stat", parent_id)) {
            children_by_parent.emplace(parent_id, std::stoi(name));
        }
    }

    std::vector<int> descendants;
    std::vector<int> frontier = {root_process_id};
    // Breadth-first walk; the size guard stops on a corrupted (cyclic) table.
    while (!frontier.empty() && descendants.size() < children_by_parent.size()) {
        int parent_id = frontier.back();
        frontier.pop_back();
        auto range = children_by_parent.equal_range(parent_id);
        for (auto iterator = range.first; iterator != range.second; ++iterator) {
            descendants.push_back(iterator->second);
            frontier.push_back(iterator->second);
        }
    }
    return descendants;
}

bool force_kill_process_tree(int process_id) {
    if (process_id <= 0) {
        return false;
    }
    // Snapshot the tree before the root dies and its children get reparented.
    std::vector<int> descendants = collect_descendants(process_id);
    bool root_killed = (kill(static_cast<pid_t>(process_id), SIGKILL) == 0);
    for (int descendant_id : descendants) {
        kill(static_cast<pid_t>(descendant_id), SIGKILL);
    }
    return root_killed;
}

bool is_process_alive(int process_id) {
    if (process_id <= 0) {
        return false;
    }
    if (kill(static_cast<pid_t>(process_id), 0) != 0 && errno != EPERM) {
        return false;
    }
    std::string contents;
    if (!read_file_contents("/proc/" + std::to_string(process_id) + "/stat", contents)) {
        return true;
    }
    size_t name_end = contents.rfind(')');
    if (name_end != std::string::npos && name_end + 2 < contents.size()) {
        return contents[name_end + 2] != 'Z';
    }
    return true;
}

bool reap_if_exited(int process_id) {
    if (process_id <= 0) {
        return true;
    }
    int status = 0;
    pid_t waited = waitpid(static_cast<pid_t>(process_id), &status, WNOHANG);
    if (waited > 0) {
        return true;
    }
    if (waited == 0) {
        return false;
    }
    // ECHILD: not our child (e.g. reported by a spawn helper).
    return !is_process_alive(process_id);
}

} // namespace platform
