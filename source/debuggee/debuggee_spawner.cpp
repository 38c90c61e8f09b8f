#include "debuggee/debuggee_spawner.hpp"
#include "debuggee/launch_strategy.hpp"

#include <nlohmann/json.hpp>
#include <cstdio>
#include <filesystem>
#include <random>

namespace debuggee_spawner {

using json = nlohmann::json;

int select_port(std::optional<int> requested_port) {
    if (requested_port) {
        return *requested_port;
    }
    static std::mt19937 generator{std::random_device{}()};
    std::uniform_int_distribution<int> distribution(MINIMUM_RANDOM_PORT, MAXIMUM_RANDOM_PORT - 1);
    return distribution(generator);
}

// Characters encodeURI leaves alone.
static bool is_uri_safe(unsigned char character) {
    if ((character >= 'A' && character <= 'Z') || (character >= 'a' && character <= 'z') ||
        (character >= '0' && character <= '9')) {
        return true;
    }
    static const std::string SAFE_PUNCTUATION = "-_.!~*'();/?:@&=+$,#";
    return SAFE_PUNCTUATION.find(static_cast<char>(character)) != std::string::npos;
}

std::string path_to_file_url(const std::string &absolute_path) {
    std::string encoded;
    for (unsigned char character : absolute_path) {
        if (is_uri_safe(character)) {
            encoded += static_cast<char>(character);
        } else {
            char escape[4];
            std::snprintf(escape, sizeof(escape), "%%%02X", character);
            encoded += escape;
        }
    }
    if (encoded.empty() || encoded[0] != '/') {
        encoded = "/" + encoded;
    }
    return "file://" + encoded;
}

std::string resolve_against(const std::string &working_directory, const std::string &file) {
    std::filesystem::path resolved = std::filesystem::path(working_directory) / file;
    std::string normalized = resolved.lexically_normal().generic_string();
    // lexically_normal keeps a trailing separator ("/proj/app/"); drop it.
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

std::string join_under(const std::string &working_directory, const std::string &file) {
    std::string::size_type first_kept = file.find_first_not_of('/');
    if (first_kept == std::string::npos) {
        return resolve_against(working_directory, ".");
    }
    return resolve_against(working_directory, file.substr(first_kept));
}

std::string build_launch_url(const std::string &working_directory, const std::string &file,
                             const std::string &url) {
    if (!file.empty()) {
        return path_to_file_url(resolve_against(join_under(working_directory, file), "index.html"));
    }
    return url;
}

DebuggeeCommandLine build_debuggee_command_line(const launch_config::LaunchConfig &config) {
    DebuggeeCommandLine command_line;
    command_line.executable_path = config.executable_path;
    command_line.arguments.push_back(REMOTE_DEBUGGING_PORT_FLAG + std::to_string(config.port));
    command_line.arguments.insert(command_line.arguments.end(), config.runtime_arguments.begin(),
                                  config.runtime_arguments.end());

    if (!config.file.empty()) {
        command_line.arguments.push_back(resolve_against(config.working_directory, config.file));
    }

    command_line.launch_url = build_launch_url(config.working_directory, config.file, config.url);
    if (!command_line.launch_url.empty()) {
        command_line.arguments.push_back(command_line.launch_url);
    }
    return command_line;
}

SpawnOutcome spawn(const std::string &executable_path, const std::vector<std::string> &arguments,
                   bool using_explicit_executable, const platform::PlatformCapabilities &capabilities,
                   session_events::EventSink &events) {
    SpawnOutcome outcome;

    std::unique_ptr<launch_strategy::LaunchStrategy> strategy =
        launch_strategy::make_launch_strategy(capabilities, using_explicit_executable);

    events.info("spawn.command", "spawn('" + executable_path + "', " + json(arguments).dump() + ")",
                {{"executable", executable_path},
                 {"arguments", arguments},
                 {"strategy", debuggee_process::strategy_name(strategy->kind())},
                 {"platform", platform::platform_name(capabilities.platform)}});

    launch_strategy::LaunchOutcome launch_outcome = strategy->launch(executable_path, arguments, events);
    if (!launch_outcome.success) {
        outcome.error_message = launch_outcome.error_message;
        events.error("spawn.failed", "Failed to spawn debuggee: " + launch_outcome.error_message);
        return outcome;
    }

    outcome.success = true;
    outcome.handle = launch_outcome.handle;
    return outcome;
}

} // namespace debuggee_spawner
