#include "debuggee/launch_strategy.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

namespace debuggee_process {

const char *strategy_name(StrategyKind kind) {
    switch (kind) {
    case StrategyKind::Direct:
        return "direct";
    case StrategyKind::HelperMediated:
        return "helper";
    }
    return "direct";
}

} // namespace debuggee_process

namespace launch_strategy {

using json = nlohmann::json;

// The browser is started from its own directory, like a desktop launcher would.
static std::string executable_directory(const std::string &executable_path) {
    size_t slash_position = executable_path.find_last_of('/');
    if (slash_position == std::string::npos) {
        return "";
    }
    if (slash_position == 0) {
        return "/";
    }
    return executable_path.substr(0, slash_position);
}

LaunchOutcome DirectLaunchStrategy::launch(const std::string &executable_path,
                                           const std::vector<std::string> &arguments,
                                           session_events::EventSink &events) const {
    LaunchOutcome outcome;

    platform::SpawnOptions options;
    options.working_directory = executable_directory(executable_path);
    options.detached = true;
    options.stdin_mode = platform::StreamMode::DevNull;

    platform::SpawnResult spawn_result = platform::spawn_process(executable_path, arguments, options);
    if (!spawn_result.success) {
        outcome.error_message = spawn_result.error_message;
        return outcome;
    }

    outcome.success = true;
    outcome.handle.process_id = spawn_result.process_id;
    outcome.handle.debuggee_process_id = spawn_result.process_id;
    outcome.handle.debuggee_id_known = true;
    outcome.handle.strategy = debuggee_process::StrategyKind::Direct;
    events.debug("spawn.started", "Debuggee spawned directly", {{"pid", spawn_result.process_id}});
    return outcome;
}

HelperLaunchStrategy::HelperLaunchStrategy(std::string helper_path, int message_timeout_milliseconds)
    : helper_path(std::move(helper_path)), message_timeout_milliseconds(message_timeout_milliseconds) {}

LaunchOutcome HelperLaunchStrategy::launch(const std::string &executable_path,
                                           const std::vector<std::string> &arguments,
                                           session_events::EventSink &events) const {
    LaunchOutcome outcome;

    if (helper_path.empty()) {
        outcome.error_message = "This platform reports the debuggee id through a spawn helper, "
                                "but no 'spawnHelper' is configured.";
        return outcome;
    }

    std::vector<std::string> helper_arguments;
    helper_arguments.push_back(executable_path);
    helper_arguments.insert(helper_arguments.end(), arguments.begin(), arguments.end());

    // Only the helper's stdout is kept: it carries the pid message.
    platform::SpawnOptions options;
    options.detached = true;
    options.stdin_mode = platform::StreamMode::DevNull;
    options.stdout_mode = platform::StreamMode::Pipe;
    options.stderr_mode = platform::StreamMode::DevNull;

    platform::SpawnResult spawn_result = platform::spawn_process(helper_path, helper_arguments, options);
    if (!spawn_result.success) {
        outcome.error_message = spawn_result.error_message;
        return outcome;
    }

    outcome.success = true;
    outcome.handle.process_id = spawn_result.process_id;
    outcome.handle.strategy = debuggee_process::StrategyKind::HelperMediated;

    std::string message_line;
    bool message_received = platform::read_line(spawn_result.stdout_descriptor, message_timeout_milliseconds,
                                                message_line);
    platform::close_descriptor(spawn_result.stdout_descriptor);

    int debuggee_process_id = -1;
    if (!message_received) {
        events.warning("spawn.pid_missing", "Spawn helper did not report the debuggee pid",
                       {{"helper_pid", spawn_result.process_id}});
    } else if (!parse_pid_message(message_line, debuggee_process_id)) {
        events.warning("spawn.pid_malformed", "Spawn helper sent an unreadable pid message",
                       {{"helper_pid", spawn_result.process_id}, {"message", message_line}});
    } else {
        outcome.handle.debuggee_process_id = debuggee_process_id;
        outcome.handle.debuggee_id_known = true;
        events.info("spawn.pid_discovered", "Got debuggee pid from spawn helper: " + std::to_string(debuggee_process_id),
                    {{"pid", debuggee_process_id}, {"helper_pid", spawn_result.process_id}});
    }
    return outcome;
}

std::unique_ptr<LaunchStrategy> make_launch_strategy(const platform::PlatformCapabilities &capabilities,
                                                     bool using_explicit_executable) {
    if (capabilities.indirect_pid_discovery && !using_explicit_executable) {
        return std::make_unique<HelperLaunchStrategy>(capabilities.spawn_helper_path);
    }
    return std::make_unique<DirectLaunchStrategy>();
}

bool parse_pid_message(const std::string &line, int &output_process_id) {
    json message = json::parse(line, nullptr, /*allow_exceptions=*/false);
    if (message.is_discarded() || !message.is_object() || !message.contains("pid")) {
        return false;
    }

    const json &pid_value = message["pid"];
    long long process_id = -1;
    if (pid_value.is_number_integer()) {
        process_id = pid_value.get<long long>();
    } else if (pid_value.is_string()) {
        const std::string pid_text = pid_value.get<std::string>();
        size_t parsed_length = 0;
        try {
            process_id = std::stoll(pid_text, &parsed_length);
        } catch (const std::invalid_argument &) {
            return false;
        } catch (const std::out_of_range &) {
            return false;
        }
        if (parsed_length != pid_text.size()) {
            return false;
        }
    } else {
        return false;
    }

    if (process_id <= 0 || process_id > 0x7fffffff) {
        return false;
    }
    output_process_id = static_cast<int>(process_id);
    return true;
}

} // namespace launch_strategy
