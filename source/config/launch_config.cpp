#include "config/launch_config.hpp"
#include "debuggee/browser_locate.hpp"
#include "debuggee/debuggee_spawner.hpp"

#include <climits>

namespace launch_config {

// Field readers: a present field of the wrong type is an error, a missing
// one leaves the output untouched.

static bool read_string(const json &arguments, const char *key, std::string &output, std::string &error_message) {
    if (!arguments.contains(key) || arguments[key].is_null()) {
        return true;
    }
    if (!arguments[key].is_string()) {
        error_message = std::string("'") + key + "' must be a string";
        return false;
    }
    output = arguments[key].get<std::string>();
    return true;
}

static bool read_boolean(const json &arguments, const char *key, bool &output, std::string &error_message) {
    if (!arguments.contains(key) || arguments[key].is_null()) {
        return true;
    }
    if (!arguments[key].is_boolean()) {
        error_message = std::string("'") + key + "' must be a boolean";
        return false;
    }
    output = arguments[key].get<bool>();
    return true;
}

static bool read_integer(const json &arguments, const char *key, std::optional<int> &output,
                         std::string &error_message) {
    if (!arguments.contains(key) || arguments[key].is_null()) {
        return true;
    }
    if (!arguments[key].is_number_integer()) {
        error_message = std::string("'") + key + "' must be an integer";
        return false;
    }
    // Range-check before narrowing so out-of-range values cannot wrap.
    const json &value = arguments[key];
    if (value.is_number_unsigned() && value.get<unsigned long long>() > static_cast<unsigned long long>(INT_MAX)) {
        error_message = std::string("'") + key + "' is out of range";
        return false;
    }
    long long wide_value = value.get<long long>();
    if (wide_value < INT_MIN || wide_value > INT_MAX) {
        error_message = std::string("'") + key + "' is out of range";
        return false;
    }
    output = static_cast<int>(wide_value);
    return true;
}

static bool read_port(const json &arguments, std::optional<int> &output, std::string &error_message) {
    if (!read_integer(arguments, "port", output, error_message)) {
        return false;
    }
    if (output && (*output <= 0 || *output > 65535)) {
        error_message = "'port' must be in 1..65535, got " + std::to_string(*output);
        return false;
    }
    return true;
}

static bool read_timeout(const json &arguments, int &output, std::string &error_message) {
    std::optional<int> timeout;
    if (!read_integer(arguments, "timeout", timeout, error_message)) {
        return false;
    }
    if (timeout) {
        if (*timeout <= 0) {
            error_message = "'timeout' must be positive";
            return false;
        }
        output = *timeout;
    }
    return true;
}

static bool read_path_overrides(const json &arguments,
                                std::optional<path_overrides::PathOverrideTable> &output,
                                std::string &error_message) {
    if (!arguments.contains("sourceMapPathOverrides") || arguments["sourceMapPathOverrides"].is_null()) {
        return true;
    }
    const json &table_json = arguments["sourceMapPathOverrides"];
    if (!table_json.is_object()) {
        error_message = "'sourceMapPathOverrides' must be an object";
        return false;
    }
    path_overrides::PathOverrideTable table;
    for (auto iterator = table_json.begin(); iterator != table_json.end(); ++iterator) {
        if (!iterator.value().is_string()) {
            error_message = "sourceMapPathOverrides entry '" + iterator.key() + "' must map to a string";
            return false;
        }
        table[iterator.key()] = iterator.value().get<std::string>();
    }
    output = table;
    return true;
}

static bool read_string_array(const json &arguments, const char *key, std::vector<std::string> &output,
                              std::string &error_message) {
    if (!arguments.contains(key) || arguments[key].is_null()) {
        return true;
    }
    if (!arguments[key].is_array()) {
        error_message = std::string("'") + key + "' must be an array of strings";
        return false;
    }
    for (const auto &element : arguments[key]) {
        if (!element.is_string()) {
            error_message = std::string("'") + key + "' must be an array of strings";
            return false;
        }
        output.push_back(element.get<std::string>());
    }
    return true;
}

LaunchConfigResult parse_launch_request(const json &arguments) {
    LaunchConfigResult result;
    LaunchConfig &config = result.config;
    std::string &error = result.error_message;

    if (!arguments.is_object()) {
        error = "launch arguments must be an object";
        return result;
    }

    if (!read_string(arguments, "cwd", config.working_directory, error)) {
        return result;
    }
    if (config.working_directory.empty()) {
        error = "'cwd' is required";
        return result;
    }

    if (!read_string(arguments, "runtimeExecutable", config.executable_path, error) ||
        !read_string(arguments, "file", config.file, error) ||
        !read_string(arguments, "url", config.url, error) ||
        !read_string(arguments, "address", config.address, error) ||
        !read_string(arguments, "webRoot", config.web_root, error) ||
        !read_string(arguments, "kha", config.build.kha_path, error) ||
        !read_string(arguments, "ffmpeg", config.build.ffmpeg_path, error) ||
        !read_boolean(arguments, "disableNetworkCache", config.disable_network_cache, error) ||
        !read_boolean(arguments, "noDebug", config.no_debug, error) ||
        !read_timeout(arguments, config.timeout_milliseconds, error) ||
        !read_path_overrides(arguments, config.user_path_overrides, error) ||
        !read_string_array(arguments, "runtimeArgs", config.runtime_arguments, error)) {
        return result;
    }

    std::optional<int> requested_port;
    if (!read_port(arguments, requested_port, error)) {
        return result;
    }
    config.port = debuggee_spawner::select_port(requested_port);
    config.port_was_explicit = requested_port.has_value();

    if (config.web_root.empty()) {
        config.web_root = config.working_directory;
    }
    if (config.address.empty()) {
        config.address = DEFAULT_ADDRESS;
    }

    platform::HostPlatform target_platform = platform::current_platform();
    std::string platform_name;
    if (!read_string(arguments, "platform", platform_name, error)) {
        return result;
    }
    if (!platform_name.empty() && !platform::parse_platform_name(platform_name, target_platform)) {
        error = "unknown platform '" + platform_name + "'";
        return result;
    }
    config.capabilities = platform::capabilities_for(target_platform);
    if (!read_string(arguments, "spawnHelper", config.capabilities.spawn_helper_path, error)) {
        return result;
    }

    config.using_explicit_executable = !config.executable_path.empty();
    if (!config.using_explicit_executable) {
        config.executable_path = browser_locate::find_browser_executable();
        if (config.executable_path.empty()) {
            error = "Could not find a browser executable on this system. "
                    "Install google-chrome or chromium, or set 'runtimeExecutable'.";
            return result;
        }
    }

    result.success = true;
    return result;
}

AttachConfigResult parse_attach_request(const json &arguments) {
    AttachConfigResult result;
    AttachConfig &config = result.config;
    std::string &error = result.error_message;

    if (!arguments.is_object()) {
        error = "attach arguments must be an object";
        return result;
    }

    std::optional<int> port;
    if (!read_port(arguments, port, error)) {
        return result;
    }
    if (!port) {
        error = "'port' is required to attach";
        return result;
    }
    config.port = *port;

    if (!read_string(arguments, "address", config.address, error) ||
        !read_string(arguments, "url", config.url, error) ||
        !read_string(arguments, "webRoot", config.web_root, error) ||
        !read_boolean(arguments, "disableNetworkCache", config.disable_network_cache, error) ||
        !read_timeout(arguments, config.timeout_milliseconds, error) ||
        !read_path_overrides(arguments, config.user_path_overrides, error)) {
        return result;
    }
    if (config.address.empty()) {
        config.address = DEFAULT_ADDRESS;
    }

    result.success = true;
    return result;
}

} // namespace launch_config
