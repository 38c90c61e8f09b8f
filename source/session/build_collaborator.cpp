#include "session/build_collaborator.hpp"
#include "debuggee/debuggee_spawner.hpp"
#include "platform/platform_abi.hpp"

#include <vector>

namespace build_collaborator {

BuildOptions build_options_for(const launch_config::LaunchConfig &config) {
    BuildOptions options;
    options.from = config.working_directory;
    options.to = debuggee_spawner::resolve_against(config.working_directory, "build");
    options.kha_path = config.build.kha_path;
    options.ffmpeg_path = config.build.ffmpeg_path;
    return options;
}

KhamakeBuildCollaborator::KhamakeBuildCollaborator(session_events::EventSink &events) : events(events) {}

BuildResult KhamakeBuildCollaborator::build(const BuildOptions &options) {
    BuildResult result;

    if (options.kha_path.empty()) {
        events.debug("build.skipped", "No kha path configured, skipping build");
        result.success = true;
        return result;
    }

    events.info("build.started", "Using Kha from " + options.kha_path);

    std::string node_path = platform::find_on_path("node");
    if (node_path.empty()) {
        result.error_detail = "node was not found on PATH";
        events.error("build.failed", result.error_detail);
        return result;
    }

    std::vector<std::string> arguments = {
        debuggee_spawner::resolve_against(options.kha_path, "make.js"),
        options.target,
        "--from", options.from,
        "--to", options.to,
        "--projectfile", options.project_file,
    };
    if (!options.ffmpeg_path.empty()) {
        arguments.push_back("--ffmpeg");
        arguments.push_back(options.ffmpeg_path);
    }

    platform::RunResult run_result = platform::run_process(node_path, arguments, options.from);
    for (const auto &line : run_result.output_lines) {
        events.info("build.output", line);
    }

    if (!run_result.success) {
        result.error_detail = run_result.error_message;
        events.error("build.failed", result.error_detail);
        return result;
    }

    result.success = true;
    return result;
}

} // namespace build_collaborator
