#ifndef CDPDBG_BUILD_COLLABORATOR_HPP
#define CDPDBG_BUILD_COLLABORATOR_HPP

// Build step run before the debuggee is spawned.

#include <string>

#include "config/launch_config.hpp"
#include "utils/session_events.hpp"

namespace build_collaborator {

struct BuildOptions {
    std::string from;                       // project directory
    std::string to;                         // output directory
    std::string project_file = "khafile.js";
    std::string target = "debug-html5";
    std::string kha_path;
    std::string ffmpeg_path;
};

struct BuildResult {
    bool success = false;
    std::string error_detail;
};

// <cwd> -> <cwd>/build with the settings of the launch request.
BuildOptions build_options_for(const launch_config::LaunchConfig &config);

class BuildCollaborator {
public:
    virtual ~BuildCollaborator() = default;
    virtual BuildResult build(const BuildOptions &options) = 0;
};

// Runs "node <kha>/make.js <target> --from <from> --to <to>" and forwards
// every output line to the event sink. Without a kha path there is nothing
// to build and the step succeeds.
class KhamakeBuildCollaborator : public BuildCollaborator {
public:
    explicit KhamakeBuildCollaborator(session_events::EventSink &events);

    BuildResult build(const BuildOptions &options) override;

private:
    session_events::EventSink &events;
};

} // namespace build_collaborator

#endif // CDPDBG_BUILD_COLLABORATOR_HPP
