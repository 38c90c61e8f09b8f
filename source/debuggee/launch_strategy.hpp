#ifndef CDPDBG_LAUNCH_STRATEGY_HPP
#define CDPDBG_LAUNCH_STRATEGY_HPP

// How the debuggee process gets created.
// Direct: spawn the executable ourselves; its id is known immediately.
// HelperMediated: spawn a helper that starts the executable and reports the
// real debuggee id as a single JSON line on its stdout ({"pid": 1234}).

#include <memory>
#include <string>
#include <vector>

#include "debuggee/debuggee_process.hpp"
#include "platform/platform_abi.hpp"
#include "utils/session_events.hpp"

namespace launch_strategy {

static constexpr int DEFAULT_PID_MESSAGE_TIMEOUT_MILLISECONDS = 10000;

struct LaunchOutcome {
    bool success = false;
    debuggee_process::DebuggeeProcessHandle handle;
    std::string error_message;
};

class LaunchStrategy {
public:
    virtual ~LaunchStrategy() = default;

    virtual debuggee_process::StrategyKind kind() const = 0;

    virtual LaunchOutcome launch(const std::string &executable_path, const std::vector<std::string> &arguments,
                                 session_events::EventSink &events) const = 0;
};

class DirectLaunchStrategy : public LaunchStrategy {
public:
    debuggee_process::StrategyKind kind() const override { return debuggee_process::StrategyKind::Direct; }

    LaunchOutcome launch(const std::string &executable_path, const std::vector<std::string> &arguments,
                         session_events::EventSink &events) const override;
};

class HelperLaunchStrategy : public LaunchStrategy {
public:
    explicit HelperLaunchStrategy(std::string helper_path,
                                  int message_timeout_milliseconds = DEFAULT_PID_MESSAGE_TIMEOUT_MILLISECONDS);

    debuggee_process::StrategyKind kind() const override { return debuggee_process::StrategyKind::HelperMediated; }

    LaunchOutcome launch(const std::string &executable_path, const std::vector<std::string> &arguments,
                         session_events::EventSink &events) const override;

private:
    std::string helper_path;
    int message_timeout_milliseconds;
};

// Helper-mediated only when the platform needs indirect PID discovery and
// the executable was not given explicitly.
std::unique_ptr<LaunchStrategy> make_launch_strategy(const platform::PlatformCapabilities &capabilities,
                                                     bool using_explicit_executable);

// Parse a helper message {"pid": 1234} or {"pid": "1234"}. Returns false
// if the line is not such a message or the id is not a positive integer.
bool parse_pid_message(const std::string &line, int &output_process_id);

} // namespace launch_strategy

#endif // CDPDBG_LAUNCH_STRATEGY_HPP
