#ifndef CDPDBG_SESSION_MANAGER_HPP
#define CDPDBG_SESSION_MANAGER_HPP

// Session lifecycle: build, spawn, attach, pause/resume overlay hints and
// ordered teardown of one debuggee.
//
// States: Idle -> Launching -> Attached -> Terminating -> Terminated.
// A failed build, spawn or attach moves Launching -> Error; disconnect()
// then finishes in Terminated.
//
// Everything runs on the host loop thread. The session owns the debuggee
// handle exclusively; teardown detaches the protocol before the process is
// killed, and never kills a handle twice.

#include <functional>
#include <optional>
#include <string>

#include "config/launch_config.hpp"
#include "config/path_overrides.hpp"
#include "debuggee/debuggee_process.hpp"
#include "session/build_collaborator.hpp"
#include "session/protocol_engine.hpp"
#include "session/session_errors.hpp"
#include "utils/debounce_helper.hpp"
#include "utils/event_loop.hpp"
#include "utils/session_events.hpp"

namespace session_manager {

enum class SessionState {
    Idle,
    Launching,
    Attached,
    Error,
    Terminating,
    Terminated
};

const char *state_name(SessionState state);

static const char DEFAULT_PAUSE_OVERLAY_MESSAGE[] = "Paused in debugger";
static const char USER_AGENT_EXPRESSION[] = "navigator.userAgent";

// Called once when the session ends on its own (spawn failure, debuggee
// exit, target closed). Not called for a host-requested disconnect().
using TerminationCallback = std::function<void(const std::string &reason)>;

class SessionManager {
public:
    SessionManager(protocol_engine::ProtocolEngine &engine, build_collaborator::BuildCollaborator &builder,
                   event_loop::TimerScheduler &scheduler, session_events::EventSink &events,
                   TerminationCallback on_terminated);
    ~SessionManager();

    SessionManager(const SessionManager &) = delete;
    SessionManager &operator=(const SessionManager &) = delete;

    // Build, spawn and (unless no_debug) attach.
    session_errors::OperationResult launch(const launch_config::LaunchConfig &config);

    // Attach to a debuggee someone else started. No process is owned.
    session_errors::OperationResult attach(const launch_config::AttachConfig &config);

    // Protocol attach plus the post-attach side effects (cache disabling,
    // user agent probe). Neither side effect can fail the attach.
    session_errors::OperationResult attach_to_port(int port, const std::string &target_url,
                                                   const std::string &address, int timeout_milliseconds,
                                                   bool disable_network_cache);

    void on_paused();
    void on_resumed();

    // The target or the browser went away without us asking.
    void on_target_closed(const std::string &reason);

    // Check whether the debuggee exited. Returns true if it did just now.
    bool poll_debuggee();

    // Detach, then kill the debuggee. Idempotent and never throws.
    void disconnect();

    // Reload the page bypassing the cache.
    session_errors::OperationResult restart();

    SessionState state() const { return current_state; }
    const std::optional<debuggee_process::DebuggeeProcessHandle> &debuggee() const { return debuggee_handle; }
    const path_overrides::PathOverrideTable &path_overrides() const { return resolved_path_overrides; }
    bool self_terminated() const { return session_self_terminated; }

    void set_pause_overlay_message(const std::string &message) { pause_overlay_message = message; }

private:
    void set_state(SessionState state);
    void terminate_session(const std::string &reason);
    void terminate_debuggee();
    void show_pause_overlay();
    void clear_pause_overlay();
    void disable_cache();
    void probe_user_agent();

    protocol_engine::ProtocolEngine &engine;
    build_collaborator::BuildCollaborator &builder;
    session_events::EventSink &events;
    TerminationCallback on_terminated;
    debounce_helper::DebounceHelper overlay_debouncer;

    SessionState current_state = SessionState::Idle;
    std::optional<debuggee_process::DebuggeeProcessHandle> debuggee_handle;
    path_overrides::PathOverrideTable resolved_path_overrides;
    std::string pause_overlay_message = DEFAULT_PAUSE_OVERLAY_MESSAGE;
    bool session_self_terminated = false;
    bool termination_reported = false;
    bool disconnect_started = false;
};

} // namespace session_manager

#endif // CDPDBG_SESSION_MANAGER_HPP
