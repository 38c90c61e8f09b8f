#include "session/session_manager.hpp"
#include "debuggee/debuggee_spawner.hpp"
#include "platform/platform_abi.hpp"

#include <nlohmann/json.hpp>

namespace session_manager {

using json = nlohmann::json;
using session_errors::ErrorKind;
using session_errors::OperationResult;

const char *state_name(SessionState state) {
    switch (state) {
    case SessionState::Idle:
        return "idle";
    case SessionState::Launching:
        return "launching";
    case SessionState::Attached:
        return "attached";
    case SessionState::Error:
        return "error";
    case SessionState::Terminating:
        return "terminating";
    case SessionState::Terminated:
        return "terminated";
    }
    return "idle";
}

static OperationResult failure(ErrorKind kind, const std::string &message, const std::string &detail = "") {
    OperationResult result;
    result.success = false;
    result.error_kind = kind;
    result.message = message;
    result.error_detail = detail;
    return result;
}

static OperationResult success(const std::string &message) {
    OperationResult result;
    result.success = true;
    result.message = message;
    return result;
}

SessionManager::SessionManager(protocol_engine::ProtocolEngine &engine,
                               build_collaborator::BuildCollaborator &builder,
                               event_loop::TimerScheduler &scheduler, session_events::EventSink &events,
                               TerminationCallback on_terminated)
    : engine(engine),
      builder(builder),
      events(events),
      on_terminated(std::move(on_terminated)),
      overlay_debouncer(scheduler, events) {
    protocol_engine::EngineEventHandlers handlers;
    handlers.on_paused = [this]() { on_paused(); };
    handlers.on_resumed = [this]() { on_resumed(); };
    handlers.on_target_closed = [this](const std::string &reason) { on_target_closed(reason); };
    engine.set_event_handlers(handlers);
}

SessionManager::~SessionManager() {
    engine.set_event_handlers(protocol_engine::EngineEventHandlers());
}

void SessionManager::set_state(SessionState state) {
    if (state == current_state) {
        return;
    }
    events.debug("session.state", std::string(state_name(current_state)) + " -> " + state_name(state));
    current_state = state;
}

OperationResult SessionManager::launch(const launch_config::LaunchConfig &config) {
    if (current_state != SessionState::Idle) {
        return failure(ErrorKind::InvalidConfig, "Session already started.",
                       std::string("state is ") + state_name(current_state));
    }
    set_state(SessionState::Launching);

    resolved_path_overrides = path_overrides::get_path_overrides(
        config.web_root, config.user_path_overrides ? &*config.user_path_overrides : nullptr, events);

    build_collaborator::BuildResult build_result = builder.build(build_collaborator::build_options_for(config));
    if (!build_result.success) {
        events.error("launch.canceled", "Launch canceled.", {{"detail", build_result.error_detail}});
        set_state(SessionState::Error);
        OperationResult result = failure(ErrorKind::BuildFailure, session_errors::BUILD_FAILED_MESSAGE,
                                         build_result.error_detail);
        result.error_id = session_errors::BUILD_FAILED_ERROR_ID;
        return result;
    }

    debuggee_spawner::DebuggeeCommandLine command_line = debuggee_spawner::build_debuggee_command_line(config);
    debuggee_spawner::SpawnOutcome spawn_outcome =
        debuggee_spawner::spawn(command_line.executable_path, command_line.arguments,
                                config.using_explicit_executable, config.capabilities, events);
    if (!spawn_outcome.success) {
        std::string reason = "Debuggee process error: " + spawn_outcome.error_message;
        set_state(SessionState::Error);
        terminate_session(reason);
        return failure(ErrorKind::SpawnError, reason, spawn_outcome.error_message);
    }
    debuggee_handle = spawn_outcome.handle;

    if (config.no_debug) {
        set_state(SessionState::Attached);
        return success("Debuggee launched without debugging.");
    }

    return attach_to_port(config.port, command_line.launch_url, config.address, config.timeout_milliseconds,
                          config.disable_network_cache);
}

OperationResult SessionManager::attach(const launch_config::AttachConfig &config) {
    if (current_state != SessionState::Idle) {
        return failure(ErrorKind::InvalidConfig, "Session already started.",
                       std::string("state is ") + state_name(current_state));
    }
    set_state(SessionState::Launching);

    resolved_path_overrides = path_overrides::get_path_overrides(
        config.web_root, config.user_path_overrides ? &*config.user_path_overrides : nullptr, events);

    return attach_to_port(config.port, config.url, config.address, config.timeout_milliseconds,
                          config.disable_network_cache);
}

OperationResult SessionManager::attach_to_port(int port, const std::string &target_url, const std::string &address,
                                               int timeout_milliseconds, bool disable_network_cache) {
    protocol_engine::AttachRequest request;
    request.port = port;
    request.address = address;
    request.target_url = target_url;
    request.timeout_milliseconds = timeout_milliseconds;

    events.info("attach.started", "Attaching to " + address + ":" + std::to_string(port),
                {{"port", port}, {"address", address}, {"url", target_url}});
    protocol_engine::CommandResult attach_result = engine.attach(request);
    if (!attach_result.success) {
        set_state(SessionState::Error);
        events.error("attach.failed", "Could not attach to the debuggee: " + attach_result.error_detail);
        return failure(ErrorKind::AttachFailure, "Could not attach to the debuggee.", attach_result.error_detail);
    }
    set_state(SessionState::Attached);

    if (disable_network_cache) {
        disable_cache();
    }
    probe_user_agent();
    return success("Attached to debuggee on port " + std::to_string(port) + ".");
}

void SessionManager::disable_cache() {
    protocol_engine::CommandResult enable_result = engine.enable_domain("Network");
    if (!enable_result.success) {
        events.warning("attach.cache_not_disabled", "Network.enable failed: " + enable_result.error_detail);
        return;
    }
    protocol_engine::CommandResult cache_result =
        engine.send_command("Network.setCacheDisabled", {{"cacheDisabled", true}});
    if (!cache_result.success) {
        events.warning("attach.cache_not_disabled", "Network.setCacheDisabled failed: " + cache_result.error_detail);
    }
}

void SessionManager::probe_user_agent() {
    protocol_engine::CommandResult evaluate_result = engine.evaluate(USER_AGENT_EXPRESSION);
    if (!evaluate_result.success) {
        events.warning("attach.diagnostic_failed", "Getting userAgent failed: " + evaluate_result.error_detail,
                       {{"kind", session_errors::error_kind_name(ErrorKind::AttachDiagnosticFailure)}});
        return;
    }
    const json &remote_object = evaluate_result.value;
    if (remote_object.contains("value") && remote_object["value"].is_string()) {
        events.info("attach.user_agent", "Target userAgent: " + remote_object["value"].get<std::string>());
    } else {
        events.warning("attach.diagnostic_failed", "Getting userAgent failed: unexpected result " + remote_object.dump(),
                       {{"kind", session_errors::error_kind_name(ErrorKind::AttachDiagnosticFailure)}});
    }
}

void SessionManager::show_pause_overlay() {
    protocol_engine::CommandResult result =
        engine.send_command("Overlay.setPausedInDebuggerMessage", {{"message", pause_overlay_message}});
    if (!result.success) {
        events.debug("overlay.failed", "Could not show pause overlay: " + result.error_detail);
    }
}

void SessionManager::clear_pause_overlay() {
    protocol_engine::CommandResult result = engine.send_command("Overlay.setPausedInDebuggerMessage", json::object());
    if (!result.success) {
        events.debug("overlay.failed", "Could not clear pause overlay: " + result.error_detail);
    }
}

void SessionManager::on_paused() {
    if (current_state != SessionState::Attached) {
        return;
    }
    events.debug("session.paused", "Debuggee paused");
    overlay_debouncer.run_immediately_and_cancel_pending([this]() { show_pause_overlay(); });
}

void SessionManager::on_resumed() {
    if (current_state != SessionState::Attached) {
        return;
    }
    events.debug("session.resumed", "Debuggee resumed");
    overlay_debouncer.schedule_or_replace([this]() { clear_pause_overlay(); });
}

void SessionManager::on_target_closed(const std::string &reason) {
    if (current_state == SessionState::Terminating || current_state == SessionState::Terminated) {
        return;
    }
    session_self_terminated = true;
    terminate_session(reason);
}

bool SessionManager::poll_debuggee() {
    if (!debuggee_handle || debuggee_handle->terminated || disconnect_started) {
        return false;
    }

    bool exited = false;
    if (debuggee_handle->strategy == debuggee_process::StrategyKind::HelperMediated) {
        // The helper is our child; reap it whenever it is done.
        bool helper_exited = platform::reap_if_exited(debuggee_handle->process_id);
        exited = debuggee_handle->debuggee_id_known
                     ? platform::reap_if_exited(debuggee_handle->debuggee_process_id)
                     : helper_exited;
    } else {
        exited = platform::reap_if_exited(debuggee_handle->process_id);
    }
    if (!exited) {
        return false;
    }

    debuggee_handle->terminated = true;
    session_self_terminated = true;
    events.info("session.debuggee_exited", "Debuggee process exited",
                {{"pid", debuggee_handle->debuggee_process_id}});
    terminate_session("Debuggee process exited.");
    return true;
}

void SessionManager::terminate_session(const std::string &reason) {
    overlay_debouncer.cancel_pending();
    set_state(SessionState::Terminated);
    if (termination_reported) {
        return;
    }
    termination_reported = true;
    events.info("session.terminated", reason);
    if (on_terminated) {
        on_terminated(reason);
    }
}

void SessionManager::disconnect() {
    if (disconnect_started) {
        events.debug("session.disconnect_ignored", "disconnect() already ran");
        return;
    }
    disconnect_started = true;
    overlay_debouncer.cancel_pending();

    if (!session_self_terminated && current_state != SessionState::Terminated) {
        set_state(SessionState::Terminating);
    }

    // Detach first: a kill aimed at a debuggee still paused under the
    // debugger can be silently dropped.
    if (engine.is_attached()) {
        protocol_engine::CommandResult detach_result = engine.detach();
        if (!detach_result.success) {
            events.warning("teardown.detach_failed", "Protocol detach failed: " + detach_result.error_detail,
                           {{"kind", session_errors::error_kind_name(ErrorKind::TeardownError)}});
        }
    }

    if (debuggee_handle && !debuggee_handle->terminated) {
        if (session_self_terminated) {
            events.debug("teardown.skip_kill", "Session ended on its own; not killing the debuggee");
        } else {
            terminate_debuggee();
        }
    }
    debuggee_handle.reset();
    set_state(SessionState::Terminated);
}

void SessionManager::terminate_debuggee() {
    debuggee_process::DebuggeeProcessHandle &handle = *debuggee_handle;
    handle.terminated = true;

    if (handle.strategy == debuggee_process::StrategyKind::HelperMediated) {
        if (!handle.debuggee_id_known) {
            events.warning("teardown.pid_unknown", "Debuggee pid was never reported; cannot kill it",
                           {{"kind", session_errors::error_kind_name(ErrorKind::TeardownError)}});
            return;
        }
        // Synchronous: our own process may be torn down right after this returns.
        events.debug("teardown.kill_tree", "Killing debuggee process tree",
                     {{"pid", handle.debuggee_process_id}});
        if (!platform::force_kill_process_tree(handle.debuggee_process_id)) {
            events.warning("teardown.kill_failed", "Killing debuggee process tree failed",
                           {{"pid", handle.debuggee_process_id},
                            {"kind", session_errors::error_kind_name(ErrorKind::TeardownError)}});
        }
        return;
    }

    events.debug("teardown.interrupt", "Sending SIGINT to debuggee", {{"pid", handle.process_id}});
    if (!platform::interrupt_process(handle.process_id)) {
        events.warning("teardown.kill_failed", "Interrupting debuggee failed",
                       {{"pid", handle.process_id},
                        {"kind", session_errors::error_kind_name(ErrorKind::TeardownError)}});
    }
}

OperationResult SessionManager::restart() {
    if (current_state != SessionState::Attached || !engine.is_attached()) {
        return failure(ErrorKind::CommandFailure, "Failed to restart.", "No attached debuggee.");
    }
    protocol_engine::CommandResult reload_result = engine.send_command("Page.reload", {{"ignoreCache", true}});
    if (!reload_result.success) {
        return failure(ErrorKind::CommandFailure, "Failed to restart.", reload_result.error_detail);
    }
    return success("Page reloaded.");
}

} // namespace session_manager
