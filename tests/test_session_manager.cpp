// Tests for the session lifecycle: launch, attach side effects, overlay
// debouncing, self-termination and ordered teardown. The protocol engine
// and build step are fakes; debuggees are real short shell scripts.

#include "config/launch_config.hpp"
#include "session/session_errors.hpp"
#include "session/session_manager.hpp"
#include "utils/event_loop.hpp"
#include "utils/session_events.hpp"
#include "fake_collaborators.hpp"
#include "test_support.hpp"

#include <signal.h>
#include <sys/wait.h>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace test_session_manager {

using session_manager::SessionState;

struct SessionHarness {
    session_events::RecordingEventSink events;
    event_loop::EventLoop loop;
    fake_collaborators::FakeProtocolEngine engine;
    fake_collaborators::FakeBuildCollaborator builder;
    std::vector<std::string> terminations;
    session_manager::SessionManager session{engine, builder, loop, events,
                                            [this](const std::string &reason) { terminations.push_back(reason); }};
};

static launch_config::LaunchConfig make_launch_config(const std::string &executable_path) {
    launch_config::LaunchConfig config;
    config.working_directory = "/proj";
    config.web_root = "/proj";
    config.executable_path = executable_path;
    config.using_explicit_executable = true;
    config.port = 12345;
    config.port_was_explicit = true;
    config.file = "app";
    config.capabilities = platform::capabilities_for(platform::HostPlatform::Linux);
    return config;
}

// Wait for our child to exit, SIGKILLing it after timeout. Returns the wait status, or -1.
static int wait_for_child(int process_id, int timeout_milliseconds) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
    int status = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        pid_t waited = waitpid(process_id, &status, WNOHANG);
        if (waited == process_id) {
            return status;
        }
        if (waited < 0) {
            return -1;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    kill(process_id, SIGKILL);
    waitpid(process_id, &status, 0);
    return -1;
}

static bool wait_until_dead(int process_id, int timeout_milliseconds) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
    while (std::chrono::steady_clock::now() < deadline) {
        if (!platform::is_process_alive(process_id)) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

// Test: launch spawns and attaches; disconnect detaches while the debuggee
// still runs, then interrupts it; a second disconnect does nothing.
static bool test_launch_then_disconnect_ordering() {
    std::string browser_path = test_support::write_script("browser", "exec sleep 30");
    if (browser_path.empty()) {
        std::cout << "  FAIL: Could not write browser script" << std::endl;
        return false;
    }

    SessionHarness harness;
    session_errors::OperationResult result = harness.session.launch(make_launch_config(browser_path));
    if (!result.success || !harness.session.debuggee()) {
        std::cout << "  FAIL: launch failed: " << result.message << " " << result.error_detail << std::endl;
        test_support::remove_script(browser_path);
        return false;
    }
    int process_id = harness.session.debuggee()->process_id;
    harness.engine.watched_process_id = process_id;

    bool attached_to_launch_url = harness.engine.last_attach_request.port == 12345 &&
                                  harness.engine.last_attach_request.target_url == "file:///proj/app/index.html";

    harness.session.disconnect();
    bool handle_cleared = !harness.session.debuggee();
    harness.session.disconnect();

    int status = wait_for_child(process_id, 3000);
    bool interrupted = status != -1 && WIFSIGNALED(status) && WTERMSIG(status) == SIGINT;
    test_support::remove_script(browser_path);

    bool success = attached_to_launch_url && harness.engine.watched_alive_at_detach && interrupted &&
                   handle_cleared && harness.engine.count_calls("detach") == 1 &&
                   harness.events.contains("session.disconnect_ignored") &&
                   harness.session.state() == SessionState::Terminated && harness.terminations.empty();
    if (success) {
        std::cout << "  OK: Disconnect detaches, then interrupts, then clears; second call is a no-op" << std::endl;
    } else {
        std::cout << "  FAIL: Teardown order wrong (alive at detach: " << harness.engine.watched_alive_at_detach
                  << ", interrupted: " << interrupted << ", detach calls: " << harness.engine.count_calls("detach")
                  << ")" << std::endl;
    }
    return success;
}

// Test: attach side effects disable the cache and probe the user agent.
static bool test_attach_side_effects() {
    SessionHarness harness;
    launch_config::AttachConfig config;
    config.port = 9222;
    config.url = "http://localhost:8080/";
    session_errors::OperationResult result = harness.session.attach(config);

    bool cache_disabled = false;
    for (const auto &command : harness.engine.commands) {
        if (command.method == "Network.setCacheDisabled" && command.params.value("cacheDisabled", false)) {
            cache_disabled = true;
        }
    }

    bool success = result.success && harness.session.state() == SessionState::Attached &&
                   harness.engine.count_calls("enable:Network") == 1 && cache_disabled &&
                   harness.events.contains("attach.user_agent") && !harness.session.debuggee() &&
                   harness.session.path_overrides().at("webpack:///*") == "*";
    if (success) {
        std::cout << "  OK: Attach disables the network cache and logs the user agent" << std::endl;
    } else {
        std::cout << "  FAIL: Attach side effects missing: " << result.error_detail << std::endl;
    }
    return success;
}

// Test: disableNetworkCache=false leaves the cache alone.
static bool test_attach_keeps_cache_when_asked() {
    SessionHarness harness;
    launch_config::AttachConfig config;
    config.port = 9222;
    config.disable_network_cache = false;
    session_errors::OperationResult result = harness.session.attach(config);

    bool success = result.success && harness.engine.count_calls("Network.setCacheDisabled") == 0 &&
                   harness.engine.count_calls("enable:Network") == 0;
    if (success) {
        std::cout << "  OK: Network cache left enabled when not requested" << std::endl;
    } else {
        std::cout << "  FAIL: Network cache was touched" << std::endl;
    }
    return success;
}

// Test: a failed attach is reported and the session ends up in Error.
static bool test_attach_failure() {
    SessionHarness harness;
    harness.engine.attach_succeeds = false;
    launch_config::AttachConfig config;
    config.port = 9222;
    session_errors::OperationResult result = harness.session.attach(config);

    bool success = !result.success && result.error_kind == session_errors::ErrorKind::AttachFailure &&
                   result.error_detail == "connection refused" && harness.session.state() == SessionState::Error;
    harness.session.disconnect();
    success = success && harness.session.state() == SessionState::Terminated;
    if (success) {
        std::cout << "  OK: Attach failure is reported and teardown still completes" << std::endl;
    } else {
        std::cout << "  FAIL: Attach failure handled wrongly" << std::endl;
    }
    return success;
}

// Test: a failing build cancels the launch with the fixed id and keeps the detail.
static bool test_build_failure_cancels_launch() {
    SessionHarness harness;
    harness.builder.build_succeeds = false;
    launch_config::LaunchConfig config = make_launch_config("/bin/true");
    config.build.kha_path = "/opt/kha";
    session_errors::OperationResult result = harness.session.launch(config);

    bool success = !result.success && result.error_kind == session_errors::ErrorKind::BuildFailure &&
                   result.error_id == session_errors::BUILD_FAILED_ERROR_ID &&
                   result.message == session_errors::BUILD_FAILED_MESSAGE &&
                   result.error_detail == harness.builder.failure_detail && !harness.session.debuggee() &&
                   harness.engine.count_calls("attach") == 0 && harness.events.contains("launch.canceled") &&
                   harness.builder.last_options.from == "/proj" && harness.builder.last_options.to == "/proj/build";
    if (success) {
        std::cout << "  OK: Build failure cancels the launch with id 2001" << std::endl;
    } else {
        std::cout << "  FAIL: Build failure handled wrongly: " << result.message << std::endl;
    }
    return success;
}

// Test: a spawn failure terminates the session and reports it once.
static bool test_spawn_failure_terminates_once() {
    SessionHarness harness;
    session_errors::OperationResult result =
        harness.session.launch(make_launch_config("/nonexistent/cdpdbg/browser"));
    harness.session.disconnect();

    bool success = !result.success && result.error_kind == session_errors::ErrorKind::SpawnError &&
                   harness.terminations.size() == 1 &&
                   harness.terminations[0].find("Debuggee process error") == 0 &&
                   harness.engine.count_calls("attach") == 0 && harness.session.state() == SessionState::Terminated;
    if (success) {
        std::cout << "  OK: Spawn failure terminates the session exactly once" << std::endl;
    } else {
        std::cout << "  FAIL: Spawn failure reported " << harness.terminations.size() << " termination(s)"
                  << std::endl;
    }
    return success;
}

// Test: pause shows the overlay at once; resume clears it after the debounce delay.
static bool test_pause_resume_overlay() {
    SessionHarness harness;
    launch_config::AttachConfig config;
    config.port = 9222;
    config.disable_network_cache = false;
    harness.session.attach(config);
    harness.engine.commands.clear();

    harness.engine.handlers.on_paused();
    bool shown_at_once = harness.engine.commands.size() == 1 &&
                         harness.engine.commands[0].method == "Overlay.setPausedInDebuggerMessage" &&
                         harness.engine.commands[0].params.value("message", "") ==
                             session_manager::DEFAULT_PAUSE_OVERLAY_MESSAGE;

    harness.engine.handlers.on_resumed();
    bool cleared_later = harness.engine.commands.size() == 1;
    harness.loop.run_due(event_loop::Clock::now() + std::chrono::milliseconds(300));
    bool cleared = harness.engine.commands.size() == 2 && !harness.engine.commands[1].params.contains("message");

    bool success = shown_at_once && cleared_later && cleared;
    if (success) {
        std::cout << "  OK: Overlay shown on pause, cleared after the debounce delay" << std::endl;
    } else {
        std::cout << "  FAIL: Overlay commands were wrong (" << harness.engine.commands.size() << " sent)" << std::endl;
    }
    return success;
}

// Test: resume followed quickly by pause never clears the overlay.
static bool test_quick_repause_keeps_overlay() {
    SessionHarness harness;
    launch_config::AttachConfig config;
    config.port = 9222;
    config.disable_network_cache = false;
    harness.session.attach(config);
    harness.session.set_pause_overlay_message("Stopped");
    harness.engine.commands.clear();

    harness.engine.handlers.on_paused();
    harness.engine.handlers.on_resumed();
    harness.engine.handlers.on_paused();
    harness.loop.run_due(event_loop::Clock::now() + std::chrono::milliseconds(300));

    bool success = harness.engine.commands.size() == 2 &&
                   harness.engine.commands[0].params.value("message", "") == "Stopped" &&
                   harness.engine.commands[1].params.value("message", "") == "Stopped";
    if (success) {
        std::cout << "  OK: Quick resume/pause does not flicker the overlay" << std::endl;
    } else {
        std::cout << "  FAIL: Overlay flickered (" << harness.engine.commands.size() << " commands)" << std::endl;
    }
    return success;
}

// Test: noDebug launches without attaching; disconnect still interrupts the debuggee.
static bool test_no_debug_launch() {
    std::string browser_path = test_support::write_script("browser", "exec sleep 30");
    if (browser_path.empty()) {
        std::cout << "  FAIL: Could not write browser script" << std::endl;
        return false;
    }

    SessionHarness harness;
    launch_config::LaunchConfig config = make_launch_config(browser_path);
    config.no_debug = true;
    session_errors::OperationResult result = harness.session.launch(config);
    int process_id = harness.session.debuggee() ? harness.session.debuggee()->process_id : -1;

    harness.session.disconnect();
    int status = process_id > 0 ? wait_for_child(process_id, 3000) : -1;
    test_support::remove_script(browser_path);

    bool success = result.success && harness.engine.count_calls("attach") == 0 &&
                   harness.engine.count_calls("detach") == 0 && status != -1 && WIFSIGNALED(status) &&
                   WTERMSIG(status) == SIGINT;
    if (success) {
        std::cout << "  OK: noDebug launch skips attach and teardown still interrupts" << std::endl;
    } else {
        std::cout << "  FAIL: noDebug launch handled wrongly: " << result.message << std::endl;
    }
    return success;
}

// Test: a closed target ends the session; disconnect then leaves the process alone.
static bool test_target_closed_skips_kill() {
    std::string browser_path = test_support::write_script("browser", "exec sleep 30");
    if (browser_path.empty()) {
        std::cout << "  FAIL: Could not write browser script" << std::endl;
        return false;
    }

    SessionHarness harness;
    harness.session.launch(make_launch_config(browser_path));
    int process_id = harness.session.debuggee() ? harness.session.debuggee()->process_id : -1;

    harness.engine.handlers.on_target_closed("Target closed");
    harness.engine.handlers.on_target_closed("Target closed");
    bool terminated_once = harness.terminations.size() == 1 && harness.session.self_terminated() &&
                           harness.session.state() == SessionState::Terminated;

    harness.session.disconnect();
    bool still_running = process_id > 0 && platform::is_process_alive(process_id);

    if (process_id > 0) {
        kill(process_id, SIGKILL);
        wait_for_child(process_id, 3000);
    }
    test_support::remove_script(browser_path);

    bool success = terminated_once && still_running && harness.events.contains("teardown.skip_kill") &&
                   harness.engine.count_calls("detach") == 1;
    if (success) {
        std::cout << "  OK: Target closed terminates once and disconnect skips the kill" << std::endl;
    } else {
        std::cout << "  FAIL: Target closed handling wrong (terminations: " << harness.terminations.size()
                  << ", still running: " << still_running << ")" << std::endl;
    }
    return success;
}

// Test: a debuggee that exits on its own is noticed by poll_debuggee.
static bool test_debuggee_exit_detected() {
    std::string browser_path = test_support::write_script("browser", "exit 0");
    if (browser_path.empty()) {
        std::cout << "  FAIL: Could not write browser script" << std::endl;
        return false;
    }

    SessionHarness harness;
    launch_config::LaunchConfig config = make_launch_config(browser_path);
    config.no_debug = true;
    harness.session.launch(config);

    bool exited = false;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(3000);
    while (!exited && std::chrono::steady_clock::now() < deadline) {
        exited = harness.session.poll_debuggee();
        if (!exited) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }
    bool polled_again = harness.session.poll_debuggee();
    harness.session.disconnect();
    test_support::remove_script(browser_path);

    bool success = exited && !polled_again && harness.terminations.size() == 1 &&
                   harness.terminations[0] == "Debuggee process exited." &&
                   !harness.events.contains("teardown.interrupt");
    if (success) {
        std::cout << "  OK: Debuggee exit terminates the session once" << std::endl;
    } else {
        std::cout << "  FAIL: Debuggee exit not detected correctly" << std::endl;
    }
    return success;
}

// Test: with indirect pid discovery teardown kills the reported debuggee tree.
static bool test_helper_debuggee_tree_killed() {
    std::string helper_path = test_support::write_script(
        "spawn_helper", "sleep 30 >/dev/null 2>&1 &\necho \"{\\\"pid\\\": $!}\"");
    if (helper_path.empty()) {
        std::cout << "  FAIL: Could not write helper script" << std::endl;
        return false;
    }

    SessionHarness harness;
    launch_config::LaunchConfig config = make_launch_config("/bin/browser");
    config.using_explicit_executable = false;
    config.no_debug = true;
    config.capabilities = platform::capabilities_for(platform::HostPlatform::Windows);
    config.capabilities.spawn_helper_path = helper_path;
    session_errors::OperationResult result = harness.session.launch(config);

    int helper_id = -1;
    int debuggee_id = -1;
    if (harness.session.debuggee()) {
        helper_id = harness.session.debuggee()->process_id;
        if (harness.session.debuggee()->debuggee_id_known) {
            debuggee_id = harness.session.debuggee()->debuggee_process_id;
        }
    }

    harness.session.disconnect();
    bool debuggee_gone = debuggee_id > 0 && wait_until_dead(debuggee_id, 3000);
    if (helper_id > 0) {
        wait_for_child(helper_id, 3000);
    }
    if (debuggee_id > 0 && !debuggee_gone) {
        kill(debuggee_id, SIGKILL);
    }
    test_support::remove_script(helper_path);

    bool success = result.success && debuggee_gone && harness.events.contains("teardown.kill_tree");
    if (success) {
        std::cout << "  OK: Helper-reported debuggee is killed with its tree" << std::endl;
    } else {
        std::cout << "  FAIL: Helper-reported debuggee survived teardown: " << result.error_detail << std::endl;
    }
    return success;
}

static bool has_teardown_error(const session_events::RecordingEventSink &events, const std::string &name) {
    for (const auto &event : events.events()) {
        if (event.name == name && event.severity == session_events::Severity::Warning &&
            event.fields.value("kind", "") ==
                session_errors::error_kind_name(session_errors::ErrorKind::TeardownError)) {
            return true;
        }
    }
    return false;
}

// Test: interrupting an already reaped debuggee is reported, not raised, and
// the session still ends up torn down.
static bool test_kill_failure_is_reported() {
    std::string browser_path = test_support::write_script("browser", "exit 0");
    if (browser_path.empty()) {
        std::cout << "  FAIL: Could not write browser script" << std::endl;
        return false;
    }

    SessionHarness harness;
    launch_config::LaunchConfig config = make_launch_config(browser_path);
    config.no_debug = true;
    session_errors::OperationResult result = harness.session.launch(config);
    int process_id = harness.session.debuggee() ? harness.session.debuggee()->process_id : -1;
    // Reap it behind the session's back so the SIGINT finds no process.
    int status = process_id > 0 ? wait_for_child(process_id, 3000) : -1;

    harness.session.disconnect();
    bool torn_down = !harness.session.debuggee() && harness.session.state() == SessionState::Terminated;
    size_t warnings_after_first = harness.events.count("teardown.kill_failed");
    harness.session.disconnect();
    test_support::remove_script(browser_path);

    bool success = result.success && status != -1 && torn_down &&
                   has_teardown_error(harness.events, "teardown.kill_failed") && warnings_after_first == 1 &&
                   harness.events.count("teardown.kill_failed") == 1 &&
                   harness.events.contains("session.disconnect_ignored") &&
                   harness.session.state() == SessionState::Terminated;
    if (success) {
        std::cout << "  OK: Failed kill is reported as a teardown warning and teardown completes" << std::endl;
    } else {
        std::cout << "  FAIL: Failed kill handled wrongly (kill_failed events: "
                  << harness.events.count("teardown.kill_failed") << ")" << std::endl;
    }
    return success;
}

// Test: a helper that never reports the debuggee pid leaves nothing to kill;
// teardown warns and still completes.
static bool test_unknown_debuggee_pid_is_reported() {
    std::string helper_path = test_support::write_script("silent_helper", "exit 0");
    if (helper_path.empty()) {
        std::cout << "  FAIL: Could not write helper script" << std::endl;
        return false;
    }

    SessionHarness harness;
    launch_config::LaunchConfig config = make_launch_config("/bin/browser");
    config.using_explicit_executable = false;
    config.no_debug = true;
    config.capabilities = platform::capabilities_for(platform::HostPlatform::Windows);
    config.capabilities.spawn_helper_path = helper_path;
    session_errors::OperationResult result = harness.session.launch(config);
    int helper_id = harness.session.debuggee() ? harness.session.debuggee()->process_id : -1;
    bool id_unknown = harness.session.debuggee() && !harness.session.debuggee()->debuggee_id_known;

    harness.session.disconnect();
    bool torn_down = !harness.session.debuggee() && harness.session.state() == SessionState::Terminated;
    harness.session.disconnect();
    if (helper_id > 0) {
        wait_for_child(helper_id, 3000);
    }
    test_support::remove_script(helper_path);

    bool success = result.success && id_unknown && torn_down &&
                   has_teardown_error(harness.events, "teardown.pid_unknown") &&
                   harness.events.count("teardown.pid_unknown") == 1 && !harness.events.contains("teardown.kill_tree") &&
                   harness.events.contains("session.disconnect_ignored") &&
                   harness.session.state() == SessionState::Terminated;
    if (success) {
        std::cout << "  OK: Unknown debuggee pid is reported as a teardown warning and teardown completes" << std::endl;
    } else {
        std::cout << "  FAIL: Unknown debuggee pid handled wrongly: " << result.error_detail << std::endl;
    }
    return success;
}

// Test: an explicit executable on the indirect platform is spawned directly
// and interrupted, not tree-killed.
static bool test_direct_spawn_on_indirect_platform_is_interrupted() {
    std::string browser_path = test_support::write_script("browser", "exec sleep 30");
    if (browser_path.empty()) {
        std::cout << "  FAIL: Could not write browser script" << std::endl;
        return false;
    }

    SessionHarness harness;
    launch_config::LaunchConfig config = make_launch_config(browser_path);
    config.no_debug = true;
    config.capabilities = platform::capabilities_for(platform::HostPlatform::Windows);
    session_errors::OperationResult result = harness.session.launch(config);
    bool direct = harness.session.debuggee() &&
                  harness.session.debuggee()->strategy == debuggee_process::StrategyKind::Direct;
    int process_id = harness.session.debuggee() ? harness.session.debuggee()->process_id : -1;

    harness.session.disconnect();
    int status = process_id > 0 ? wait_for_child(process_id, 3000) : -1;
    test_support::remove_script(browser_path);

    bool success = result.success && direct && status != -1 && WIFSIGNALED(status) && WTERMSIG(status) == SIGINT &&
                   harness.events.contains("teardown.interrupt") && !harness.events.contains("teardown.kill_tree");
    if (success) {
        std::cout << "  OK: Direct spawn is interrupted even where pids are discovered indirectly" << std::endl;
    } else {
        std::cout << "  FAIL: Direct spawn on the indirect platform was not interrupted" << std::endl;
    }
    return success;
}

// Test: restart reloads bypassing the cache, and fails when nothing is attached.
static bool test_restart_reloads_page() {
    SessionHarness harness;
    session_errors::OperationResult before_attach = harness.session.restart();

    launch_config::AttachConfig config;
    config.port = 9222;
    harness.session.attach(config);
    harness.engine.commands.clear();
    session_errors::OperationResult reloaded = harness.session.restart();

    harness.engine.commands_succeed = false;
    session_errors::OperationResult failed = harness.session.restart();

    bool success = !before_attach.success && reloaded.success && harness.engine.commands.size() == 2 &&
                   harness.engine.commands[0].method == "Page.reload" &&
                   harness.engine.commands[0].params.value("ignoreCache", false) && !failed.success &&
                   failed.error_kind == session_errors::ErrorKind::CommandFailure;
    if (success) {
        std::cout << "  OK: Restart reloads the page ignoring the cache" << std::endl;
    } else {
        std::cout << "  FAIL: Restart handled wrongly" << std::endl;
    }
    return success;
}

// Test: a session only launches once.
static bool test_second_launch_rejected() {
    SessionHarness harness;
    launch_config::AttachConfig config;
    config.port = 9222;
    harness.session.attach(config);
    session_errors::OperationResult second = harness.session.attach(config);

    bool success = !second.success && second.error_kind == session_errors::ErrorKind::InvalidConfig &&
                   harness.engine.count_calls("attach") == 1;
    if (success) {
        std::cout << "  OK: Second launch/attach on a session is rejected" << std::endl;
    } else {
        std::cout << "  FAIL: Second attach was accepted" << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_launch_then_disconnect_ordering();
    all_passed &= test_attach_side_effects();
    all_passed &= test_attach_keeps_cache_when_asked();
    all_passed &= test_attach_failure();
    all_passed &= test_build_failure_cancels_launch();
    all_passed &= test_spawn_failure_terminates_once();
    all_passed &= test_pause_resume_overlay();
    all_passed &= test_quick_repause_keeps_overlay();
    all_passed &= test_no_debug_launch();
    all_passed &= test_target_closed_skips_kill();
    all_passed &= test_debuggee_exit_detected();
    all_passed &= test_helper_debuggee_tree_killed();
    all_passed &= test_kill_failure_is_reported();
    all_passed &= test_unknown_debuggee_pid_is_reported();
    all_passed &= test_direct_spawn_on_indirect_platform_is_interrupted();
    all_passed &= test_restart_reloads_page();
    all_passed &= test_second_launch_rejected();
    return all_passed;
}

} // namespace test_session_manager
