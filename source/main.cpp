// cdpdbg – browser debug adapter
// Entry point: stdio host loop.
//
// Reads JSON-RPC 2.0 requests from the host on stdin, drives one debug
// session and writes responses and "terminated" notifications to stdout.
// Logs go to stderr.

#include <nlohmann/json.hpp>
#include <csignal>
#include <iostream>
#include <string>

#include "host/host_dispatch.hpp"
#include "host/host_stdio.hpp"
#include "protocol/json_rpc.hpp"
#include "session/build_collaborator.hpp"
#include "session/cdp_protocol_engine.hpp"
#include "session/session_manager.hpp"
#include "utils/debug_log.hpp"
#include "utils/event_loop.hpp"
#include "utils/session_events.hpp"

using json = nlohmann::json;

static constexpr int STDIN_POLL_MILLISECONDS = 10;

// Global flag for graceful shutdown.
static volatile std::sig_atomic_t signal_received = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    signal_received = 1;
}

int main() {
    std::cerr << "[cdpdbg] cdpdbg – browser debug adapter, build " << __DATE__ << " " << __TIME__ << std::endl;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    // The debuggee may close its end of a pipe at any time.
    std::signal(SIGPIPE, SIG_IGN);

    session_events::LogEventSink events;
    event_loop::EventLoop loop;
    cdp_protocol_engine::CdpProtocolEngine engine(events);
    build_collaborator::KhamakeBuildCollaborator builder(events);

    session_manager::SessionManager session(engine, builder, loop, events, [](const std::string &reason) {
        host_stdio::write_message(host_dispatch::build_terminated_notification(reason).dump());
    });

    host_stdio::log_message("cdpdbg started. Waiting for host requests on stdin.");

    bool shutdown_requested = false;
    while (!shutdown_requested && !signal_received) {
        std::string raw_message;
        bool end_of_input = false;
        int poll_milliseconds = STDIN_POLL_MILLISECONDS;
        int until_next_timer = loop.milliseconds_until_next(event_loop::Clock::now());
        if (until_next_timer >= 0 && until_next_timer < poll_milliseconds) {
            poll_milliseconds = until_next_timer;
        }
        bool have_message = host_stdio::poll_message(poll_milliseconds, raw_message, end_of_input);

        if (have_message) {
            json parsed_message = json::parse(raw_message, nullptr, false);
            if (parsed_message.is_discarded() || !parsed_message.is_object()) {
                host_stdio::log_message("Failed to parse incoming JSON message.");
                json error_response = json_rpc::build_error_response(nullptr, json_rpc::PARSE_ERROR, "Parse error");
                host_stdio::write_message(error_response.dump());
            } else {
                json response = host_dispatch::dispatch_message(session, parsed_message, shutdown_requested);
                if (!response.is_null()) {
                    host_stdio::write_message(response.dump());
                }
            }
        } else if (end_of_input) {
            debug_log::log("EOF on stdin. Shutting down, the debuggee will be terminated.");
            break;
        }

        engine.service(0);
        loop.run_due();
        session.poll_debuggee();
    }

    session.disconnect();
    host_stdio::log_message("cdpdbg shut down.");

    return 0;
}
