// Tests for the host side: stdin message framing and request dispatch.

#include "host/host_dispatch.hpp"
#include "host/host_stdio.hpp"
#include "protocol/json_rpc.hpp"
#include "session/session_manager.hpp"
#include "utils/event_loop.hpp"
#include "utils/session_events.hpp"
#include "fake_collaborators.hpp"

#include <nlohmann/json.hpp>
#include <deque>
#include <iostream>
#include <string>

using json = nlohmann::json;

namespace test_host {

struct DispatchHarness {
    session_events::RecordingEventSink events;
    event_loop::EventLoop loop;
    fake_collaborators::FakeProtocolEngine engine;
    fake_collaborators::FakeBuildCollaborator builder;
    session_manager::SessionManager session{engine, builder, loop, events, [](const std::string &) {}};
};

static json request(int id, const std::string &method, const json &params = json::object()) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

// Test: two concatenated objects split across chunks come out whole.
static bool test_framer_splits_stream() {
    host_stdio::MessageFramer framer;
    std::deque<std::string> messages;
    std::string first = "  {\"id\":1,\"method\":\"initialize\"}\n{\"id\":2,";
    std::string second = "\"method\":\"disconnect\",\"params\":{}}\n";
    framer.feed(first.data(), first.size(), messages);
    size_t after_first_chunk = messages.size();
    framer.feed(second.data(), second.size(), messages);

    bool success = after_first_chunk == 1 && messages.size() == 2 &&
                   json::parse(messages[0])["method"] == "initialize" &&
                   json::parse(messages[1])["method"] == "disconnect";
    if (success) {
        std::cout << "  OK: Framer splits a stream into whole messages" << std::endl;
    } else {
        std::cout << "  FAIL: Framer produced " << messages.size() << " message(s)" << std::endl;
    }
    return success;
}

// Test: braces and escaped quotes inside strings do not end a message.
static bool test_framer_ignores_braces_in_strings() {
    host_stdio::MessageFramer framer;
    std::deque<std::string> messages;
    std::string input = "{\"params\":{\"file\":\"a}b{\\\"c\\\\\"}}";
    framer.feed(input.data(), input.size(), messages);

    bool success = messages.size() == 1 && messages[0] == input &&
                   json::parse(messages[0])["params"]["file"] == "a}b{\"c\\";
    if (success) {
        std::cout << "  OK: Framer ignores braces inside strings" << std::endl;
    } else {
        std::cout << "  FAIL: Framer split inside a string" << std::endl;
    }
    return success;
}

// Test: initialize answers with the server capabilities.
static bool test_dispatch_initialize() {
    DispatchHarness harness;
    bool shutdown_requested = false;
    json response = host_dispatch::dispatch_message(harness.session, request(1, "initialize"), shutdown_requested);

    bool success = response["id"] == 1 && response["result"]["serverInfo"]["name"] == "cdpdbg" &&
                   response["result"]["capabilities"]["supportsRestartRequest"] == true && !shutdown_requested;
    if (success) {
        std::cout << "  OK: initialize returns capabilities" << std::endl;
    } else {
        std::cout << "  FAIL: initialize response was " << response.dump() << std::endl;
    }
    return success;
}

// Test: unknown methods and bad launch params map to JSON-RPC errors.
static bool test_dispatch_errors() {
    DispatchHarness harness;
    bool shutdown_requested = false;
    json unknown = host_dispatch::dispatch_message(harness.session, request(2, "evaluate"), shutdown_requested);
    json bad_launch = host_dispatch::dispatch_message(harness.session, request(3, "launch", {{"port", 9222}}),
                                                      shutdown_requested);

    json no_method = host_dispatch::dispatch_message(harness.session, {{"jsonrpc", "2.0"}, {"id", 9}},
                                                     shutdown_requested);

    bool success = unknown["error"]["code"] == json_rpc::METHOD_NOT_FOUND &&
                   no_method["error"]["code"] == json_rpc::INVALID_REQUEST &&
                   bad_launch["error"]["code"] == json_rpc::INVALID_PARAMS && bad_launch["id"] == 3 &&
                   harness.engine.calls.empty();
    if (success) {
        std::cout << "  OK: Unknown method, missing method and invalid launch params are rejected" << std::endl;
    } else {
        std::cout << "  FAIL: Error responses were " << unknown.dump() << " / " << bad_launch.dump() << std::endl;
    }
    return success;
}

// Test: a failed attach carries the error kind and detail.
static bool test_dispatch_attach_failure() {
    DispatchHarness harness;
    harness.engine.attach_succeeds = false;
    bool shutdown_requested = false;
    json response = host_dispatch::dispatch_message(harness.session, request(4, "attach", {{"port", 9222}}),
                                                    shutdown_requested);

    bool success = response["error"]["code"] == json_rpc::INTERNAL_ERROR &&
                   response["error"]["data"]["kind"] == "attach_failure" &&
                   response["error"]["data"]["detail"] == "connection refused";
    if (success) {
        std::cout << "  OK: Attach failure response carries kind and detail" << std::endl;
    } else {
        std::cout << "  FAIL: Attach failure response was " << response.dump() << std::endl;
    }
    return success;
}

// Test: a build failure is answered with id 2001.
static bool test_build_failure_response() {
    session_errors::OperationResult result;
    result.error_kind = session_errors::ErrorKind::BuildFailure;
    result.error_id = session_errors::BUILD_FAILED_ERROR_ID;
    result.message = session_errors::BUILD_FAILED_MESSAGE;
    result.error_detail = "make.js exited with code 1";
    json response = host_dispatch::build_operation_response(7, result);

    bool success = response["error"]["code"] == 2001 && response["error"]["message"] == "Compilation failed." &&
                   response["error"]["data"]["kind"] == "build_failure";
    if (success) {
        std::cout << "  OK: Build failure response uses id 2001" << std::endl;
    } else {
        std::cout << "  FAIL: Build failure response was " << response.dump() << std::endl;
    }
    return success;
}

// Test: disconnect answers and asks the host loop to stop; notifications get no answer.
static bool test_dispatch_disconnect_and_notification() {
    DispatchHarness harness;
    bool shutdown_requested = false;
    json notification = {{"jsonrpc", "2.0"}, {"method", "initialized"}};
    json notification_response = host_dispatch::dispatch_message(harness.session, notification, shutdown_requested);
    bool still_running = !shutdown_requested;
    json response = host_dispatch::dispatch_message(harness.session, request(5, "disconnect"), shutdown_requested);

    json terminated = host_dispatch::build_terminated_notification("Debuggee process exited.");

    bool success = notification_response.is_null() && still_running && shutdown_requested &&
                   response["id"] == 5 && response.contains("result") &&
                   harness.session.state() == session_manager::SessionState::Terminated &&
                   terminated["method"] == "terminated" && !terminated.contains("id") &&
                   terminated["params"]["reason"] == "Debuggee process exited.";
    if (success) {
        std::cout << "  OK: disconnect requests shutdown; notifications are not answered" << std::endl;
    } else {
        std::cout << "  FAIL: disconnect response was " << response.dump() << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_framer_splits_stream();
    all_passed &= test_framer_ignores_braces_in_strings();
    all_passed &= test_dispatch_initialize();
    all_passed &= test_dispatch_errors();
    all_passed &= test_dispatch_attach_failure();
    all_passed &= test_build_failure_response();
    all_passed &= test_dispatch_disconnect_and_notification();
    return all_passed;
}

} // namespace test_host
