#include "session/cdp_protocol_engine.hpp"

#include <libwebsockets.h>
#include <algorithm>
#include <cstring>
#include <thread>

namespace cdp_protocol_engine {

using protocol_engine::CommandResult;

// Forward declaration of the WebSocket callback.
static int websocket_callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                              void *user_data, void *incoming_data, size_t incoming_length);

// Protocol definition for libwebsockets; serves both the HTTP discovery
// request and the CDP WebSocket.
static const struct lws_protocols websocket_protocols[] = {
    {
        "cdp-protocol",
        websocket_callback,
        0,    // per-session data size
        65536 // rx buffer size
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

static int websocket_callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                              void *user_data, void *incoming_data, size_t incoming_length) {
    struct lws_context *context = websocket_instance ? lws_get_context(websocket_instance) : nullptr;
    auto *engine = context ? static_cast<CdpProtocolEngine *>(lws_context_user(context)) : nullptr;
    if (engine == nullptr) {
        return lws_callback_http_dummy(websocket_instance, reason, user_data, incoming_data, incoming_length);
    }
    int handled = engine->handle_callback(websocket_instance, static_cast<int>(reason), incoming_data,
                                          incoming_length);
    if (handled > 0) {
        return lws_callback_http_dummy(websocket_instance, reason, user_data, incoming_data, incoming_length);
    }
    return handled;
}

bool parse_websocket_url(const std::string &websocket_url, std::string &output_host, int &output_port,
                         std::string &output_path) {
    std::string url_without_scheme = websocket_url;
    if (url_without_scheme.substr(0, 5) == "ws://") {
        url_without_scheme = url_without_scheme.substr(5);
    }

    // Split host:port from path.
    std::string host_and_port;
    output_path = "/";
    auto slash_position = url_without_scheme.find('/');
    if (slash_position != std::string::npos) {
        host_and_port = url_without_scheme.substr(0, slash_position);
        output_path = url_without_scheme.substr(slash_position);
    } else {
        host_and_port = url_without_scheme;
    }

    // Split host from port.
    output_host = host_and_port;
    output_port = 80;
    auto colon_position = host_and_port.find(':');
    if (colon_position != std::string::npos) {
        output_host = host_and_port.substr(0, colon_position);
        std::string port_text = host_and_port.substr(colon_position + 1);
        if (port_text.empty() || port_text.find_first_not_of("0123456789") != std::string::npos ||
            port_text.size() > 5) {
            return false;
        }
        output_port = std::stoi(port_text);
    }
    return !output_host.empty();
}

CommandResult to_command_result(const json &response) {
    CommandResult result;
    if (response.contains("error")) {
        const json &error = response["error"];
        if (error.is_string()) {
            result.error_detail = error.get<std::string>();
        } else if (error.is_object() && error.contains("message") && error["message"].is_string()) {
            result.error_detail = error["message"].get<std::string>();
        } else {
            result.error_detail = error.dump();
        }
        return result;
    }
    result.success = true;
    result.value = response.contains("result") ? response["result"] : json::object();
    return result;
}

std::string choose_page_target(const json &target_infos, const std::string &target_url) {
    if (!target_infos.is_array()) {
        return "";
    }
    std::string first_page_id;
    for (const auto &target_info : target_infos) {
        if (!target_info.contains("type") || target_info["type"] != "page" ||
            !target_info.contains("targetId") || !target_info["targetId"].is_string()) {
            continue;
        }
        std::string target_id = target_info["targetId"].get<std::string>();
        if (first_page_id.empty()) {
            first_page_id = target_id;
        }
        if (!target_url.empty() && target_info.contains("url") && target_info["url"].is_string() &&
            target_info["url"].get<std::string>().rfind(target_url, 0) == 0) {
            return target_id;
        }
    }
    return first_page_id;
}

CdpProtocolEngine::CdpProtocolEngine(session_events::EventSink &events) : events(events) {}

CdpProtocolEngine::~CdpProtocolEngine() {
    state.detaching = true;
    destroy_context();
}

// Returns 0/-1 when the reason was handled here, 1 to fall through to the
// default libwebsockets handling.
int CdpProtocolEngine::handle_callback(struct lws *websocket_instance, int reason, void *incoming_data,
                                       size_t incoming_length) {
    switch (static_cast<enum lws_callback_reasons>(reason)) {
    case LWS_CALLBACK_CLIENT_ESTABLISHED:
        state.connected = true;
        events.debug("cdp.connected", "CDP WebSocket connected.");
        return 0;

    case LWS_CALLBACK_CLIENT_RECEIVE: {
        // Accumulate incoming data.
        const char *data_pointer = static_cast<const char *>(incoming_data);
        state.receive_buffer.append(data_pointer, incoming_length);

        // Check if the full message has been received.
        if (lws_is_final_fragment(websocket_instance)) {
            json message = json::parse(state.receive_buffer, nullptr, /*allow_exceptions=*/false);
            if (message.is_discarded()) {
                events.warning("cdp.parse_failed", "Failed to parse CDP message",
                               {{"buffer", state.receive_buffer.substr(0, 200)}});
            } else {
                handle_message(message);
            }
            state.receive_buffer.clear();
        }
        return 0;
    }

    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR: {
        const char *error_message = incoming_data ? static_cast<const char *>(incoming_data) : "unknown";
        events.debug("cdp.connection_error", "Connection error: " + std::string(error_message));
        if (state.phase == Phase::Http) {
            state.http_failed = true;
        } else {
            state.connected = false;
            state.connection_failed = true;
        }
        return 0;
    }

    case LWS_CALLBACK_CLIENT_CLOSED:
        state.connected = false;
        state.websocket_connection = nullptr;
        if (!state.detaching && !state.current_session_id.empty()) {
            state.queued_events.push_back({QueuedEventType::TargetClosed, "Debuggee connection closed."});
        }
        return 0;

    case LWS_CALLBACK_RECEIVE_CLIENT_HTTP: {
        char buffer[4096 + LWS_PRE];
        char *buffer_pointer = buffer + LWS_PRE;
        int buffer_length = static_cast<int>(sizeof(buffer) - LWS_PRE);
        if (lws_http_client_read(websocket_instance, &buffer_pointer, &buffer_length) < 0) {
            return -1;
        }
        return 0;
    }

    case LWS_CALLBACK_RECEIVE_CLIENT_HTTP_READ:
        state.http_body.append(static_cast<const char *>(incoming_data), incoming_length);
        return 0;

    case LWS_CALLBACK_COMPLETED_CLIENT_HTTP:
        state.http_completed = true;
        return 0;

    case LWS_CALLBACK_CLOSED_CLIENT_HTTP:
        if (!state.http_completed) {
            state.http_failed = true;
        }
        return 0;

    default:
        break;
    }
    return 1;
}

void CdpProtocolEngine::handle_message(const json &message) {
    // Check if this is a response (has "id") or an event (no "id").
    if (message.contains("id") && message["id"].is_number_integer()) {
        state.pending_responses[message["id"].get<int>()] = message;
        return;
    }
    if (!message.contains("method") || !message["method"].is_string()) {
        return;
    }

    std::string method = message["method"].get<std::string>();
    std::string event_session_id;
    if (message.contains("sessionId") && message["sessionId"].is_string()) {
        event_session_id = message["sessionId"].get<std::string>();
    }
    const json params = message.contains("params") ? message["params"] : json::object();
    bool for_current_session = (event_session_id == state.current_session_id);

    if (method == "Debugger.paused" && for_current_session) {
        state.queued_events.push_back({QueuedEventType::Paused, ""});
    } else if (method == "Debugger.resumed" && for_current_session) {
        state.queued_events.push_back({QueuedEventType::Resumed, ""});
    } else if (method == "Inspector.detached" && for_current_session) {
        std::string reason = "Debuggee detached";
        if (params.contains("reason") && params["reason"].is_string()) {
            reason += ": " + params["reason"].get<std::string>();
        }
        state.queued_events.push_back({QueuedEventType::TargetClosed, reason});
    } else if (method == "Target.detachedFromTarget" && params.contains("sessionId") &&
               params["sessionId"] == state.current_session_id && !state.detaching) {
        state.queued_events.push_back({QueuedEventType::TargetClosed, "Debuggee target detached."});
    } else if (method == "Target.targetDestroyed" && params.contains("targetId") &&
               params["targetId"] == state.current_target_id) {
        state.queued_events.push_back({QueuedEventType::TargetClosed, "Debuggee target closed."});
    } else {
        events.debug("cdp.event", "CDP event: " + method);
    }
}

bool CdpProtocolEngine::create_context() {
    if (state.websocket_context != nullptr) {
        return true;
    }

    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = CONTEXT_PORT_NO_LISTEN; // Client mode, no listening.
    context_info.protocols = websocket_protocols;
    context_info.gid = -1;
    context_info.uid = -1;
    context_info.user = this;

    state.websocket_context = lws_create_context(&context_info);
    return state.websocket_context != nullptr;
}

void CdpProtocolEngine::destroy_context() {
    if (state.websocket_context != nullptr) {
        lws_context_destroy(state.websocket_context);
        state.websocket_context = nullptr;
    }
    state.websocket_connection = nullptr;
    state.connected = false;
    state.phase = Phase::Idle;
}

bool CdpProtocolEngine::http_get(const std::string &host, int port, const std::string &path,
                                 int timeout_milliseconds, std::string &output_body, std::string &error_detail) {
    state.phase = Phase::Http;
    state.http_completed = false;
    state.http_failed = false;
    state.http_body.clear();

    struct lws_client_connect_info connect_info;
    memset(&connect_info, 0, sizeof(connect_info));
    connect_info.context = state.websocket_context;
    connect_info.address = host.c_str();
    connect_info.port = port;
    connect_info.path = path.c_str();
    connect_info.host = host.c_str();
    connect_info.origin = host.c_str();
    connect_info.method = "GET";
    connect_info.protocol = websocket_protocols[0].name;

    if (lws_client_connect_via_info(&connect_info) == nullptr) {
        error_detail = "could not start HTTP request to " + host + ":" + std::to_string(port) + path;
        state.phase = Phase::Idle;
        return false;
    }

    auto start_time = std::chrono::steady_clock::now();
    while (!state.http_completed && !state.http_failed) {
        lws_service(state.websocket_context, 50);
        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() > timeout_milliseconds) {
            error_detail = "timed out fetching " + path;
            state.phase = Phase::Idle;
            return false;
        }
    }
    state.phase = Phase::Idle;

    if (state.http_failed) {
        error_detail = "HTTP request to " + host + ":" + std::to_string(port) + path + " failed";
        return false;
    }
    output_body = state.http_body;
    return true;
}

bool CdpProtocolEngine::discover_browser_websocket_url(const protocol_engine::AttachRequest &request,
                                                       std::chrono::steady_clock::time_point deadline,
                                                       std::string &output_url, std::string &error_detail) {
    // The debuggee needs a moment to open its port: poll until the deadline.
    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            if (error_detail.empty()) {
                error_detail = "timed out waiting for the debugging endpoint";
            }
            return false;
        }

        std::string body;
        if (http_get(request.address, request.port, "/json/version", static_cast<int>(remaining), body,
                     error_detail)) {
            json version = json::parse(body, nullptr, /*allow_exceptions=*/false);
            if (!version.is_discarded() && version.contains("webSocketDebuggerUrl") &&
                version["webSocketDebuggerUrl"].is_string()) {
                output_url = version["webSocketDebuggerUrl"].get<std::string>();
                return true;
            }
            error_detail = "unexpected /json/version response: " + body.substr(0, 200);
        }
        events.debug("cdp.endpoint_retry", "Debugging endpoint not ready: " + error_detail);
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

bool CdpProtocolEngine::connect_websocket(const std::string &websocket_url, int timeout_milliseconds,
                                          std::string &error_detail) {
    std::string host;
    int port = 0;
    std::string path;
    if (!parse_websocket_url(websocket_url, host, port, path)) {
        error_detail = "malformed WebSocket URL: " + websocket_url;
        return false;
    }

    struct lws_client_connect_info connect_info;
    memset(&connect_info, 0, sizeof(connect_info));
    connect_info.context = state.websocket_context;
    connect_info.address = host.c_str();
    connect_info.port = port;
    connect_info.path = path.c_str();
    connect_info.host = host.c_str();
    connect_info.origin = nullptr;
    connect_info.protocol = nullptr;

    events.debug("cdp.connect", "Connecting to " + websocket_url);
    state.phase = Phase::WebSocket;
    state.connection_failed = false;
    state.connected = false;
    state.websocket_connection = lws_client_connect_via_info(&connect_info);
    if (state.websocket_connection == nullptr) {
        error_detail = "lws_client_connect_via_info returned null for " + websocket_url;
        return false;
    }

    auto start_time = std::chrono::steady_clock::now();
    while (!state.connected) {
        lws_service(state.websocket_context, 50);

        if (state.connection_failed) {
            error_detail = "WebSocket connection to " + websocket_url + " failed";
            return false;
        }

        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() > timeout_milliseconds) {
            error_detail = "timed out connecting to " + websocket_url;
            return false;
        }
    }
    return true;
}

json CdpProtocolEngine::send_raw_command(const std::string &method, const json &params,
                                         const std::string &session_id, int timeout_milliseconds) {
    if (!state.connected || state.websocket_connection == nullptr) {
        json error_response;
        error_response["error"] = "Not connected to CDP";
        return error_response;
    }

    // Build the CDP command message.
    int message_id = state.next_message_id++;
    json command;
    command["id"] = message_id;
    command["method"] = method;
    if (!params.is_null() && !params.empty()) {
        command["params"] = params;
    }
    // Session routing: if session_id is set, include it in the message.
    if (!session_id.empty()) {
        command["sessionId"] = session_id;
    }

    std::string serialized_command = command.dump();

    // libwebsockets requires LWS_PRE bytes of padding before the data.
    std::vector<unsigned char> send_buffer(LWS_PRE + serialized_command.size());
    memcpy(send_buffer.data() + LWS_PRE, serialized_command.c_str(), serialized_command.size());

    int bytes_written = lws_write(state.websocket_connection, send_buffer.data() + LWS_PRE,
                                  serialized_command.size(), LWS_WRITE_TEXT);
    if (bytes_written < 0) {
        json error_response;
        error_response["error"] = "Failed to send CDP command via WebSocket";
        return error_response;
    }

    // Wait for the response with the matching message ID.
    auto start_time = std::chrono::steady_clock::now();
    for (;;) {
        lws_service(state.websocket_context, 10);

        auto response_iterator = state.pending_responses.find(message_id);
        if (response_iterator != state.pending_responses.end()) {
            json response = response_iterator->second;
            state.pending_responses.erase(response_iterator);
            return response;
        }

        if (!state.connected) {
            json error_response;
            error_response["error"] = "CDP connection closed while waiting for: " + method;
            return error_response;
        }

        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() > timeout_milliseconds) {
            json error_response;
            error_response["error"] = "Timed out waiting for CDP response to method: " + method;
            error_response["message_id"] = message_id;
            return error_response;
        }
    }
}

CommandResult CdpProtocolEngine::attach(const protocol_engine::AttachRequest &request) {
    CommandResult result;
    if (is_attached()) {
        result.error_detail = "already attached";
        return result;
    }
    if (!create_context()) {
        result.error_detail = "Failed to create libwebsockets context.";
        return result;
    }
    state.detaching = false;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(request.timeout_milliseconds);
    std::string websocket_url;
    if (!discover_browser_websocket_url(request, deadline, websocket_url, result.error_detail)) {
        destroy_context();
        return result;
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    if (!connect_websocket(websocket_url, static_cast<int>(std::max<long long>(remaining, 1000)),
                           result.error_detail)) {
        destroy_context();
        return result;
    }

    CommandResult discover_result = to_command_result(send_raw_command("Target.setDiscoverTargets",
                                                                       {{"discover", true}}, ""));
    if (!discover_result.success) {
        events.warning("cdp.discover_failed", "Target.setDiscoverTargets failed: " + discover_result.error_detail);
    }

    CommandResult targets_result = to_command_result(send_raw_command("Target.getTargets", json::object(), ""));
    std::string chosen_target_id;
    if (targets_result.success && targets_result.value.contains("targetInfos")) {
        chosen_target_id = choose_page_target(targets_result.value["targetInfos"], request.target_url);
    }

    // If no page target exists, create a new one.
    if (chosen_target_id.empty()) {
        std::string url = request.target_url.empty() ? "about:blank" : request.target_url;
        CommandResult create_result = to_command_result(send_raw_command("Target.createTarget", {{"url", url}}, ""));
        if (!create_result.success || !create_result.value.contains("targetId")) {
            result.error_detail = "Target.createTarget failed: " + create_result.error_detail;
            destroy_context();
            return result;
        }
        chosen_target_id = create_result.value["targetId"].get<std::string>();
    }

    CommandResult attach_result = to_command_result(
        send_raw_command("Target.attachToTarget", {{"targetId", chosen_target_id}, {"flatten", true}}, ""));
    if (!attach_result.success || !attach_result.value.contains("sessionId") ||
        !attach_result.value["sessionId"].is_string()) {
        result.error_detail = "Target.attachToTarget failed: " + attach_result.error_detail;
        destroy_context();
        return result;
    }
    state.current_target_id = chosen_target_id;
    state.current_session_id = attach_result.value["sessionId"].get<std::string>();
    events.debug("cdp.attached", "Attached to target",
                 {{"targetId", state.current_target_id}, {"sessionId", state.current_session_id}});

    for (const char *domain : {"Runtime", "Page", "Debugger", "DOM", "Overlay"}) {
        CommandResult enable_result = enable_domain(domain);
        if (!enable_result.success) {
            events.warning("cdp.enable_failed", std::string(domain) + ".enable failed: " + enable_result.error_detail);
        }
    }

    result.success = true;
    result.value = {{"targetId", state.current_target_id}, {"sessionId", state.current_session_id}};
    return result;
}

CommandResult CdpProtocolEngine::detach() {
    CommandResult result;
    if (state.websocket_context == nullptr) {
        result.error_detail = "not attached";
        return result;
    }
    state.detaching = true;

    if (is_attached()) {
        result = to_command_result(send_raw_command("Target.detachFromTarget",
                                                    {{"sessionId", state.current_session_id}}, ""));
    } else {
        result.success = true;
    }
    state.current_session_id.clear();
    state.current_target_id.clear();
    state.pending_responses.clear();
    state.queued_events.clear();
    destroy_context();
    return result;
}

CommandResult CdpProtocolEngine::evaluate(const std::string &expression) {
    CommandResult result = send_command("Runtime.evaluate",
                                        {{"expression", expression}, {"returnByValue", true}, {"silent", true}});
    if (!result.success) {
        return result;
    }
    if (result.value.contains("exceptionDetails")) {
        CommandResult exception_result;
        exception_result.error_detail = result.value["exceptionDetails"].dump();
        return exception_result;
    }
    json remote_object = result.value.contains("result") ? result.value["result"] : json::object();
    result.value = remote_object;
    return result;
}

CommandResult CdpProtocolEngine::enable_domain(const std::string &domain) {
    return send_command(domain + ".enable", json::object());
}

CommandResult CdpProtocolEngine::send_command(const std::string &method, const json &params) {
    if (!is_attached()) {
        CommandResult result;
        result.error_detail = "No attached debuggee.";
        return result;
    }
    return to_command_result(send_raw_command(method, params, state.current_session_id));
}

void CdpProtocolEngine::set_event_handlers(protocol_engine::EngineEventHandlers event_handlers) {
    handlers = std::move(event_handlers);
}

void CdpProtocolEngine::service(int timeout_milliseconds) {
    if (state.websocket_context != nullptr) {
        lws_service(state.websocket_context, timeout_milliseconds);
    }

    // Dispatch outside the libwebsockets callback: handlers send commands.
    std::vector<QueuedEvent> ready_events;
    ready_events.swap(state.queued_events);
    for (const auto &queued_event : ready_events) {
        switch (queued_event.type) {
        case QueuedEventType::Paused:
            if (handlers.on_paused) {
                handlers.on_paused();
            }
            break;
        case QueuedEventType::Resumed:
            if (handlers.on_resumed) {
                handlers.on_resumed();
            }
            break;
        case QueuedEventType::TargetClosed:
            if (handlers.on_target_closed) {
                handlers.on_target_closed(queued_event.reason);
            }
            break;
        }
    }
}

bool CdpProtocolEngine::is_attached() const {
    return state.connected && !state.current_session_id.empty();
}

} // namespace cdp_protocol_engine
