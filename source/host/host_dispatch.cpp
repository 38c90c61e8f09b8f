#include "host/host_dispatch.hpp"
#include "config/launch_config.hpp"
#include "protocol/json_rpc.hpp"

namespace host_dispatch {

// Handle the "initialize" request.
static json handle_initialize(const json &request_id) {
    json capabilities;
    capabilities["supportsRestartRequest"] = true;
    capabilities["supportsNoDebug"] = true;
    capabilities["supportsAttach"] = true;

    json result;
    result["serverInfo"] = {{"name", SERVER_NAME}, {"version", SERVER_VERSION}};
    result["capabilities"] = capabilities;
    return json_rpc::build_response(request_id, result);
}

static json handle_launch(session_manager::SessionManager &session, const json &request_id, const json &params) {
    launch_config::LaunchConfigResult parsed = launch_config::parse_launch_request(params);
    if (!parsed.success) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS, parsed.error_message);
    }
    return build_operation_response(request_id, session.launch(parsed.config));
}

static json handle_attach(session_manager::SessionManager &session, const json &request_id, const json &params) {
    launch_config::AttachConfigResult parsed = launch_config::parse_attach_request(params);
    if (!parsed.success) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS, parsed.error_message);
    }
    return build_operation_response(request_id, session.attach(parsed.config));
}

json build_operation_response(const json &request_id, const session_errors::OperationResult &result) {
    if (result.success) {
        return json_rpc::build_response(request_id, {{"message", result.message}});
    }
    json error_data;
    error_data["kind"] = session_errors::error_kind_name(result.error_kind);
    if (!result.error_detail.empty()) {
        error_data["detail"] = result.error_detail;
    }
    int error_code = result.error_id != 0 ? result.error_id : json_rpc::INTERNAL_ERROR;
    return json_rpc::build_error_response(request_id, error_code, result.message, error_data);
}

json build_terminated_notification(const std::string &reason) {
    return json_rpc::build_notification("terminated", {{"reason", reason}});
}

json dispatch_message(session_manager::SessionManager &session, const json &message, bool &shutdown_requested) {
    std::string method = json_rpc::get_method(message);
    json request_id = json_rpc::get_id(message);
    json params = json_rpc::get_params(message);

    // Host notifications need no response.
    if (json_rpc::is_notification(message)) {
        return nullptr;
    }

    if (method.empty()) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_REQUEST, "Missing method");
    }
    if (method == "initialize") {
        return handle_initialize(request_id);
    }
    if (method == "launch") {
        return handle_launch(session, request_id, params);
    }
    if (method == "attach") {
        return handle_attach(session, request_id, params);
    }
    if (method == "restart") {
        return build_operation_response(request_id, session.restart());
    }
    if (method == "disconnect") {
        session.disconnect();
        shutdown_requested = true;
        return json_rpc::build_response(request_id, json::object());
    }

    return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND, "Unknown method: " + method);
}

} // namespace host_dispatch
