#include "protocol/json_rpc.hpp"

namespace json_rpc {

static json envelope() {
    json message;
    message["jsonrpc"] = "2.0";
    return message;
}

json build_response(const json &request_id, const json &result_payload) {
    json response = envelope();
    response["id"] = request_id;
    response["result"] = result_payload.is_null() ? json::object() : result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response = envelope();
    response["id"] = request_id;
    response["error"] = {{"code", error_code}, {"message", error_message}};
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message, const json &error_data) {
    json response = build_error_response(request_id, error_code, error_message);
    response["error"]["data"] = error_data;
    return response;
}

json build_notification(const std::string &method, const json &params) {
    json notification = envelope();
    notification["method"] = method;
    notification["params"] = params;
    return notification;
}

std::string get_method(const json &message) {
    if (message.is_object() && message.contains("method") && message["method"].is_string()) {
        return message["method"].get<std::string>();
    }
    return "";
}

json get_id(const json &message) {
    // Only strings and numbers are valid ids; anything else answers as null.
    if (message.is_object() && message.contains("id") &&
        (message["id"].is_string() || message["id"].is_number())) {
        return message["id"];
    }
    return nullptr;
}

json get_params(const json &message) {
    if (message.is_object() && message.contains("params") && message["params"].is_object()) {
        return message["params"];
    }
    return json::object();
}

bool is_notification(const json &message) {
    return message.is_object() && !message.contains("id");
}

} // namespace json_rpc
