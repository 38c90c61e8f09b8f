#ifndef CDPDBG_JSON_RPC_HPP
#define CDPDBG_JSON_RPC_HPP

// JSON-RPC 2.0 envelopes exchanged with the host over stdio.

#include <nlohmann/json.hpp>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// Outgoing

json build_response(const json &request_id, const json &result_payload);
json build_error_response(const json &request_id, int error_code, const std::string &error_message);
// error_data lands in error.data (e.g. {kind, detail} for session failures).
json build_error_response(const json &request_id, int error_code, const std::string &error_message,
                          const json &error_data);
// Host-bound notification such as "terminated"; carries no id.
json build_notification(const std::string &method, const json &params);

// Incoming

// "" when absent or not a string.
std::string get_method(const json &message);
// String or number id; null otherwise.
json get_id(const json &message);
// {} when absent.
json get_params(const json &message);
bool is_notification(const json &message);

} // namespace json_rpc

#endif // CDPDBG_JSON_RPC_HPP
