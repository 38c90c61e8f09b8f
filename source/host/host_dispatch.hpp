#ifndef CDPDBG_HOST_DISPATCH_HPP
#define CDPDBG_HOST_DISPATCH_HPP

// Routes host JSON-RPC requests to the session.
// Requests: initialize, launch, attach, disconnect, restart.

#include <nlohmann/json.hpp>
#include <string>

#include "session/session_errors.hpp"
#include "session/session_manager.hpp"

namespace host_dispatch {

using json = nlohmann::json;

static const char SERVER_NAME[] = "cdpdbg";
static const char SERVER_VERSION[] = "0.1.0";

// Dispatch a single JSON-RPC message. Returns the response JSON, or a null
// json value for notifications. Sets shutdown_requested after "disconnect".
json dispatch_message(session_manager::SessionManager &session, const json &message, bool &shutdown_requested);

// Map a session operation result onto a response for request_id.
json build_operation_response(const json &request_id, const session_errors::OperationResult &result);

// "terminated" notification carrying the reason the session ended.
json build_terminated_notification(const std::string &reason);

} // namespace host_dispatch

#endif // CDPDBG_HOST_DISPATCH_HPP
