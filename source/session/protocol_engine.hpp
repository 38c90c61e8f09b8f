#ifndef CDPDBG_PROTOCOL_ENGINE_HPP
#define CDPDBG_PROTOCOL_ENGINE_HPP

// The CDP side of a debug session as the lifecycle manager needs it.
// CdpProtocolEngine talks to a real browser; tests substitute a fake.

#include <nlohmann/json.hpp>
#include <functional>
#include <string>

namespace protocol_engine {

using json = nlohmann::json;

struct AttachRequest {
    int port = 0;
    std::string address;
    // Prefer the page target whose URL starts with this; empty picks the first page.
    std::string target_url;
    int timeout_milliseconds = 10000;
};

struct CommandResult {
    bool success = false;
    json value;                // CDP "result" object on success
    std::string error_detail;
};

// Protocol events forwarded to the session. Handlers are invoked from
// service(), never from inside another engine call.
struct EngineEventHandlers {
    std::function<void()> on_paused;
    std::function<void()> on_resumed;
    // The target went away (tab closed, browser exited, detached elsewhere).
    std::function<void(const std::string &reason)> on_target_closed;
};

class ProtocolEngine {
public:
    virtual ~ProtocolEngine() = default;

    virtual CommandResult attach(const AttachRequest &request) = 0;
    virtual CommandResult detach() = 0;

    // Runtime.evaluate in the attached target; value holds the RemoteObject.
    virtual CommandResult evaluate(const std::string &expression) = 0;

    // "<domain>.enable" on the attached target.
    virtual CommandResult enable_domain(const std::string &domain) = 0;

    virtual CommandResult send_command(const std::string &method, const json &params) = 0;

    virtual void set_event_handlers(EngineEventHandlers handlers) = 0;

    // Process pending protocol traffic for up to timeout_milliseconds and
    // dispatch queued events.
    virtual void service(int timeout_milliseconds) = 0;

    virtual bool is_attached() const = 0;
};

} // namespace protocol_engine

#endif // CDPDBG_PROTOCOL_ENGINE_HPP
