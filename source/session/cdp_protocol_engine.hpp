#ifndef CDPDBG_CDP_PROTOCOL_ENGINE_HPP
#define CDPDBG_CDP_PROTOCOL_ENGINE_HPP

// CDP (Chrome DevTools Protocol) engine over libwebsockets.
// Discovers the browser endpoint through http://<address>:<port>/json/version,
// opens the browser WebSocket, attaches to a page target with a flattened
// session and forwards pause/resume/detach events to the session.

#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <string>
#include <vector>

#include "session/protocol_engine.hpp"
#include "utils/session_events.hpp"

struct lws_context;
struct lws;

namespace cdp_protocol_engine {

using json = nlohmann::json;

static constexpr int DEFAULT_COMMAND_TIMEOUT_MILLISECONDS = 10000;

// Splits "ws://host:port/path". Returns false if the port is not a number.
bool parse_websocket_url(const std::string &websocket_url, std::string &output_host, int &output_port,
                         std::string &output_path);

// Turn a raw CDP response into a CommandResult: a string "error" (local
// failure) or an object "error" (CDP failure) fail, otherwise "result" is
// the value.
protocol_engine::CommandResult to_command_result(const json &response);

// Page target to attach to: first page whose URL starts with target_url,
// else the first page. Returns "" if targetInfos holds no page.
std::string choose_page_target(const json &target_infos, const std::string &target_url);

class CdpProtocolEngine : public protocol_engine::ProtocolEngine {
public:
    explicit CdpProtocolEngine(session_events::EventSink &events);
    ~CdpProtocolEngine() override;

    CdpProtocolEngine(const CdpProtocolEngine &) = delete;
    CdpProtocolEngine &operator=(const CdpProtocolEngine &) = delete;

    protocol_engine::CommandResult attach(const protocol_engine::AttachRequest &request) override;
    protocol_engine::CommandResult detach() override;
    protocol_engine::CommandResult evaluate(const std::string &expression) override;
    protocol_engine::CommandResult enable_domain(const std::string &domain) override;
    protocol_engine::CommandResult send_command(const std::string &method, const json &params) override;
    void set_event_handlers(protocol_engine::EngineEventHandlers handlers) override;
    void service(int timeout_milliseconds) override;
    bool is_attached() const override;

    // Entry point for the libwebsockets callback.
    int handle_callback(struct lws *websocket_instance, int reason, void *incoming_data, size_t incoming_length);

private:
    enum class Phase {
        Idle,
        Http,
        WebSocket
    };

    enum class QueuedEventType {
        Paused,
        Resumed,
        TargetClosed
    };

    struct QueuedEvent {
        QueuedEventType type;
        std::string reason;
    };

    // State of the CDP connection.
    struct ConnectionState {
        Phase phase = Phase::Idle;
        bool connected = false;
        bool connection_failed = false;
        bool detaching = false;
        struct lws_context *websocket_context = nullptr;
        struct lws *websocket_connection = nullptr;

        // Endpoint discovery (HTTP GET /json/version).
        bool http_completed = false;
        bool http_failed = false;
        std::string http_body;

        // CDP message ID counter (incremented for each request).
        int next_message_id = 1;

        std::string current_target_id;
        std::string current_session_id;

        // Pending request map: message id -> response JSON (filled when response arrives).
        std::map<int, json> pending_responses;

        // Buffer for incoming WebSocket data.
        std::string receive_buffer;

        std::vector<QueuedEvent> queued_events;
    };

    bool create_context();
    void destroy_context();
    bool http_get(const std::string &host, int port, const std::string &path, int timeout_milliseconds,
                  std::string &output_body, std::string &error_detail);
    bool discover_browser_websocket_url(const protocol_engine::AttachRequest &request,
                                        std::chrono::steady_clock::time_point deadline,
                                        std::string &output_url, std::string &error_detail);
    bool connect_websocket(const std::string &websocket_url, int timeout_milliseconds, std::string &error_detail);
    json send_raw_command(const std::string &method, const json &params, const std::string &session_id,
                          int timeout_milliseconds = DEFAULT_COMMAND_TIMEOUT_MILLISECONDS);
    void handle_message(const json &message);

    session_events::EventSink &events;
    protocol_engine::EngineEventHandlers handlers;
    ConnectionState state;
};

} // namespace cdp_protocol_engine

#endif // CDPDBG_CDP_PROTOCOL_ENGINE_HPP
