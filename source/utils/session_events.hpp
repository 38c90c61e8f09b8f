#ifndef CDPDBG_SESSION_EVENTS_HPP
#define CDPDBG_SESSION_EVENTS_HPP

// Structured diagnostic events.
// Components that need to report progress or warnings take an EventSink
// reference instead of writing to stderr themselves, so tests can record
// what was emitted.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace session_events {

using json = nlohmann::json;

enum class Severity {
    Debug,
    Info,
    Warning,
    Error
};

const char *severity_name(Severity severity);

// One emitted event: a dotted name (e.g. "spawn.command") plus free-form fields.
struct Event {
    Severity severity = Severity::Info;
    std::string name;
    std::string message;
    json fields = json::object();
};

class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void emit(const Event &event) = 0;

    void debug(const std::string &name, const std::string &message, const json &fields = json::object());
    void info(const std::string &name, const std::string &message, const json &fields = json::object());
    void warning(const std::string &name, const std::string &message, const json &fields = json::object());
    void error(const std::string &name, const std::string &message, const json &fields = json::object());
};

// Default sink: Debug events go through debug_log::log (CDPDBG_DEBUG gated),
// everything else is always written to stderr.
class LogEventSink : public EventSink {
public:
    void emit(const Event &event) override;
};

// Keeps every event in memory. Used by tests and by callers that want to
// inspect diagnostics after an operation.
class RecordingEventSink : public EventSink {
public:
    void emit(const Event &event) override;

    const std::vector<Event> &events() const { return recorded_events; }
    bool contains(const std::string &name) const;
    size_t count(const std::string &name) const;

private:
    std::vector<Event> recorded_events;
};

} // namespace session_events

#endif // CDPDBG_SESSION_EVENTS_HPP
