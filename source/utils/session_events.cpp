#include "utils/session_events.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>

namespace session_events {

const char *severity_name(Severity severity) {
    switch (severity) {
    case Severity::Debug:
        return "debug";
    case Severity::Info:
        return "info";
    case Severity::Warning:
        return "warning";
    case Severity::Error:
        return "error";
    }
    return "info";
}

static Event make_event(Severity severity, const std::string &name, const std::string &message,
                        const json &fields) {
    Event event;
    event.severity = severity;
    event.name = name;
    event.message = message;
    event.fields = fields;
    return event;
}

void EventSink::debug(const std::string &name, const std::string &message, const json &fields) {
    emit(make_event(Severity::Debug, name, message, fields));
}

void EventSink::info(const std::string &name, const std::string &message, const json &fields) {
    emit(make_event(Severity::Info, name, message, fields));
}

void EventSink::warning(const std::string &name, const std::string &message, const json &fields) {
    emit(make_event(Severity::Warning, name, message, fields));
}

void EventSink::error(const std::string &name, const std::string &message, const json &fields) {
    emit(make_event(Severity::Error, name, message, fields));
}

void LogEventSink::emit(const Event &event) {
    std::string line = event.message;
    if (!event.fields.empty()) {
        line += " " + event.fields.dump();
    }
    if (event.severity == Severity::Debug) {
        debug_log::log(event.name + ": " + line);
        return;
    }
    if (event.severity == Severity::Info) {
        debug_log::log_always(line);
        return;
    }
    debug_log::log_always(std::string(severity_name(event.severity)) + ": " + line);
}

void RecordingEventSink::emit(const Event &event) {
    recorded_events.push_back(event);
}

bool RecordingEventSink::contains(const std::string &name) const {
    return count(name) > 0;
}

size_t RecordingEventSink::count(const std::string &name) const {
    return static_cast<size_t>(std::count_if(recorded_events.begin(), recorded_events.end(),
                                             [&name](const Event &event) { return event.name == name; }));
}

} // namespace session_events
