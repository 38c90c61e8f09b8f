#include "utils/debounce_helper.hpp"

#include <exception>
#include <string>

namespace debounce_helper {

DebounceHelper::DebounceHelper(event_loop::TimerScheduler &scheduler, session_events::EventSink &events,
                               std::chrono::milliseconds delay)
    : scheduler(scheduler), events(events), delay(delay) {}

DebounceHelper::~DebounceHelper() {
    cancel_pending();
}

void DebounceHelper::schedule_or_replace(Action action) {
    cancel_pending();
    pending_timer_id = scheduler.schedule_after(delay, [this, action]() {
        pending_timer_id = event_loop::INVALID_TIMER_ID;
        run_guarded(action);
    });
}

void DebounceHelper::run_immediately_and_cancel_pending(const Action &action) {
    cancel_pending();
    run_guarded(action);
}

void DebounceHelper::cancel_pending() {
    if (pending_timer_id != event_loop::INVALID_TIMER_ID) {
        scheduler.cancel(pending_timer_id);
        pending_timer_id = event_loop::INVALID_TIMER_ID;
    }
}

void DebounceHelper::run_guarded(const Action &action) {
    if (!action) {
        return;
    }
    // Best-effort UI hint: a failing action must not take the session down.
    try {
        action();
    } catch (const std::exception &error) {
        events.warning("debounce.action_failed", "Debounced action failed: " + std::string(error.what()));
    } catch (...) {
        events.warning("debounce.action_failed", "Debounced action failed with a non-standard exception");
    }
}

} // namespace debounce_helper
