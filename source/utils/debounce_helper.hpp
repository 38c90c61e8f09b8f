#ifndef CDPDBG_DEBOUNCE_HELPER_HPP
#define CDPDBG_DEBOUNCE_HELPER_HPP

// Coalesces repeated UI notifications (pause overlay shown / cleared) so a
// quick pause -> resume -> pause does not flicker the page overlay.
// At most one action is pending at any time.

#include <chrono>
#include <functional>

#include "utils/event_loop.hpp"
#include "utils/session_events.hpp"

namespace debounce_helper {

static constexpr int DEFAULT_DEBOUNCE_MILLISECONDS = 200;

class DebounceHelper {
public:
    using Action = std::function<void()>;

    DebounceHelper(event_loop::TimerScheduler &scheduler, session_events::EventSink &events,
                   std::chrono::milliseconds delay = std::chrono::milliseconds(DEFAULT_DEBOUNCE_MILLISECONDS));
    ~DebounceHelper();

    DebounceHelper(const DebounceHelper &) = delete;
    DebounceHelper &operator=(const DebounceHelper &) = delete;

    // Arm action to run after the delay, replacing any action still pending.
    void schedule_or_replace(Action action);

    // Cancel the pending action (if any), then run action right now.
    void run_immediately_and_cancel_pending(const Action &action);

    // Drop the pending action without running anything.
    void cancel_pending();

    bool has_pending() const { return pending_timer_id != event_loop::INVALID_TIMER_ID; }

private:
    void run_guarded(const Action &action);

    event_loop::TimerScheduler &scheduler;
    session_events::EventSink &events;
    std::chrono::milliseconds delay;
    event_loop::TimerId pending_timer_id = event_loop::INVALID_TIMER_ID;
};

} // namespace debounce_helper

#endif // CDPDBG_DEBOUNCE_HELPER_HPP
