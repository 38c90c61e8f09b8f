#ifndef CDPDBG_EVENT_LOOP_HPP
#define CDPDBG_EVENT_LOOP_HPP

// Single-threaded timer scheduling.
// Nothing here spawns threads: the host loop calls run_due() between polls
// and every timer callback runs on that same thread.

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>

namespace event_loop {

using Clock = std::chrono::steady_clock;
using TimerId = uint64_t;
using TimerTask = std::function<void()>;

// Id never handed out by schedule_after().
constexpr TimerId INVALID_TIMER_ID = 0;

class TimerScheduler {
public:
    virtual ~TimerScheduler() = default;

    // Arm task to run once, delay after now. Returns its id.
    virtual TimerId schedule_after(std::chrono::milliseconds delay, TimerTask task) = 0;

    // Drop a pending timer. Returns false if it already ran or never existed.
    virtual bool cancel(TimerId timer_id) = 0;
};

class EventLoop : public TimerScheduler {
public:
    TimerId schedule_after(std::chrono::milliseconds delay, TimerTask task) override;
    bool cancel(TimerId timer_id) override;

    // Run every timer whose deadline is at or before now. Timers armed by a
    // running task are not run in the same pass. Returns the number run.
    int run_due();
    int run_due(Clock::time_point now);

    // Milliseconds until the earliest deadline (0 if overdue), or -1 if idle.
    int milliseconds_until_next(Clock::time_point now) const;

    size_t pending_count() const { return timers.size(); }

private:
    struct Timer {
        Clock::time_point deadline;
        TimerTask task;
    };

    // Ids increase monotonically, so iteration order breaks deadline ties
    // in scheduling order.
    std::map<TimerId, Timer> timers;
    TimerId next_timer_id = 1;
};

} // namespace event_loop

#endif // CDPDBG_EVENT_LOOP_HPP
