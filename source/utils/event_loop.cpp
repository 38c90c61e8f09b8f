#include "utils/event_loop.hpp"

#include <vector>

namespace event_loop {

TimerId EventLoop::schedule_after(std::chrono::milliseconds delay, TimerTask task) {
    TimerId timer_id = next_timer_id++;
    timers[timer_id] = Timer{Clock::now() + delay, std::move(task)};
    return timer_id;
}

bool EventLoop::cancel(TimerId timer_id) {
    return timers.erase(timer_id) > 0;
}

int EventLoop::run_due() {
    return run_due(Clock::now());
}

int EventLoop::run_due(Clock::time_point now) {
    // Collect first: a task may schedule or cancel timers while it runs.
    std::vector<TimerId> due_ids;
    for (const auto &entry : timers) {
        if (entry.second.deadline <= now) {
            due_ids.push_back(entry.first);
        }
    }

    int run_count = 0;
    for (TimerId timer_id : due_ids) {
        auto timer_iterator = timers.find(timer_id);
        if (timer_iterator == timers.end()) {
            // Cancelled by an earlier task in this pass.
            continue;
        }
        TimerTask task = std::move(timer_iterator->second.task);
        timers.erase(timer_iterator);
        task();
        run_count++;
    }
    return run_count;
}

int EventLoop::milliseconds_until_next(Clock::time_point now) const {
    if (timers.empty()) {
        return -1;
    }
    Clock::time_point earliest = timers.begin()->second.deadline;
    for (const auto &entry : timers) {
        if (entry.second.deadline < earliest) {
            earliest = entry.second.deadline;
        }
    }
    if (earliest <= now) {
        return 0;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(earliest - now).count();
    return static_cast<int>(remaining);
}

} // namespace event_loop
