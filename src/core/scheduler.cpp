/**
 * @file scheduler.cpp
 * @brief Timer queue implementation
 */

#include "simlink/core/scheduler.h"

namespace simlink::core {

Scheduler::Scheduler()
    : clock_([] { return Clock::now(); }) {
}

Scheduler::Scheduler(ClockFn clock)
    : clock_(std::move(clock)) {
}

TimerId Scheduler::call_after(Milliseconds delay, Task task) {
    if (!task) {
        return INVALID_TIMER_ID;
    }
    if (delay.count() < 0) {
        delay = Milliseconds{0};
    }

    TimerId id = next_id_++;
    Key key{clock_() + delay, id};
    timers_.emplace(key, std::move(task));
    index_.emplace(id, key);
    return id;
}

bool Scheduler::cancel(TimerId id) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return false;
    }
    timers_.erase(it->second);
    index_.erase(it);
    return true;
}

SizeT Scheduler::run_due() {
    const TimePoint now = clock_();
    const TimerId last_id = next_id_;
    SizeT executed = 0;

    auto it = timers_.begin();
    while (it != timers_.end() && it->first.first <= now) {
        if (it->first.second >= last_id) {
            ++it;
            continue;
        }

        Task task = std::move(it->second);
        index_.erase(it->first.second);
        timers_.erase(it);

        task();
        ++executed;

        // The task may have added or cancelled timers
        it = timers_.begin();
    }

    return executed;
}

std::optional<TimePoint> Scheduler::next_deadline() const {
    if (timers_.empty()) {
        return std::nullopt;
    }
    return timers_.begin()->first.first;
}

} // namespace simlink::core
