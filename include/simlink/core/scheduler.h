#pragma once
/**
 * @file scheduler.h
 * @brief Single-threaded timer queue
 *
 * Timers never fire on their own: run_due() executes every task whose
 * deadline has passed, on the calling thread. Orchestrator::poll() calls it
 * after draining inbound transport events. The clock is injectable so tests
 * can advance time deterministically.
 */

#include "simlink/core/types.h"
#include <functional>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>

namespace simlink::core {

class Scheduler {
public:
    using ClockFn = std::function<TimePoint()>;
    using Task = std::function<void()>;

    /// Uses the steady clock
    Scheduler();

    explicit Scheduler(ClockFn clock);

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Run a task once after a delay
     * @return Timer ID for cancel()
     */
    TimerId call_after(Milliseconds delay, Task task);

    /**
     * @brief Cancel a pending timer
     * @return true if the timer was pending
     */
    bool cancel(TimerId id);

    /**
     * @brief Run every task whose deadline is at or before now
     *
     * Tasks scheduled by a running task are not run in the same pass, even
     * with a zero delay.
     *
     * @return Number of tasks executed
     */
    SizeT run_due();

    bool is_pending(TimerId id) const { return index_.count(id) != 0; }
    SizeT pending() const { return timers_.size(); }
    std::optional<TimePoint> next_deadline() const;
    TimePoint now() const { return clock_(); }

private:
    using Key = std::pair<TimePoint, TimerId>;

    ClockFn clock_;
    TimerId next_id_{1};
    std::map<Key, Task> timers_;
    std::unordered_map<TimerId, Key> index_;
};

} // namespace simlink::core
