#pragma once

#include "events/Clock.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>

namespace cadence::events {

/**
 * One-shot timer service for a single-threaded event loop.
 *
 * Nothing fires on its own: the owner calls process() (directly or through
 * EventLoop) and every timer whose deadline has passed runs on that thread.
 * Not thread-safe.
 */
class Scheduler {
public:
    using Task = std::function<void()>;
    using TimerId = std::uint64_t;
    using time_point = Clock::time_point;

    explicit Scheduler(Clock& clock = SteadyClock::instance());

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    TimerId schedule_after(std::chrono::milliseconds delay, Task task);

    // Returns false when the timer already fired or was never armed
    bool cancel(TimerId id);
    void cancel_all();

    [[nodiscard]] bool is_pending(TimerId id) const;
    [[nodiscard]] std::optional<std::chrono::milliseconds> remaining(TimerId id) const;
    [[nodiscard]] std::optional<time_point> next_deadline() const;
    [[nodiscard]] std::size_t pending_count() const { return deadlines_.size(); }

    /**
     * Fire every timer that is due right now.
     *
     * A timer is disarmed before its task runs. Timers armed while this
     * call is running wait for the next process(). An exception thrown by a
     * task propagates; timers not yet reached stay armed.
     *
     * @return number of tasks that ran
     */
    std::size_t process();

    Clock& clock() const { return clock_; }

private:
    // Ordered by deadline, then by arming order
    using Key = std::pair<time_point, TimerId>;

    Clock& clock_;
    TimerId next_id_ = 1;
    std::map<Key, Task> timers_;
    std::unordered_map<TimerId, time_point> deadlines_;
};

}  // namespace cadence::events
