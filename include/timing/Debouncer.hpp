#pragma once

#include "events/Scheduler.hpp"
#include <chrono>
#include <functional>
#include <optional>

namespace cadence::timing {

/**
 * Delays an action until calls stop arriving for `delay`.
 *
 * Every run() replaces the pending action and restarts the delay, so for a
 * burst of calls only the last action executes, once. Earlier actions are
 * dropped silently.
 *
 * Typical use: a search box calls run() on every keystroke and the query is
 * committed only once the user stops typing.
 *
 * The Scheduler must outlive the Debouncer. Single-threaded.
 */
class Debouncer {
public:
    using Action = std::function<void()>;

    Debouncer(events::Scheduler& scheduler, std::chrono::milliseconds delay);
    ~Debouncer();

    Debouncer(const Debouncer&) = delete;
    Debouncer& operator=(const Debouncer&) = delete;

    void run(Action action);

    // Drops the pending action without running it. Safe when idle.
    void cancel();

    // Same as cancel(); the instance still accepts run() afterwards
    void dispose();

    [[nodiscard]] bool is_active() const;

    // Time left before the pending action fires, zero when idle
    [[nodiscard]] std::chrono::milliseconds remaining_time() const;

    std::chrono::milliseconds delay() const { return delay_; }

private:
    void on_timer();

    events::Scheduler& scheduler_;
    std::chrono::milliseconds delay_;
    std::optional<events::Scheduler::TimerId> timer_;
    Action pending_;
};

}  // namespace cadence::timing
