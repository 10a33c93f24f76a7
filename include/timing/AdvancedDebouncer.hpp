#pragma once

#include "events/Scheduler.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace cadence::timing {

class DebounceConfigError : public std::invalid_argument {
public:
    explicit DebounceConfigError(const std::string& msg) : std::invalid_argument(msg) {}
};

struct DebounceOptions {
    // Hard upper bound measured from the first call of a burst
    std::optional<std::chrono::milliseconds> max_wait;
    bool leading = false;   // Run on the first call of a burst
    bool trailing = true;   // Run once calls stop for `delay`
};

/**
 * Debouncer with leading-edge execution and a max-wait deadline.
 *
 * Burst lifecycle:
 *   - the first run() of a burst arms the deadline timer (if max_wait is
 *     set); later calls in the same burst leave it alone
 *   - every run() restarts the delay timer and replaces the pending action
 *   - with `leading`, the first call also runs the action immediately
 *   - delay fire runs the pending action if `trailing`
 *   - deadline fire runs the pending action regardless of edges
 *   - either fire, cancel() or dispose() ends the burst: both timers are
 *     cleared and the pending action dropped
 *
 * With leading and trailing both set, a single call runs twice: once
 * immediately and once when the delay elapses.
 *
 * The Scheduler must outlive the debouncer. Single-threaded.
 */
class AdvancedDebouncer {
public:
    using Action = std::function<void()>;

    // Throws DebounceConfigError if neither edge is enabled
    AdvancedDebouncer(events::Scheduler& scheduler,
                      std::chrono::milliseconds delay,
                      DebounceOptions options = {});
    ~AdvancedDebouncer();

    AdvancedDebouncer(const AdvancedDebouncer&) = delete;
    AdvancedDebouncer& operator=(const AdvancedDebouncer&) = delete;

    void run(Action action);
    void cancel();
    void dispose();

    // True while either the delay or the deadline timer is armed
    [[nodiscard]] bool is_active() const;

    bool has_invoked() const { return has_invoked_; }
    std::chrono::milliseconds delay() const { return delay_; }
    const DebounceOptions& options() const { return options_; }

private:
    void on_delay_elapsed();
    void on_max_wait_elapsed();
    void fire_and_reset();
    void reset();

    events::Scheduler& scheduler_;
    std::chrono::milliseconds delay_;
    DebounceOptions options_;

    std::optional<events::Scheduler::TimerId> delay_timer_;
    std::optional<events::Scheduler::TimerId> max_wait_timer_;
    bool has_invoked_ = false;
    Action pending_;
};

}  // namespace cadence::timing
