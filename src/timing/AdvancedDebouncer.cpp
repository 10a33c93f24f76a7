#include "timing/AdvancedDebouncer.hpp"
#include "util/Logger.hpp"
#include <format>
#include <utility>

namespace cadence::timing {

AdvancedDebouncer::AdvancedDebouncer(events::Scheduler& scheduler,
                                     std::chrono::milliseconds delay,
                                     DebounceOptions options)
    : scheduler_(scheduler), delay_(delay), options_(std::move(options)) {
    if (!options_.leading && !options_.trailing) {
        throw DebounceConfigError("AdvancedDebouncer: at least one of leading or trailing must be true");
    }

    const auto zero = std::chrono::milliseconds::zero();
    if (delay_ < zero) {
        util::Logger::warn(std::format("AdvancedDebouncer: negative delay {}ms clamped to 0", delay_.count()));
        delay_ = zero;
    }
    if (options_.max_wait) {
        if (*options_.max_wait < zero) {
            util::Logger::warn(std::format("AdvancedDebouncer: negative max_wait {}ms clamped to 0",
                                           options_.max_wait->count()));
            options_.max_wait = zero;
        }
        if (*options_.max_wait < delay_) {
            // Allowed, but then the delay timer can never win
            util::Logger::warn(std::format("AdvancedDebouncer: max_wait {}ms is shorter than delay {}ms",
                                           options_.max_wait->count(), delay_.count()));
        }
    }

    util::Logger::debug(std::format("AdvancedDebouncer: delay={}ms max_wait={} leading={} trailing={}",
        delay_.count(),
        options_.max_wait ? std::to_string(options_.max_wait->count()) + "ms" : "none",
        options_.leading, options_.trailing));
}

AdvancedDebouncer::~AdvancedDebouncer() {
    reset();
}

void AdvancedDebouncer::run(Action action) {
    pending_ = std::move(action);

    const bool fire_leading = options_.leading && !has_invoked_;

    if (delay_timer_) {
        scheduler_.cancel(*delay_timer_);
    }
    delay_timer_ = scheduler_.schedule_after(delay_, [this] { on_delay_elapsed(); });

    if (options_.max_wait && !max_wait_timer_) {
        max_wait_timer_ = scheduler_.schedule_after(*options_.max_wait, [this] { on_max_wait_elapsed(); });
    }

    if (fire_leading) {
        // Mark before running so a nested run() from the action cannot fire
        // the leading edge a second time. Run a copy: a nested run() replaces
        // pending_ while this one is still executing.
        has_invoked_ = true;
        Action action_copy = pending_;
        if (action_copy) {
            action_copy();
        }
    }
}

void AdvancedDebouncer::on_delay_elapsed() {
    delay_timer_.reset();  // Already disarmed by the scheduler

    if (options_.trailing && pending_) {
        fire_and_reset();
    } else {
        reset();
    }
}

void AdvancedDebouncer::on_max_wait_elapsed() {
    max_wait_timer_.reset();

    if (pending_) {
        fire_and_reset();
    } else {
        reset();
    }
}

void AdvancedDebouncer::fire_and_reset() {
    // The burst is over before the action runs, so a throwing action leaves
    // us idle and an action calling run() starts a fresh burst
    Action action = std::move(pending_);
    reset();
    action();
}

void AdvancedDebouncer::reset() {
    if (delay_timer_) {
        scheduler_.cancel(*delay_timer_);
        delay_timer_.reset();
    }
    if (max_wait_timer_) {
        scheduler_.cancel(*max_wait_timer_);
        max_wait_timer_.reset();
    }
    has_invoked_ = false;
    pending_ = nullptr;
}

void AdvancedDebouncer::cancel() {
    if (is_active()) {
        util::Logger::debug("AdvancedDebouncer: cancelling pending burst");
    }
    reset();
}

void AdvancedDebouncer::dispose() {
    cancel();
}

bool AdvancedDebouncer::is_active() const {
    return (delay_timer_ && scheduler_.is_pending(*delay_timer_)) ||
           (max_wait_timer_ && scheduler_.is_pending(*max_wait_timer_));
}

}  // namespace cadence::timing
