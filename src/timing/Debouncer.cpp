#include "timing/Debouncer.hpp"
#include "util/Logger.hpp"
#include <format>
#include <utility>

namespace cadence::timing {

Debouncer::Debouncer(events::Scheduler& scheduler, std::chrono::milliseconds delay)
    : scheduler_(scheduler), delay_(delay) {
    if (delay_ < std::chrono::milliseconds::zero()) {
        util::Logger::warn(std::format("Debouncer: negative delay {}ms clamped to 0", delay_.count()));
        delay_ = std::chrono::milliseconds::zero();
    }
}

Debouncer::~Debouncer() {
    cancel();
}

void Debouncer::run(Action action) {
    pending_ = std::move(action);

    if (timer_) {
        scheduler_.cancel(*timer_);
    }
    timer_ = scheduler_.schedule_after(delay_, [this] { on_timer(); });
}

void Debouncer::on_timer() {
    // Reset first: the action may throw, or call run() on us again
    timer_.reset();
    Action action = std::move(pending_);
    pending_ = nullptr;

    if (action) {
        action();
    }
}

void Debouncer::cancel() {
    if (timer_) {
        scheduler_.cancel(*timer_);
        timer_.reset();
    }
    pending_ = nullptr;
}

void Debouncer::dispose() {
    cancel();
}

bool Debouncer::is_active() const {
    return timer_ && scheduler_.is_pending(*timer_);
}

std::chrono::milliseconds Debouncer::remaining_time() const {
    if (!timer_) return std::chrono::milliseconds::zero();
    return scheduler_.remaining(*timer_).value_or(std::chrono::milliseconds::zero());
}

}  // namespace cadence::timing
