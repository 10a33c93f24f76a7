#include "events/Clock.hpp"
#include <thread>

namespace cadence::events {

SteadyClock& SteadyClock::instance() {
    static SteadyClock instance;
    return instance;
}

Clock::time_point SteadyClock::now() const {
    return std::chrono::steady_clock::now();
}

void SteadyClock::sleep_until(time_point deadline) {
    std::this_thread::sleep_until(deadline);
}

void ManualClock::sleep_until(time_point deadline) {
    if (deadline > now_) {
        now_ = deadline;
    }
}

void ManualClock::advance(duration d) {
    if (d > duration::zero()) {
        now_ += d;
    }
}

}  // namespace cadence::events
