#include "events/EventLoop.hpp"
#include <algorithm>

namespace cadence::events {

EventLoop::EventLoop(Scheduler& scheduler) : scheduler_(scheduler) {}

std::size_t EventLoop::run_for(std::chrono::milliseconds window) {
    auto& clock = scheduler_.clock();
    auto end = clock.now() + std::max(window, std::chrono::milliseconds::zero());
    std::size_t fired = 0;

    stop_requested_ = false;
    while (!stop_requested_) {
        fired += scheduler_.process();
        if (stop_requested_) break;

        auto now = clock.now();
        if (now >= end) break;

        auto wake = end;
        if (auto next = scheduler_.next_deadline(); next && *next < wake) {
            wake = *next;
        }
        if (wake > now) {
            clock.sleep_until(wake);
        }
    }
    return fired;
}

bool EventLoop::run_until_idle(std::chrono::milliseconds limit) {
    auto& clock = scheduler_.clock();
    auto end = clock.now() + std::max(limit, std::chrono::milliseconds::zero());

    stop_requested_ = false;
    while (!stop_requested_) {
        scheduler_.process();

        auto next = scheduler_.next_deadline();
        if (!next) return true;

        auto now = clock.now();
        if (now >= end) break;

        auto wake = std::min(*next, end);
        if (wake > now) {
            clock.sleep_until(wake);
        }
    }
    return scheduler_.pending_count() == 0;
}

int EventLoop::poll_timeout(int cap_ms) const {
    auto next = scheduler_.next_deadline();
    if (!next) return cap_ms;

    auto left = std::chrono::ceil<std::chrono::milliseconds>(*next - scheduler_.clock().now());
    return static_cast<int>(std::clamp<long long>(left.count(), 0, cap_ms));
}

}  // namespace cadence::events
