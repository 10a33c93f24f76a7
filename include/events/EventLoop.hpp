#pragma once

#include "events/Scheduler.hpp"
#include <chrono>
#include <cstddef>

namespace cadence::events {

/**
 * Drives a Scheduler against its clock.
 *
 * run_for() and run_until_idle() block the calling thread (or, with a
 * ManualClock, just move time forward). Programs that also wait on file
 * descriptors use poll_timeout() and call Scheduler::process() themselves.
 */
class EventLoop {
public:
    explicit EventLoop(Scheduler& scheduler);

    // Returns the number of timers that fired during the window
    std::size_t run_for(std::chrono::milliseconds window);

    // Returns true if the scheduler went idle before the limit
    bool run_until_idle(std::chrono::milliseconds limit);

    void stop() { stop_requested_ = true; }

    // Milliseconds until the next timer, clamped to [0, cap]
    int poll_timeout(int cap_ms) const;

    Scheduler& scheduler() { return scheduler_; }

private:
    Scheduler& scheduler_;
    bool stop_requested_ = false;
};

}  // namespace cadence::events
