#pragma once

#include <chrono>

namespace cadence::events {

/**
 * Time source for the Scheduler and EventLoop.
 *
 * SteadyClock is the real thing. ManualClock only moves when told to,
 * so timer tests do not depend on wall-clock sleeps.
 */
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;

    virtual time_point now() const = 0;
    virtual void sleep_until(time_point deadline) = 0;
};

class SteadyClock : public Clock {
public:
    static SteadyClock& instance();

    time_point now() const override;
    void sleep_until(time_point deadline) override;
};

class ManualClock : public Clock {
public:
    ManualClock() = default;

    time_point now() const override { return now_; }

    // Jumps straight to the deadline (never backwards)
    void sleep_until(time_point deadline) override;

    void advance(duration d);

private:
    time_point now_{std::chrono::hours(1)};
};

}  // namespace cadence::events
