#include "events/Scheduler.hpp"
#include <algorithm>
#include <vector>

namespace cadence::events {

Scheduler::Scheduler(Clock& clock) : clock_(clock) {}

Scheduler::TimerId Scheduler::schedule_after(std::chrono::milliseconds delay, Task task) {
    delay = std::max(delay, std::chrono::milliseconds::zero());

    TimerId id = next_id_++;
    time_point deadline = clock_.now() + delay;
    timers_.emplace(Key{deadline, id}, std::move(task));
    deadlines_.emplace(id, deadline);
    return id;
}

bool Scheduler::cancel(TimerId id) {
    auto it = deadlines_.find(id);
    if (it == deadlines_.end()) return false;

    timers_.erase(Key{it->second, id});
    deadlines_.erase(it);
    return true;
}

void Scheduler::cancel_all() {
    timers_.clear();
    deadlines_.clear();
}

bool Scheduler::is_pending(TimerId id) const {
    return deadlines_.count(id) > 0;
}

std::optional<std::chrono::milliseconds> Scheduler::remaining(TimerId id) const {
    auto it = deadlines_.find(id);
    if (it == deadlines_.end()) return std::nullopt;

    auto left = std::chrono::ceil<std::chrono::milliseconds>(it->second - clock_.now());
    return std::max(left, std::chrono::milliseconds::zero());
}

std::optional<Scheduler::time_point> Scheduler::next_deadline() const {
    if (timers_.empty()) return std::nullopt;
    return timers_.begin()->first.first;
}

std::size_t Scheduler::process() {
    auto now = clock_.now();

    // Snapshot what is due now; tasks may arm or cancel timers while we run
    std::vector<TimerId> due;
    for (const auto& [key, task] : timers_) {
        if (key.first > now) break;
        due.push_back(key.second);
    }

    std::size_t fired = 0;
    for (TimerId id : due) {
        auto it = deadlines_.find(id);
        if (it == deadlines_.end()) continue;  // cancelled by an earlier task

        auto node = timers_.extract(Key{it->second, id});
        deadlines_.erase(it);

        ++fired;
        if (node.mapped()) {
            node.mapped()();
        }
    }
    return fired;
}

}  // namespace cadence::events
