#include "scheduler.h"
#include <algorithm>
#include <chrono>
#include <utility>
#include <vector>

namespace peerq {

Scheduler::Scheduler(Clock clock) : clock_(std::move(clock)), next_id_(1) {
    if (!clock_) {
        auto epoch = std::chrono::steady_clock::now();
        clock_ = [epoch]() {
            return std::chrono::duration<double>(std::chrono::steady_clock::now() - epoch).count();
        };
    }
}

TimerId Scheduler::schedule(double delay, Callback callback, bool repeat) {
    TimerId id = next_id_++;
    if (delay < 0) {
        delay = 0;
    }
    timers_[id] = Timer{now() + delay, delay, repeat, std::move(callback)};
    return id;
}

void Scheduler::cancel(TimerId id) {
    if (id == 0) {
        return;
    }
    timers_.erase(id);
}

size_t Scheduler::run_due() {
    double current_time = now();

    // Snapshot deadlines first; callbacks may schedule or cancel timers
    std::vector<std::pair<double, TimerId>> due;
    for (const auto& entry : timers_) {
        if (entry.second.due <= current_time) {
            due.emplace_back(entry.second.due, entry.first);
        }
    }
    std::sort(due.begin(), due.end());

    size_t fired = 0;
    for (const auto& item : due) {
        auto it = timers_.find(item.second);
        if (it == timers_.end()) {
            continue;  // cancelled by an earlier callback
        }

        Callback callback = it->second.callback;
        if (it->second.repeat && it->second.interval > 0) {
            it->second.due += it->second.interval;
            if (it->second.due <= current_time) {
                it->second.due = current_time + it->second.interval;
            }
        } else {
            timers_.erase(it);
        }

        callback();
        fired++;
    }

    return fired;
}

double Scheduler::now() const {
    return clock_();
}

double Scheduler::time_until_next() const {
    if (timers_.empty()) {
        return -1;
    }

    double next_due = timers_.begin()->second.due;
    for (const auto& entry : timers_) {
        next_due = std::min(next_due, entry.second.due);
    }
    return std::max(0.0, next_due - now());
}

} // namespace peerq
