#pragma once

#include <functional>
#include <map>
#include <cstdint>
#include <cstddef>

namespace peerq {

using TimerId = uint64_t;

/**
 * Timer wheel for the single event context.
 *
 * Nothing runs on its own: the owner calls run_due() from its loop and
 * every timer whose deadline has passed fires inline. Repeating timers are
 * re-armed from their previous deadline so they do not drift.
 */
class Scheduler {
public:
    // Monotonic time in seconds
    using Clock = std::function<double()>;
    using Callback = std::function<void()>;

    /**
     * @param clock Time source; defaults to std::chrono::steady_clock
     */
    explicit Scheduler(Clock clock = Clock());

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * Run `callback` after `delay` seconds, and then every `delay` seconds
     * when `repeat` is set.
     * @return Timer ID, never 0
     */
    TimerId schedule(double delay, Callback callback, bool repeat = false);

    // Unknown or already fired IDs (and 0) are ignored
    void cancel(TimerId id);

    /**
     * Fire every timer due at the time of the call. A repeating timer
     * fires at most once per call.
     * @return Number of callbacks run
     */
    size_t run_due();

    double now() const;

    // Seconds until the next deadline, or -1 when nothing is scheduled
    double time_until_next() const;

    bool is_scheduled(TimerId id) const { return timers_.count(id) > 0; }
    size_t pending_count() const { return timers_.size(); }

    void clear() { timers_.clear(); }

private:
    struct Timer {
        double due;
        double interval;
        bool repeat;
        Callback callback;
    };

    Clock clock_;
    TimerId next_id_;
    std::map<TimerId, Timer> timers_;
};

} // namespace peerq
