#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <unordered_set>
#include <vector>

namespace mp::engine
{

class SchedulerService
{
  public:
    using Clock = std::chrono::steady_clock;
    using TaskId = std::size_t;
    using Callback = std::function<void()>;

    // Registers a repeating task; the first run is one interval from `now`.
    TaskId schedule(std::chrono::milliseconds interval, Callback callback,
                    Clock::time_point now = Clock::now());

    // A cancelled task never runs again, even if it is already due.
    bool cancel(TaskId id);
    bool is_scheduled(TaskId id) const;
    std::size_t task_count() const;

    // Run pending tasks. Returns how many were executed.
    std::size_t tick(Clock::time_point now);

    // Helper for the main loop: "How long can I sleep before work is due?"
    std::chrono::milliseconds time_until_next_task(Clock::time_point now) const;

  private:
    struct Task
    {
        TaskId id;
        std::chrono::milliseconds interval;
        Clock::time_point next_run;
        Callback callback;

        // Min-heap priority queue needs > operator for smallest-first
        bool operator>(Task const &other) const
        {
            return next_run > other.next_run;
        }
    };

    mutable std::mutex mutex_;
    std::priority_queue<Task, std::vector<Task>, std::greater<Task>> tasks_;
    std::unordered_set<TaskId> active_;
    TaskId next_id_ = 1;
};

} // namespace mp::engine
