#include "engine/SchedulerService.hpp"

#include "utils/Log.hpp"

#include <exception>

namespace mp::engine
{

auto SchedulerService::schedule(std::chrono::milliseconds interval,
                                Callback callback, Clock::time_point now)
    -> TaskId
{
    if (interval <= std::chrono::milliseconds::zero())
    {
        interval = std::chrono::milliseconds(1);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    TaskId id = next_id_++;
    tasks_.push({id, interval, now + interval, std::move(callback)});
    active_.insert(id);
    return id;
}

bool SchedulerService::cancel(TaskId id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    // The heap entry is discarded lazily when it surfaces in tick().
    return active_.erase(id) > 0;
}

bool SchedulerService::is_scheduled(TaskId id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.contains(id);
}

std::size_t SchedulerService::task_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

std::size_t SchedulerService::tick(Clock::time_point now)
{
    std::size_t executed = 0;

    // Tasks due now; rescheduled ones land at now + interval and are not
    // picked up again in this pass.
    std::vector<Task> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        while (!tasks_.empty() && tasks_.top().next_run <= now)
        {
            Task task = tasks_.top();
            tasks_.pop();
            if (active_.contains(task.id))
            {
                due.push_back(std::move(task));
            }
        }
    }

    for (auto &task : due)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!active_.contains(task.id))
            {
                continue;
            }
        }
        if (task.callback)
        {
            try
            {
                task.callback();
            }
            catch (std::exception const &ex)
            {
                MP_LOG_ERROR("scheduled task {} failed: {}", task.id,
                             ex.what());
            }
            catch (...)
            {
                MP_LOG_ERROR("scheduled task {} failed with an unknown "
                             "exception",
                             task.id);
            }
            ++executed;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (active_.contains(task.id))
        {
            task.next_run = now + task.interval;
            tasks_.push(std::move(task));
        }
    }
    return executed;
}

std::chrono::milliseconds
SchedulerService::time_until_next_task(Clock::time_point now) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (tasks_.empty())
    {
        return std::chrono::hours(24); // Infinite sleep essentially
    }
    auto next = tasks_.top().next_run;
    if (now >= next)
        return std::chrono::milliseconds(0);
    return std::chrono::duration_cast<std::chrono::milliseconds>(next - now);
}

} // namespace mp::engine
