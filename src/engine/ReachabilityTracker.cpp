#include "engine/ReachabilityTracker.hpp"

#include "engine/AsyncTaskService.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/MeshTransport.hpp"
#include "engine/PresenceUtils.hpp"
#include "engine/Stores.hpp"
#include "utils/Log.hpp"

#include <exception>
#include <future>
#include <unordered_set>
#include <utility>

namespace mp::engine
{

ReachabilityTracker::ReachabilityTracker(AnnounceStore &store,
                                         MeshTransport &transport,
                                         SchedulerService &scheduler,
                                         AsyncTaskService &fetch_worker,
                                         EventBus *bus, Options options)
    : store_(store), transport_(transport), scheduler_(scheduler),
      fetch_worker_(fetch_worker), bus_(bus), options_(std::move(options))
{
}

ReachabilityTracker::~ReachabilityTracker()
{
    stop();
}

void ReachabilityTracker::start(std::chrono::milliseconds interval)
{
    std::lock_guard<std::mutex> lock(timer_mutex_);
    if (task_id_ && scheduler_.is_scheduled(*task_id_))
    {
        return;
    }
    task_id_.reset();
    if (interval <= std::chrono::milliseconds::zero())
    {
        MP_LOG_DEBUG("periodic reachability disabled");
        return;
    }
    task_id_ = scheduler_.schedule(interval, [this] { recompute(); });
    MP_LOG_DEBUG("periodic reachability every {} ms", interval.count());
}

void ReachabilityTracker::stop()
{
    std::lock_guard<std::mutex> lock(timer_mutex_);
    if (task_id_)
    {
        scheduler_.cancel(*task_id_);
        task_id_.reset();
    }
}

void ReachabilityTracker::restart(std::chrono::milliseconds interval)
{
    stop();
    start(interval);
}

bool ReachabilityTracker::is_periodic() const
{
    std::lock_guard<std::mutex> lock(timer_mutex_);
    return task_id_ && scheduler_.is_scheduled(*task_id_);
}

std::optional<int> ReachabilityTracker::recompute()
{
    std::lock_guard<std::mutex> serial(recompute_mutex_);
    last_recompute_ = SchedulerService::Clock::now();

    auto status = transport_.network_status();
    if (status != NetworkStatus::Ready)
    {
        MP_LOG_DEBUG("reachability skipped: network {}", to_string(status));
        return std::nullopt;
    }

    auto const opts = options();
    PathTable reachable;
    try
    {
        auto fetched = fetch_path_table(opts.fetch_timeout);
        if (!fetched)
        {
            MP_LOG_WARN("path table fetch timed out after {} ms",
                        opts.fetch_timeout.count());
            return std::nullopt;
        }
        reachable = std::move(*fetched);
    }
    catch (std::exception const &ex)
    {
        MP_LOG_WARN("path table fetch failed: {}", ex.what());
        return std::nullopt;
    }

    auto known = store_.peer_ids_by_node_types(opts.node_types);
    if (!known)
    {
        MP_LOG_WARN("known peer query failed; keeping reachable count {}",
                    count_.get());
        return std::nullopt;
    }

    int reachable_count = 0;
    auto const &smaller = known->size() <= reachable.size() ? *known : reachable;
    auto const &larger = known->size() <= reachable.size() ? reachable : *known;
    for (auto const &peer : smaller)
    {
        if (larger.contains(peer))
        {
            ++reachable_count;
        }
    }

    if (count_.set(reachable_count))
    {
        MP_LOG_DEBUG("reachable peers: {} of {} known", reachable_count,
                     known->size());
        if (bus_ != nullptr)
        {
            bus_->publish(ReachabilityChangedEvent{reachable_count});
        }
    }
    return reachable_count;
}

auto ReachabilityTracker::fetch_path_table(std::chrono::milliseconds timeout)
    -> std::optional<PathTable>
{
    std::shared_future<PathTable> pending;
    {
        std::lock_guard<std::mutex> lock(fetch_mutex_);
        // A leftover fetch that has finished since it timed out is stale.
        if (!in_flight_ || in_flight_->wait_for(std::chrono::seconds::zero()) ==
                               std::future_status::ready)
        {
            in_flight_ = fetch_worker_
                             .run_task([this]
                                       { return transport_.path_table_snapshot(); })
                             .share();
        }
        else
        {
            MP_LOG_DEBUG("waiting on the outstanding path table fetch");
        }
        pending = *in_flight_;
    }
    if (pending.wait_for(timeout) != std::future_status::ready)
    {
        return std::nullopt;
    }
    {
        std::lock_guard<std::mutex> lock(fetch_mutex_);
        in_flight_.reset();
    }
    return pending.get();
}

bool ReachabilityTracker::fetch_in_flight() const
{
    std::lock_guard<std::mutex> lock(fetch_mutex_);
    return in_flight_ && in_flight_->wait_for(std::chrono::seconds::zero()) !=
                             std::future_status::ready;
}

std::optional<int> ReachabilityTracker::request_eager_recompute()
{
    if (fetch_in_flight())
    {
        MP_LOG_DEBUG("eager reachability skipped: path table fetch pending");
        return std::nullopt;
    }
    auto const window = options().coalesce_window;
    if (window > std::chrono::milliseconds::zero())
    {
        std::lock_guard<std::mutex> serial(recompute_mutex_);
        if (last_recompute_ &&
            SchedulerService::Clock::now() - *last_recompute_ < window)
        {
            return std::nullopt;
        }
    }
    return recompute();
}

void ReachabilityTracker::set_node_types(std::vector<NodeType> types)
{
    std::lock_guard<std::mutex> lock(options_mutex_);
    options_.node_types = std::move(types);
}

void ReachabilityTracker::set_fetch_timeout(std::chrono::milliseconds timeout)
{
    std::lock_guard<std::mutex> lock(options_mutex_);
    options_.fetch_timeout = timeout;
}

void ReachabilityTracker::set_coalesce_window(std::chrono::milliseconds window)
{
    std::lock_guard<std::mutex> lock(options_mutex_);
    options_.coalesce_window = window;
}

auto ReachabilityTracker::options() const -> Options
{
    std::lock_guard<std::mutex> lock(options_mutex_);
    return options_;
}

} // namespace mp::engine
