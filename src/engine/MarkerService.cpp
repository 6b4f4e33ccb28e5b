#include "engine/MarkerService.hpp"

#include "engine/MarkerFreshness.hpp"
#include "engine/PresenceUtils.hpp"
#include "engine/Stores.hpp"
#include "utils/Log.hpp"

#include <utility>

namespace mp::engine
{

MarkerService::MarkerService(LocationStore &locations,
                             AnnounceStore &announces,
                             ContactDirectory &contacts,
                             SchedulerService &scheduler, WallClock clock)
    : locations_(locations), announces_(announces), contacts_(contacts),
      scheduler_(scheduler),
      clock_(clock ? std::move(clock) : WallClock([] { return Clock::now(); }))
{
}

MarkerService::~MarkerService()
{
    stop();
}

void MarkerService::start(std::chrono::milliseconds interval)
{
    std::lock_guard<std::mutex> lock(timer_mutex_);
    if (task_id_ && scheduler_.is_scheduled(*task_id_))
    {
        return;
    }
    task_id_.reset();
    if (interval <= std::chrono::milliseconds::zero())
    {
        return;
    }
    // Markers age with the clock even when no data arrives.
    task_id_ = scheduler_.schedule(interval, [this] { refresh(); });
}

void MarkerService::stop()
{
    std::lock_guard<std::mutex> lock(timer_mutex_);
    if (task_id_)
    {
        scheduler_.cancel(*task_id_);
        task_id_.reset();
    }
}

void MarkerService::restart(std::chrono::milliseconds interval)
{
    stop();
    start(interval);
}

std::string MarkerService::resolve_display_name(PeerId const &peer) const
{
    if (auto nickname = contacts_.nickname(peer))
    {
        return *nickname;
    }
    if (auto announce = announces_.find(peer);
        announce && !announce->display_name.empty())
    {
        return announce->display_name;
    }
    // Telemetry may name the sender by identity hash rather than destination.
    if (auto announce = announces_.find_by_identity(peer);
        announce && !announce->display_name.empty())
    {
        return announce->display_name;
    }
    return truncated_id(peer);
}

std::optional<std::vector<ContactMarker>>
MarkerService::build(TimePoint now) const
{
    auto latest = locations_.latest_location_per_sender();
    if (!latest)
    {
        return std::nullopt;
    }
    std::vector<ContactMarker> result;
    result.reserve(latest->size());
    for (auto const &update : *latest)
    {
        // Local arrival time is authoritative; sender clocks may be skewed.
        auto freshness =
            classify_marker(update.received_at, update.expires_at, now);
        if (!freshness)
        {
            continue;
        }
        ContactMarker marker;
        marker.peer_id = update.sender_id;
        marker.display_name = resolve_display_name(update.sender_id);
        marker.latitude = update.latitude;
        marker.longitude = update.longitude;
        marker.accuracy_meters = update.accuracy_meters;
        marker.captured_at = update.captured_at;
        marker.received_at = update.received_at;
        marker.expires_at = update.expires_at;
        marker.approximate_radius_meters = update.approximate_radius_meters;
        marker.freshness = *freshness;
        if (auto announce = announces_.find(update.sender_id))
        {
            marker.public_key = announce->public_key;
        }
        result.push_back(std::move(marker));
    }
    return result;
}

bool MarkerService::refresh()
{
    std::lock_guard<std::mutex> serial(refresh_mutex_);
    auto built = build(clock_());
    if (!built)
    {
        MP_LOG_WARN("marker refresh failed; keeping {} marker(s)",
                    markers_.get().size());
        return false;
    }
    markers_.set(std::move(*built));
    return true;
}

} // namespace mp::engine
