#include "engine/LocationSharingManager.hpp"

#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/LocationTelemetry.hpp"
#include "engine/MarkerFreshness.hpp"
#include "engine/PresenceUtils.hpp"
#include "engine/Stores.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace mp::engine
{

namespace
{
constexpr char const kUnknownName[] = "Unknown";
}

LocationSharingManager::LocationSharingManager(ContactDirectory &contacts,
                                               LocationStore &locations,
                                               EventBus *bus, WallClock clock)
    : contacts_(contacts), locations_(locations), bus_(bus),
      clock_(clock ? std::move(clock) : WallClock([] { return Clock::now(); }))
{
}

std::size_t LocationSharingManager::start_sharing(
    std::vector<PeerId> const &peers,
    std::unordered_map<PeerId, std::string> const &names,
    std::optional<std::chrono::milliseconds> duration)
{
    auto const now = clock_();
    std::optional<TimePoint> expires_at;
    if (duration)
    {
        expires_at = now + *duration;
    }

    // Names may be keyed by any spelling of the id.
    std::unordered_map<PeerId, std::string> normalized_names;
    for (auto const &[key, name] : names)
    {
        if (auto id = normalize_peer_id(key))
        {
            normalized_names[*id] = name;
        }
    }

    std::size_t created = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto const &raw : peers)
        {
            auto peer = normalize_peer_id(raw);
            if (!peer)
            {
                MP_LOG_WARN("ignoring sharing request for invalid peer '{}'",
                            raw);
                continue;
            }
            SharingSession session;
            session.peer_id = *peer;
            auto name = normalized_names.find(*peer);
            session.display_name =
                name != normalized_names.end() && !name->second.empty()
                    ? name->second
                    : kUnknownName;
            session.started_at = now;
            session.expires_at = expires_at;
            sessions_.insert_or_assign(*peer, std::move(session));
            ++created;
        }
    }

    if (created > 0)
    {
        MP_LOG_INFO("started sharing with {} peer(s)", created);
        if (bus_ != nullptr)
        {
            bus_->publish(SharingStartedEvent{created});
        }
    }
    return created;
}

std::size_t LocationSharingManager::start_sharing(
    std::vector<PeerId> const &peers,
    std::unordered_map<PeerId, std::string> const &names,
    SharingDuration duration)
{
    return start_sharing(peers, names, duration_for(duration, clock_()));
}

std::size_t
LocationSharingManager::stop_sharing(std::optional<PeerId> const &peer)
{
    std::vector<PeerId> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (peer)
        {
            auto id = normalize_peer_id(*peer);
            if (id && sessions_.erase(*id) > 0)
            {
                removed.push_back(*id);
            }
        }
        else
        {
            for (auto const &entry : sessions_)
            {
                removed.push_back(entry.first);
            }
            sessions_.clear();
        }
    }
    if (removed.empty())
    {
        return 0;
    }

    // Recipients hear about the stop so they can drop our marker.
    auto const payload = encode_cease_telemetry(clock_());
    auto const target = sink();
    for (auto const &id : removed)
    {
        send(target, id, payload);
    }

    MP_LOG_INFO("stopped sharing with {} peer(s)", removed.size());
    if (bus_ != nullptr)
    {
        SharingStoppedEvent event;
        if (peer)
        {
            event.peer_id = removed.front();
        }
        bus_->publish(event);
    }
    return removed.size();
}

bool LocationSharingManager::is_active(SharingSession const &session,
                                       TimePoint now) const
{
    return !session.expires_at || now < *session.expires_at;
}

bool LocationSharingManager::has_active_session(PeerId const &peer) const
{
    auto id = normalize_peer_id(peer);
    if (!id)
    {
        return false;
    }
    auto const now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(*id);
    return it != sessions_.end() && is_active(it->second, now);
}

Relationship LocationSharingManager::relationship_with(PeerId const &peer) const
{
    auto id = normalize_peer_id(peer);
    if (!id)
    {
        return Relationship::None;
    }
    bool const sharing_with_them = has_active_session(*id);
    bool const they_share = contacts_.is_sharing_with_me(*id);
    if (sharing_with_them && they_share)
    {
        return Relationship::Mutual;
    }
    if (sharing_with_them)
    {
        return Relationship::SharingWithThem;
    }
    if (they_share)
    {
        return Relationship::TheyShareWithMe;
    }
    return Relationship::None;
}

std::vector<SharingSession> LocationSharingManager::active_sessions() const
{
    auto const now = clock_();
    std::vector<SharingSession> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto const &entry : sessions_)
        {
            if (is_active(entry.second, now))
            {
                result.push_back(entry.second);
            }
        }
    }
    std::sort(result.begin(), result.end(),
              [](SharingSession const &a, SharingSession const &b)
              {
                  if (a.started_at != b.started_at)
                  {
                      return a.started_at < b.started_at;
                  }
                  return a.peer_id < b.peer_id;
              });
    return result;
}

bool LocationSharingManager::is_sharing() const
{
    return !active_sessions().empty();
}

std::size_t LocationSharingManager::check_expired_sessions()
{
    auto const now = clock_();
    std::size_t expired = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        expired = std::erase_if(sessions_, [this, now](auto const &entry)
                                { return !is_active(entry.second, now); });
    }
    if (expired > 0)
    {
        MP_LOG_INFO("{} sharing session(s) expired", expired);
        if (bus_ != nullptr)
        {
            bus_->publish(SessionsExpiredEvent{expired});
        }
    }
    return expired;
}

std::size_t LocationSharingManager::share_location(double latitude,
                                                   double longitude,
                                                   float accuracy)
{
    auto const sessions = active_sessions();
    if (sessions.empty())
    {
        return 0;
    }
    int radius = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        radius = precision_radius_m_;
    }

    OutboundLocation location;
    auto [lat, lng] = coarsen_location(latitude, longitude, radius);
    location.latitude = lat;
    location.longitude = lng;
    location.accuracy_meters = accuracy;
    location.captured_at = clock_();
    location.approximate_radius_meters = radius;
    for (auto const &session : sessions)
    {
        if (session.expires_at &&
            (!location.expires_at || *session.expires_at < *location.expires_at))
        {
            location.expires_at = session.expires_at;
        }
    }

    auto const payload = encode_location_telemetry(location);
    auto const target = sink();
    if (!target)
    {
        MP_LOG_DEBUG("no telemetry sink; location not sent");
        return 0;
    }
    std::size_t delivered = 0;
    for (auto const &session : sessions)
    {
        if (send(target, session.peer_id, payload))
        {
            ++delivered;
        }
    }
    return delivered;
}

bool LocationSharingManager::handle_received_location(std::string_view payload)
{
    auto const now = clock_();
    auto telemetry = parse_location_telemetry(payload, now);
    if (!telemetry)
    {
        return false;
    }
    auto const &sender = telemetry->location.sender_id;

    if (telemetry->cease)
    {
        // A cease older than what we already hold belongs to an earlier
        // session and must not wipe the current one.
        auto latest = locations_.latest_location_for(sender);
        if (latest && telemetry->timestamp <= latest->received_at)
        {
            MP_LOG_DEBUG("ignoring stale cease from {}", sender);
            return true;
        }
        auto deleted = locations_.delete_locations_for(sender);
        if (!deleted)
        {
            MP_LOG_WARN("failed to clear locations of {}", sender);
            return true;
        }
        MP_LOG_INFO("{} stopped sharing; removed {} location(s)", sender,
                    *deleted);
        if (bus_ != nullptr)
        {
            bus_->publish(LocationCeasedEvent{sender});
        }
        return true;
    }

    if (!locations_.insert_location(telemetry->location))
    {
        MP_LOG_WARN("failed to store location from {}", sender);
        return true;
    }
    MP_LOG_DEBUG("stored location from {} radius={}", sender,
                 telemetry->location.approximate_radius_meters);
    if (bus_ != nullptr)
    {
        bus_->publish(LocationStoredEvent{sender});
    }
    return true;
}

std::optional<int> LocationSharingManager::cleanup_expired_locations()
{
    auto removed = locations_.delete_expired_locations(
        clock_(), std::chrono::duration_cast<std::chrono::milliseconds>(
                      kGracePeriod));
    if (!removed)
    {
        MP_LOG_WARN("expired location cleanup failed");
        return std::nullopt;
    }
    if (*removed > 0)
    {
        MP_LOG_DEBUG("removed {} expired location(s)", *removed);
    }
    // Open-ended sessions never expire; only their newest update matters.
    auto superseded = locations_.delete_superseded_locations();
    if (!superseded)
    {
        MP_LOG_WARN("superseded location cleanup failed");
        return std::nullopt;
    }
    if (*superseded > 0)
    {
        MP_LOG_DEBUG("removed {} superseded location(s)", *superseded);
    }
    return *removed + *superseded;
}

void LocationSharingManager::set_telemetry_sink(TelemetrySink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void LocationSharingManager::set_precision_radius(int radius_meters)
{
    std::lock_guard<std::mutex> lock(mutex_);
    precision_radius_m_ = std::max(radius_meters, 0);
}

TelemetrySink LocationSharingManager::sink() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return sink_;
}

bool LocationSharingManager::send(TelemetrySink const &sink,
                                  PeerId const &peer,
                                  std::string const &payload) const
{
    if (!sink)
    {
        return false;
    }
    try
    {
        if (sink(peer, payload))
        {
            return true;
        }
        MP_LOG_WARN("telemetry to {} was not accepted", peer);
    }
    catch (std::exception const &ex)
    {
        MP_LOG_WARN("telemetry to {} failed: {}", peer, ex.what());
    }
    return false;
}

} // namespace mp::engine
