#pragma once

#include "engine/Core.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mp::engine
{

class ContactDirectory;
class EventBus;
class LocationStore;

// Outbound sharing sessions plus inbound location telemetry. Session expiry
// is evaluated lazily on every read; check_expired_sessions() only tidies up.
class LocationSharingManager
{
  public:
    LocationSharingManager(ContactDirectory &contacts, LocationStore &locations,
                           EventBus *bus, WallClock clock);

    LocationSharingManager(LocationSharingManager const &) = delete;
    LocationSharingManager &operator=(LocationSharingManager const &) = delete;

    // Replaces any existing session per peer. std::nullopt means indefinite.
    // Returns the number of sessions created.
    std::size_t
    start_sharing(std::vector<PeerId> const &peers,
                  std::unordered_map<PeerId, std::string> const &names,
                  std::optional<std::chrono::milliseconds> duration);
    std::size_t
    start_sharing(std::vector<PeerId> const &peers,
                  std::unordered_map<PeerId, std::string> const &names,
                  SharingDuration duration);
    // Stops one peer, or everyone when `peer` is empty. Returns how many
    // sessions were removed; a repeated stop removes nothing.
    std::size_t stop_sharing(std::optional<PeerId> const &peer = std::nullopt);

    Relationship relationship_with(PeerId const &peer) const;
    bool has_active_session(PeerId const &peer) const;
    std::vector<SharingSession> active_sessions() const;
    bool is_sharing() const;
    std::size_t check_expired_sessions();

    // Sends one coarsened fix to every active session. Returns how many
    // recipients accepted it.
    std::size_t share_location(double latitude, double longitude,
                               float accuracy);
    // Stores an inbound update or applies a cease. False for malformed input.
    bool handle_received_location(std::string_view payload);
    // Drops updates past their grace period and all but the newest update
    // per sender. Returns the number of rows removed.
    std::optional<int> cleanup_expired_locations();

    void set_telemetry_sink(TelemetrySink sink);
    void set_precision_radius(int radius_meters);

  private:
    bool is_active(SharingSession const &session, TimePoint now) const;
    TelemetrySink sink() const;
    bool send(TelemetrySink const &sink, PeerId const &peer,
              std::string const &payload) const;

    ContactDirectory &contacts_;
    LocationStore &locations_;
    EventBus *bus_;
    WallClock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<PeerId, SharingSession> sessions_;
    TelemetrySink sink_;
    int precision_radius_m_ = 0;
};

} // namespace mp::engine
