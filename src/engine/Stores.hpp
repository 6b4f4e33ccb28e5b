#pragma once

#include "engine/Core.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace mp::engine
{

// Storage contracts the engine consumes. Failures are reported through the
// bool/optional returns; implementations must not throw.

class AnnounceStore
{
  public:
    virtual ~AnnounceStore() = default;

    virtual bool upsert(PeerAnnounce const &announce) = 0;
    virtual std::optional<PeerAnnounce> find(PeerId const &peer) const = 0;
    virtual std::optional<PeerAnnounce>
    find_by_identity(std::string const &identity_hash) const = 0;
    // Most recently seen first. std::nullopt signals a query failure.
    virtual std::optional<std::vector<PeerAnnounce>>
    list_recent(AnnounceFilter const &filter) const = 0;
    virtual std::optional<std::unordered_set<PeerId>>
    peer_ids_by_node_types(std::vector<NodeType> const &types) const = 0;
    virtual bool remove(PeerId const &peer) = 0;
    virtual bool set_favorite(PeerId const &peer, bool favorite,
                              TimePoint now) = 0;
};

class LocationStore
{
  public:
    virtual ~LocationStore() = default;

    virtual bool insert_location(LocationUpdate const &update) = 0;
    virtual std::optional<LocationUpdate>
    latest_location_for(PeerId const &sender) const = 0;
    virtual std::optional<std::vector<LocationUpdate>>
    latest_location_per_sender() const = 0;
    virtual std::optional<int> delete_locations_for(PeerId const &sender) = 0;
    // Drops updates whose expiry plus `grace` lies before `now`.
    virtual std::optional<int>
    delete_expired_locations(TimePoint now,
                             std::chrono::milliseconds grace) = 0;
    // Keeps only the newest update per sender.
    virtual std::optional<int> delete_superseded_locations() = 0;
};

class ContactDirectory
{
  public:
    virtual ~ContactDirectory() = default;

    virtual std::optional<std::string> nickname(PeerId const &peer) const = 0;
    virtual bool is_sharing_with_me(PeerId const &peer) const = 0;
    virtual bool set_nickname(PeerId const &peer,
                              std::optional<std::string> const &nickname) = 0;
    virtual bool set_sharing_with_me(PeerId const &peer, bool sharing) = 0;
};

} // namespace mp::engine
