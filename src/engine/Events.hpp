#pragma once

#include "engine/Core.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace mp::engine
{

struct AnnounceIngestedEvent
{
    PeerId peer_id;
    NodeType node_type = NodeType::Peer;
    TimePoint last_seen_at{};
};

struct PeerRemovedEvent
{
    PeerId peer_id;
};

struct ReachabilityChangedEvent
{
    int reachable = 0;
};

struct SharingStartedEvent
{
    std::size_t count = 0;
};

// `peer_id` is empty when every session was stopped at once.
struct SharingStoppedEvent
{
    std::optional<PeerId> peer_id;
};

struct SessionsExpiredEvent
{
    std::size_t count = 0;
};

struct LocationStoredEvent
{
    PeerId sender_id;
};

struct LocationCeasedEvent
{
    PeerId sender_id;
};

struct ContactChangedEvent
{
    PeerId peer_id;
};

struct SettingsChangedEvent
{
    PresenceSettings settings;
};

} // namespace mp::engine
