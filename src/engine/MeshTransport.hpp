#pragma once

#include "engine/Core.hpp"

#include <cstddef>
#include <functional>
#include <unordered_set>

namespace mp::engine
{

// Boundary to the mesh routing layer.
class MeshTransport
{
  public:
    using AnnounceHandler = std::function<void(RawAnnounce const &)>;
    using SubscriptionId = std::size_t;

    virtual ~MeshTransport() = default;

    // The handler may be invoked from any transport thread and must not block.
    virtual SubscriptionId subscribe_announces(AnnounceHandler handler) = 0;
    virtual void unsubscribe_announces(SubscriptionId id) = 0;

    // Identifiers currently routable, normalized to PeerId form. May block
    // and may throw on transport failure.
    virtual std::unordered_set<PeerId> path_table_snapshot() = 0;

    virtual NetworkStatus network_status() const = 0;
};

} // namespace mp::engine
