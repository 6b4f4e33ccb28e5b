#pragma once

#include "engine/MeshTransport.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace mp::app
{

// Mesh transport fed from a recorded JSON document:
//   { "status": "ready", "path_table": ["<hex>", ...],
//     "announces": [ { "destination_hash": "<hex>", ... }, ... ] }
// Announces are delivered on emit_all(); the path table is served as-is.
class ReplayTransport final : public engine::MeshTransport
{
  public:
    static std::unique_ptr<ReplayTransport>
    load(std::filesystem::path const &path);
    static std::unique_ptr<ReplayTransport> parse(std::string_view payload);

    SubscriptionId subscribe_announces(AnnounceHandler handler) override;
    void unsubscribe_announces(SubscriptionId id) override;
    std::unordered_set<engine::PeerId> path_table_snapshot() override;
    engine::NetworkStatus network_status() const override;

    void set_network_status(engine::NetworkStatus status);

    // Hands every recorded announce to the current subscribers, in file
    // order. Returns how many were delivered.
    std::size_t emit_all();

    std::size_t announce_count() const noexcept { return announces_.size(); }
    std::size_t subscriber_count() const;

  private:
    ReplayTransport() = default;

    mutable std::mutex mutex_;
    engine::NetworkStatus status_ = engine::NetworkStatus::Ready;
    std::unordered_set<engine::PeerId> path_table_;
    std::vector<engine::RawAnnounce> announces_;
    std::map<SubscriptionId, AnnounceHandler> handlers_;
    SubscriptionId next_id_ = 1;
};

} // namespace mp::app
