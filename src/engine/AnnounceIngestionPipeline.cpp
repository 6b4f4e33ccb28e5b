#include "engine/AnnounceIngestionPipeline.hpp"

#include "engine/AppDataParser.hpp"
#include "engine/AsyncTaskService.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/PresenceUtils.hpp"
#include "engine/Stores.hpp"
#include "utils/Hex.hpp"
#include "utils/Log.hpp"

#include <exception>
#include <memory>
#include <utility>

namespace mp::engine
{

std::optional<PeerAnnounce> normalize_announce(RawAnnounce const &raw)
{
    auto peer = peer_id_from_bytes(raw.destination_hash);
    if (!peer)
    {
        return std::nullopt;
    }
    if (raw.hops < 0)
    {
        return std::nullopt;
    }
    PeerAnnounce announce;
    announce.peer_id = std::move(*peer);
    announce.public_key = raw.public_key;
    announce.display_name =
        extract_peer_name(raw.display_name, raw.app_data, announce.peer_id);
    announce.node_type = raw.node_type;
    announce.aspect = raw.aspect;
    if (announce.aspect.empty())
    {
        announce.aspect = raw.node_type == NodeType::PropagationNode
                              ? kAspectPropagation
                              : kAspectDelivery;
    }
    announce.hop_count = raw.hops;
    announce.last_seen_at = raw.timestamp;
    announce.receiving_interface = raw.receiving_interface;
    announce.identity_hash = utils::encode_hex(raw.identity_hash);
    announce.app_data = raw.app_data;
    announce.stamp_cost = raw.stamp_cost;
    return announce;
}

AnnounceIngestionPipeline::AnnounceIngestionPipeline(AnnounceStore &store,
                                                     AsyncTaskService &writer,
                                                     EventBus *bus)
    : store_(store), writer_(writer), bus_(bus)
{
}

AnnounceIngestionPipeline::~AnnounceIngestionPipeline()
{
    detach();
}

bool AnnounceIngestionPipeline::attach(MeshTransport &transport,
                                       RetryPolicy const &policy,
                                       std::atomic<bool> const *cancel,
                                       Sleeper const &sleeper)
{
    if (is_attached())
    {
        return true;
    }
    bool ready = retry_with_policy(
        policy, "announce stream attach",
        [&transport]
        { return transport.network_status() == NetworkStatus::Ready; },
        cancel, sleeper);
    if (!ready)
    {
        return false;
    }

    std::lock_guard<std::mutex> lock(attach_mutex_);
    if (subscription_)
    {
        return true;
    }
    subscription_ = transport.subscribe_announces(
        [this](RawAnnounce const &announce) { enqueue(announce); });
    transport_ = &transport;
    MP_LOG_INFO("announce stream attached");
    return true;
}

void AnnounceIngestionPipeline::detach()
{
    std::lock_guard<std::mutex> lock(attach_mutex_);
    if (transport_ != nullptr && subscription_)
    {
        transport_->unsubscribe_announces(*subscription_);
        MP_LOG_DEBUG("announce stream detached");
    }
    subscription_.reset();
    transport_ = nullptr;
}

bool AnnounceIngestionPipeline::is_attached() const
{
    std::lock_guard<std::mutex> lock(attach_mutex_);
    return subscription_.has_value();
}

void AnnounceIngestionPipeline::enqueue(RawAnnounce announce)
{
    received_.fetch_add(1, std::memory_order_relaxed);
    auto shared = std::make_shared<RawAnnounce>(std::move(announce));
    if (!writer_.submit([this, shared] { ingest(*shared); }))
    {
        // Writer not running (tests, shutdown drain): apply in place.
        ingest(*shared);
    }
}

std::optional<PeerAnnounce>
AnnounceIngestionPipeline::ingest(RawAnnounce const &raw)
{
    auto announce = normalize_announce(raw);
    if (!announce)
    {
        dropped_malformed_.fetch_add(1, std::memory_order_relaxed);
        MP_LOG_WARN("dropping malformed announce (hash {} bytes, hops {})",
                    raw.destination_hash.size(), raw.hops);
        return std::nullopt;
    }

    bool stored = false;
    try
    {
        stored = store_.upsert(*announce);
    }
    catch (std::exception const &ex)
    {
        MP_LOG_ERROR("announce store threw for {}: {}", announce->peer_id,
                     ex.what());
    }
    if (!stored)
    {
        failed_persist_.fetch_add(1, std::memory_order_relaxed);
        MP_LOG_WARN("failed to persist announce from {}", announce->peer_id);
        return std::nullopt;
    }

    ingested_.fetch_add(1, std::memory_order_relaxed);
    MP_LOG_DEBUG("announce {} '{}' hops={}", announce->peer_id,
                 announce->display_name, announce->hop_count);
    if (bus_ != nullptr)
    {
        bus_->publish(AnnounceIngestedEvent{announce->peer_id,
                                            announce->node_type,
                                            announce->last_seen_at});
    }
    return announce;
}

IngestionStatistics AnnounceIngestionPipeline::statistics() const
{
    IngestionStatistics stats;
    stats.received = received_.load(std::memory_order_relaxed);
    stats.ingested = ingested_.load(std::memory_order_relaxed);
    stats.dropped_malformed = dropped_malformed_.load(std::memory_order_relaxed);
    stats.failed_persist = failed_persist_.load(std::memory_order_relaxed);
    return stats;
}

} // namespace mp::engine
