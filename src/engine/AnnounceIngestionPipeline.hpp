#pragma once

#include "engine/Core.hpp"
#include "engine/MeshTransport.hpp"
#include "engine/RetryPolicy.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>

namespace mp::engine
{

class AnnounceStore;
class AsyncTaskService;
class EventBus;

// Turns a raw announce into its stored form. std::nullopt for malformed
// records (wrong hash length, negative hops).
std::optional<PeerAnnounce> normalize_announce(RawAnnounce const &raw);

// Consumes the transport's announce stream. Transport callbacks only enqueue;
// the single writer applies announces to the store in arrival order.
class AnnounceIngestionPipeline
{
  public:
    AnnounceIngestionPipeline(AnnounceStore &store, AsyncTaskService &writer,
                              EventBus *bus);
    ~AnnounceIngestionPipeline();

    AnnounceIngestionPipeline(AnnounceIngestionPipeline const &) = delete;
    AnnounceIngestionPipeline &
    operator=(AnnounceIngestionPipeline const &) = delete;

    // Waits for the transport to report Ready under `policy`, then subscribes.
    // Returns false when readiness never came or `cancel` was raised.
    bool attach(MeshTransport &transport, RetryPolicy const &policy,
                std::atomic<bool> const *cancel = nullptr,
                Sleeper const &sleeper = {});
    void detach();
    bool is_attached() const;

    void enqueue(RawAnnounce announce);
    // Applies one announce on the calling thread. Returns the stored record.
    std::optional<PeerAnnounce> ingest(RawAnnounce const &raw);

    IngestionStatistics statistics() const;

  private:
    AnnounceStore &store_;
    AsyncTaskService &writer_;
    EventBus *bus_;

    mutable std::mutex attach_mutex_;
    MeshTransport *transport_ = nullptr;
    std::optional<MeshTransport::SubscriptionId> subscription_;

    std::atomic<std::uint64_t> received_{0};
    std::atomic<std::uint64_t> ingested_{0};
    std::atomic<std::uint64_t> dropped_malformed_{0};
    std::atomic<std::uint64_t> failed_persist_{0};
};

} // namespace mp::engine
