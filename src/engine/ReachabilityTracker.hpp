#pragma once

#include "engine/Core.hpp"
#include "engine/Observable.hpp"
#include "engine/SchedulerService.hpp"

#include <chrono>
#include <future>
#include <mutex>
#include <optional>
#include <unordered_set>
#include <vector>

namespace mp::engine
{

class AnnounceStore;
class AsyncTaskService;
class EventBus;
class MeshTransport;

// Counts known peers that the routing layer can currently reach.
class ReachabilityTracker
{
  public:
    struct Options
    {
        std::vector<NodeType> node_types{NodeType::Peer, NodeType::Node};
        std::chrono::milliseconds fetch_timeout{3'000};
        // Eager requests closer than this to the previous recompute are
        // dropped. Zero disables coalescing.
        std::chrono::milliseconds coalesce_window{0};
    };

    ReachabilityTracker(AnnounceStore &store, MeshTransport &transport,
                        SchedulerService &scheduler,
                        AsyncTaskService &fetch_worker, EventBus *bus,
                        Options options);
    ~ReachabilityTracker();

    ReachabilityTracker(ReachabilityTracker const &) = delete;
    ReachabilityTracker &operator=(ReachabilityTracker const &) = delete;

    // A non-positive interval leaves periodic recomputation off. Calling
    // start() while running is a no-op.
    void start(std::chrono::milliseconds interval);
    void stop();
    void restart(std::chrono::milliseconds interval);
    bool is_periodic() const;

    // Returns the new count, or std::nullopt when skipped or failed; in both
    // cases the published count is left alone.
    std::optional<int> recompute();
    // Recompute triggered by a fresh announce, subject to coalescing. Skipped
    // outright while an earlier path table fetch is still running.
    std::optional<int> request_eager_recompute();
    bool fetch_in_flight() const;

    Observable<int> &count() noexcept { return count_; }
    int current() const { return count_.get(); }

    void set_node_types(std::vector<NodeType> types);
    void set_fetch_timeout(std::chrono::milliseconds timeout);
    void set_coalesce_window(std::chrono::milliseconds window);
    Options options() const;

  private:
    using PathTable = std::unordered_set<PeerId>;

    // At most one snapshot call is outstanding; a timed out fetch is awaited
    // again by the next recompute instead of queueing another behind it.
    std::optional<PathTable> fetch_path_table(std::chrono::milliseconds timeout);

    AnnounceStore &store_;
    MeshTransport &transport_;
    SchedulerService &scheduler_;
    AsyncTaskService &fetch_worker_;
    EventBus *bus_;

    mutable std::mutex options_mutex_;
    Options options_;

    mutable std::mutex timer_mutex_;
    std::optional<SchedulerService::TaskId> task_id_;

    // Serializes recomputes.
    std::mutex recompute_mutex_;
    std::optional<SchedulerService::Clock::time_point> last_recompute_;

    mutable std::mutex fetch_mutex_;
    std::optional<std::shared_future<PathTable>> in_flight_;

    Observable<int> count_{0};
};

} // namespace mp::engine
