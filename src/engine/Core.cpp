#include "engine/Core.hpp"

#include "engine/AnnounceIngestionPipeline.hpp"
#include "engine/AsyncTaskService.hpp"
#include "engine/ConfigurationService.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/LocationSharingManager.hpp"
#include "engine/MarkerService.hpp"
#include "engine/MeshTransport.hpp"
#include "engine/PresenceStore.hpp"
#include "engine/PresenceUtils.hpp"
#include "engine/ReachabilityTracker.hpp"
#include "engine/SchedulerService.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <utility>

namespace mp::engine
{

namespace
{

ReachabilityTracker::Options tracker_options(PresenceSettings const &settings)
{
    ReachabilityTracker::Options options;
    options.node_types = settings.reachable_node_types;
    options.fetch_timeout = settings.path_table_timeout;
    options.coalesce_window = settings.eager_coalesce_window;
    return options;
}

} // namespace

struct Core::Impl
{
    MeshTransport &transport;
    WallClock clock;

    std::unique_ptr<EventBus> event_bus;
    std::unique_ptr<PresenceStore> store;
    std::unique_ptr<ConfigurationService> config_service;
    SchedulerService scheduler;
    AsyncTaskService writer{"ingest"};
    AsyncTaskService fetch_worker{"path-table"};

    std::unique_ptr<AnnounceIngestionPipeline> pipeline;
    std::unique_ptr<ReachabilityTracker> tracker;
    std::unique_ptr<LocationSharingManager> sharing;
    std::unique_ptr<MarkerService> marker_service;

    std::vector<SchedulerService::TaskId> housekeeping_tasks;

    // Settings the timers were last started with.
    std::mutex timers_mtx;
    std::chrono::milliseconds reachability_interval{};
    std::chrono::milliseconds marker_interval{};

    std::atomic_bool shutdown_requested{false};
    std::atomic_bool running{false};
    std::mutex wake_mtx;
    std::condition_variable wake_cv;

    Impl(PresenceSettings settings, MeshTransport &transport_ref,
         WallClock clock_fn)
        : transport(transport_ref),
          clock(clock_fn ? std::move(clock_fn)
                         : WallClock([] { return Clock::now(); }))
    {
        auto state_path = settings.state_path.empty()
                              ? mp::utils::data_root() / "meshpresence.db"
                              : settings.state_path;

        event_bus = std::make_unique<EventBus>();
        store = std::make_unique<PresenceStore>(state_path);
        if (!store->is_valid())
        {
            MP_LOG_ERROR("state database {} unavailable; presence data will "
                         "not be persisted",
                         state_path.string());
        }

        config_service = std::make_unique<ConfigurationService>(
            store.get(), event_bus.get(), std::move(settings));
        config_service->load_persisted();
        auto const effective = config_service->get();

        writer.start();
        fetch_worker.start();

        pipeline = std::make_unique<AnnounceIngestionPipeline>(
            *store, writer, event_bus.get());
        tracker = std::make_unique<ReachabilityTracker>(
            *store, transport, scheduler, fetch_worker, event_bus.get(),
            tracker_options(effective));
        sharing = std::make_unique<LocationSharingManager>(
            *store, *store, event_bus.get(), clock);
        sharing->set_precision_radius(effective.location_precision_radius_m);
        marker_service = std::make_unique<MarkerService>(
            *store, *store, *store, scheduler, clock);

        wire_events();

        reachability_interval = effective.reachability_interval;
        marker_interval = effective.marker_refresh_interval;
        tracker->start(reachability_interval);
        marker_service->start(marker_interval);
        housekeeping_tasks.push_back(
            scheduler.schedule(effective.session_check_interval,
                               [this] { sharing->check_expired_sessions(); }));
        housekeeping_tasks.push_back(scheduler.schedule(
            effective.location_cleanup_interval,
            [this]
            {
                auto removed = sharing->cleanup_expired_locations();
                if (removed && *removed > 0)
                {
                    marker_service->refresh();
                }
            }));
        housekeeping_tasks.push_back(
            scheduler.schedule(effective.settings_flush_interval,
                               [this] { config_service->persist_if_dirty(); }));

        // Persisted locations are visible before the first timer fires.
        marker_service->refresh();
    }

    ~Impl()
    {
        // 1. No new announces.
        if (pipeline)
            pipeline->detach();

        for (auto id : housekeeping_tasks)
            scheduler.cancel(id);
        if (tracker)
            tracker->stop();
        if (marker_service)
            marker_service->stop();

        // 2. Drain queued work while every service it touches is alive.
        writer.stop();
        fetch_worker.stop();

        // 3. Flush settings last.
        if (config_service)
            config_service->persist_now();
    }

    void wire_events()
    {
        event_bus->subscribe<AnnounceIngestedEvent>(
            [this](AnnounceIngestedEvent const &)
            {
                tracker->request_eager_recompute();
                marker_service->refresh();
            });
        event_bus->subscribe<LocationStoredEvent>(
            [this](LocationStoredEvent const &) { marker_service->refresh(); });
        event_bus->subscribe<LocationCeasedEvent>(
            [this](LocationCeasedEvent const &) { marker_service->refresh(); });
        event_bus->subscribe<PeerRemovedEvent>(
            [this](PeerRemovedEvent const &)
            {
                tracker->request_eager_recompute();
                marker_service->refresh();
            });
        event_bus->subscribe<ContactChangedEvent>(
            [this](ContactChangedEvent const &) { marker_service->refresh(); });
        event_bus->subscribe<SettingsChangedEvent>(
            [this](SettingsChangedEvent const &event)
            { apply_settings(event.settings); });
    }

    void apply_settings(PresenceSettings const &settings)
    {
        tracker->set_node_types(settings.reachable_node_types);
        tracker->set_fetch_timeout(settings.path_table_timeout);
        tracker->set_coalesce_window(settings.eager_coalesce_window);
        sharing->set_precision_radius(settings.location_precision_radius_m);

        std::unique_lock<std::mutex> lock(timers_mtx);
        if (settings.reachability_interval != reachability_interval)
        {
            reachability_interval = settings.reachability_interval;
            tracker->restart(reachability_interval);
            MP_LOG_INFO("reachability interval now {} ms",
                        reachability_interval.count());
        }
        if (settings.marker_refresh_interval != marker_interval)
        {
            marker_interval = settings.marker_refresh_interval;
            marker_service->restart(marker_interval);
        }
        lock.unlock();

        // The node-type filter changes the count even without new data.
        tracker->recompute();
    }

    void interruptible_sleep(std::chrono::milliseconds delay)
    {
        std::unique_lock<std::mutex> lock(wake_mtx);
        wake_cv.wait_for(lock, delay,
                         [this] { return shutdown_requested.load(); });
    }

    void run()
    {
        running.store(true);
        auto const settings = config_service->get();

        bool attached = pipeline->attach(
            transport, settings.attach_retry, &shutdown_requested,
            [this](std::chrono::milliseconds delay)
            { interruptible_sleep(delay); });
        if (attached)
        {
            // The first count should not wait a whole interval.
            tracker->recompute();
        }
        else if (!shutdown_requested.load())
        {
            MP_LOG_ERROR("mesh transport never became ready; announces will "
                         "not be collected");
        }

        while (!shutdown_requested.load())
        {
            auto now = SchedulerService::Clock::now();
            scheduler.tick(now);

            auto sched_wait = scheduler.time_until_next_task(now);
            auto wait_limit = std::min<long long>(
                static_cast<long long>(settings.idle_sleep_ms),
                static_cast<long long>(sched_wait.count()));
            auto wait_ms = std::max<long long>(1, wait_limit);
            interruptible_sleep(std::chrono::milliseconds(wait_ms));
        }

        pipeline->detach();
        config_service->persist_now();
        running.store(false);
    }

    void request_stop() noexcept
    {
        {
            std::lock_guard<std::mutex> lock(wake_mtx);
            shutdown_requested.store(true);
        }
        wake_cv.notify_all();
    }
};

Core::Core(PresenceSettings settings, MeshTransport &transport,
           WallClock clock)
    : impl_(std::make_unique<Impl>(std::move(settings), transport,
                                   std::move(clock)))
{
}

Core::~Core() = default;

std::unique_ptr<Core> Core::create(PresenceSettings settings,
                                   MeshTransport &transport, WallClock clock)
{
    return std::make_unique<Core>(std::move(settings), transport,
                                  std::move(clock));
}

void Core::run()
{
    impl_->run();
}

void Core::stop() noexcept
{
    if (impl_)
    {
        impl_->request_stop();
    }
}

bool Core::is_running() const noexcept
{
    return impl_ && impl_->running.load();
}

Observable<int> &Core::reachable_count() noexcept
{
    return impl_->tracker->count();
}

std::optional<int> Core::recompute_reachability()
{
    return impl_->tracker->recompute();
}

std::vector<PeerAnnounce> Core::known_peers(AnnounceFilter const &filter) const
{
    auto peers = impl_->store->list_recent(filter);
    if (!peers)
    {
        MP_LOG_WARN("failed to list known peers");
        return {};
    }
    return std::move(*peers);
}

bool Core::delete_peer(PeerId const &peer)
{
    auto id = normalize_peer_id(peer);
    if (!id || !impl_->store->remove(*id))
    {
        return false;
    }
    MP_LOG_INFO("removed peer {}", *id);
    impl_->event_bus->publish(PeerRemovedEvent{*id});
    return true;
}

bool Core::set_favorite(PeerId const &peer, bool favorite)
{
    auto id = normalize_peer_id(peer);
    return id && impl_->store->set_favorite(*id, favorite, impl_->clock());
}

IngestionStatistics Core::ingestion_statistics() const
{
    return impl_->pipeline->statistics();
}

void Core::flush_ingestion()
{
    impl_->writer.run_task([] {}).wait();
}

bool Core::set_nickname(PeerId const &peer, std::optional<std::string> nickname)
{
    auto id = normalize_peer_id(peer);
    if (!id || !impl_->store->set_nickname(*id, nickname))
    {
        return false;
    }
    impl_->event_bus->publish(ContactChangedEvent{*id});
    return true;
}

bool Core::set_sharing_with_me(PeerId const &peer, bool sharing)
{
    auto id = normalize_peer_id(peer);
    if (!id || !impl_->store->set_sharing_with_me(*id, sharing))
    {
        return false;
    }
    impl_->event_bus->publish(ContactChangedEvent{*id});
    return true;
}

void Core::start_sharing(std::vector<PeerId> const &peers,
                         std::unordered_map<PeerId, std::string> const &names,
                         std::optional<std::chrono::milliseconds> duration)
{
    impl_->sharing->start_sharing(peers, names, duration);
}

void Core::start_sharing(std::vector<PeerId> const &peers,
                         std::unordered_map<PeerId, std::string> const &names,
                         SharingDuration duration)
{
    impl_->sharing->start_sharing(peers, names, duration);
}

void Core::stop_sharing(std::optional<PeerId> const &peer)
{
    impl_->sharing->stop_sharing(peer);
}

Relationship Core::relationship_with(PeerId const &peer) const
{
    return impl_->sharing->relationship_with(peer);
}

std::vector<SharingSession> Core::active_sessions() const
{
    return impl_->sharing->active_sessions();
}

void Core::share_location(double latitude, double longitude, float accuracy)
{
    impl_->sharing->share_location(latitude, longitude, accuracy);
}

void Core::handle_location_telemetry(std::string const &payload)
{
    if (!impl_->sharing->handle_received_location(payload))
    {
        MP_LOG_DEBUG("dropped malformed location telemetry");
    }
}

void Core::set_telemetry_sink(TelemetrySink sink)
{
    impl_->sharing->set_telemetry_sink(std::move(sink));
}

Observable<std::vector<ContactMarker>> &Core::markers() noexcept
{
    return impl_->marker_service->markers();
}

void Core::refresh_markers()
{
    impl_->marker_service->refresh();
}

PresenceSettings Core::settings() const
{
    return impl_->config_service->get();
}

void Core::update_settings(SettingsUpdate const &update)
{
    impl_->config_service->update(update);
}

} // namespace mp::engine
