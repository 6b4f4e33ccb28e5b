#pragma once

#include "engine/Core.hpp"
#include "engine/Observable.hpp"
#include "engine/SchedulerService.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mp::engine
{

class AnnounceStore;
class ContactDirectory;
class LocationStore;

// Projects the latest received location per sender into map markers, aged by
// the current time.
class MarkerService
{
  public:
    MarkerService(LocationStore &locations, AnnounceStore &announces,
                  ContactDirectory &contacts, SchedulerService &scheduler,
                  WallClock clock);
    ~MarkerService();

    MarkerService(MarkerService const &) = delete;
    MarkerService &operator=(MarkerService const &) = delete;

    void start(std::chrono::milliseconds interval);
    void stop();
    void restart(std::chrono::milliseconds interval);

    // Rebuilds and publishes the marker list. False when the store could not
    // be read; the previous list stays published.
    bool refresh();
    std::optional<std::vector<ContactMarker>> build(TimePoint now) const;
    std::string resolve_display_name(PeerId const &peer) const;

    Observable<std::vector<ContactMarker>> &markers() noexcept
    {
        return markers_;
    }

  private:
    LocationStore &locations_;
    AnnounceStore &announces_;
    ContactDirectory &contacts_;
    SchedulerService &scheduler_;
    WallClock clock_;

    std::mutex timer_mutex_;
    std::optional<SchedulerService::TaskId> task_id_;
    std::mutex refresh_mutex_;

    Observable<std::vector<ContactMarker>> markers_;
};

} // namespace mp::engine
