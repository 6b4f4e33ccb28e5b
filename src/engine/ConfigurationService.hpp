#pragma once

#include "engine/Core.hpp"
#include <atomic>
#include <shared_mutex>

namespace mp::engine
{

class PresenceStore;
class EventBus;

class ConfigurationService
{
  public:
    ConfigurationService(PresenceStore *store, EventBus *bus,
                         PresenceSettings defaults);

    PresenceSettings get() const;

    // Overlays values persisted in the settings table onto the defaults.
    void load_persisted();

    // Applies the update and publishes SettingsChangedEvent if anything
    // changed. Invalid values are ignored.
    bool update(SettingsUpdate const &update);

    bool is_dirty() const noexcept;
    void persist_if_dirty();
    bool persist_now();

  private:
    void mark_dirty();
    void notify_listeners();

    PresenceStore *store_;
    EventBus *bus_;

    mutable std::shared_mutex mutex_;
    PresenceSettings settings_;

    std::atomic_bool dirty_{false};
};

} // namespace mp::engine
