#include "engine/ConfigurationService.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/PresenceStore.hpp"
#include "engine/PresenceUtils.hpp"
#include "utils/Log.hpp"
#include "utils/StateStore.hpp"

#include <algorithm>
#include <charconv>
#include <limits>
#include <string>
#include <utility>

namespace mp::engine
{

namespace
{

constexpr char const kReachabilityIntervalKey[] = "reachabilityIntervalMs";
constexpr char const kMarkerRefreshIntervalKey[] = "markerRefreshIntervalMs";
constexpr char const kPathTableTimeoutKey[] = "pathTableTimeoutMs";
constexpr char const kCoalesceWindowKey[] = "eagerCoalesceWindowMs";
constexpr char const kReachableNodeTypesKey[] = "reachableNodeTypes";
constexpr char const kPrecisionRadiusKey[] = "locationPrecisionRadiusM";

std::optional<long long> parse_integer(std::string const &text)
{
    long long value = 0;
    auto const *end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end)
    {
        return std::nullopt;
    }
    return value;
}

std::string encode_node_types(std::vector<NodeType> const &types)
{
    std::vector<std::string> names;
    names.reserve(types.size());
    for (auto type : types)
    {
        names.emplace_back(to_string(type));
    }
    return storage::serialize_string_list(names);
}

std::optional<std::vector<NodeType>> decode_node_types(std::string const &text)
{
    std::vector<NodeType> types;
    for (auto const &name : storage::deserialize_string_list(text))
    {
        auto type = parse_node_type(name);
        if (!type)
        {
            return std::nullopt;
        }
        types.push_back(*type);
    }
    if (types.empty())
    {
        return std::nullopt;
    }
    return types;
}

} // namespace

ConfigurationService::ConfigurationService(PresenceStore *store, EventBus *bus,
                                           PresenceSettings defaults)
    : store_(store), bus_(bus), settings_(std::move(defaults))
{
}

PresenceSettings ConfigurationService::get() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return settings_;
}

void ConfigurationService::load_persisted()
{
    if (store_ == nullptr || !store_->is_valid())
    {
        return;
    }
    auto read_millis = [this](char const *key)
        -> std::optional<std::chrono::milliseconds>
    {
        auto text = store_->get_setting(key);
        if (!text)
        {
            return std::nullopt;
        }
        auto value = parse_integer(*text);
        if (!value)
        {
            MP_LOG_WARN("ignoring malformed setting {}='{}'", key, *text);
            return std::nullopt;
        }
        return std::chrono::milliseconds(*value);
    };

    SettingsUpdate overlay;
    overlay.reachability_interval = read_millis(kReachabilityIntervalKey);
    overlay.marker_refresh_interval = read_millis(kMarkerRefreshIntervalKey);
    overlay.path_table_timeout = read_millis(kPathTableTimeoutKey);
    overlay.eager_coalesce_window = read_millis(kCoalesceWindowKey);
    if (auto text = store_->get_setting(kReachableNodeTypesKey))
    {
        overlay.reachable_node_types = decode_node_types(*text);
        if (!overlay.reachable_node_types)
        {
            MP_LOG_WARN("ignoring malformed setting {}='{}'",
                        kReachableNodeTypesKey, *text);
        }
    }
    if (auto text = store_->get_setting(kPrecisionRadiusKey))
    {
        auto value = parse_integer(*text);
        if (value && *value >= std::numeric_limits<int>::min() &&
            *value <= std::numeric_limits<int>::max())
        {
            overlay.location_precision_radius_m = static_cast<int>(*value);
        }
        else
        {
            MP_LOG_WARN("ignoring malformed setting {}='{}'",
                        kPrecisionRadiusKey, *text);
        }
    }

    // Loading is not a user change; nothing to write back.
    update(overlay);
    dirty_.store(false, std::memory_order_release);
}

bool ConfigurationService::update(SettingsUpdate const &update)
{
    bool changed = false;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (update.reachability_interval &&
            *update.reachability_interval != settings_.reachability_interval)
        {
            settings_.reachability_interval = *update.reachability_interval;
            changed = true;
        }
        if (update.marker_refresh_interval &&
            *update.marker_refresh_interval !=
                settings_.marker_refresh_interval)
        {
            settings_.marker_refresh_interval = *update.marker_refresh_interval;
            changed = true;
        }
        if (update.path_table_timeout &&
            *update.path_table_timeout != settings_.path_table_timeout)
        {
            if (update.path_table_timeout->count() > 0)
            {
                settings_.path_table_timeout = *update.path_table_timeout;
                changed = true;
            }
            else
            {
                MP_LOG_WARN("path table timeout must be positive");
            }
        }
        if (update.eager_coalesce_window &&
            *update.eager_coalesce_window != settings_.eager_coalesce_window)
        {
            settings_.eager_coalesce_window =
                std::max(*update.eager_coalesce_window,
                         std::chrono::milliseconds::zero());
            changed = true;
        }
        if (update.reachable_node_types &&
            *update.reachable_node_types != settings_.reachable_node_types)
        {
            if (!update.reachable_node_types->empty())
            {
                settings_.reachable_node_types = *update.reachable_node_types;
                changed = true;
            }
            else
            {
                MP_LOG_WARN("reachable node type filter cannot be empty");
            }
        }
        if (update.location_precision_radius_m &&
            *update.location_precision_radius_m !=
                settings_.location_precision_radius_m)
        {
            if (*update.location_precision_radius_m >= 0)
            {
                settings_.location_precision_radius_m =
                    *update.location_precision_radius_m;
                changed = true;
            }
            else
            {
                MP_LOG_WARN("precision radius cannot be negative");
            }
        }
    }

    if (changed)
    {
        mark_dirty();
        notify_listeners();
    }
    return changed;
}

void ConfigurationService::mark_dirty()
{
    dirty_.store(true, std::memory_order_release);
}

bool ConfigurationService::is_dirty() const noexcept
{
    return dirty_.load(std::memory_order_acquire);
}

void ConfigurationService::persist_if_dirty()
{
    if (!dirty_.load(std::memory_order_acquire))
        return;
    persist_now();
}

bool ConfigurationService::persist_now()
{
    if (store_ == nullptr || !store_->is_valid())
        return false;

    PresenceSettings copy = get();
    auto millis = [](std::chrono::milliseconds value)
    { return std::to_string(value.count()); };
    bool ok =
        store_->set_setting(kReachabilityIntervalKey,
                            millis(copy.reachability_interval)) &&
        store_->set_setting(kMarkerRefreshIntervalKey,
                            millis(copy.marker_refresh_interval)) &&
        store_->set_setting(kPathTableTimeoutKey,
                            millis(copy.path_table_timeout)) &&
        store_->set_setting(kCoalesceWindowKey,
                            millis(copy.eager_coalesce_window)) &&
        store_->set_setting(kReachableNodeTypesKey,
                            encode_node_types(copy.reachable_node_types)) &&
        store_->set_setting(kPrecisionRadiusKey,
                            std::to_string(copy.location_precision_radius_m));
    if (ok)
    {
        dirty_.store(false, std::memory_order_release);
    }
    else
    {
        MP_LOG_WARN("failed to persist settings");
    }
    return ok;
}

void ConfigurationService::notify_listeners()
{
    if (bus_ != nullptr)
    {
        bus_->publish(SettingsChangedEvent{get()});
    }
}

} // namespace mp::engine
