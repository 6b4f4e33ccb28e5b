#include "engine/MarkerFreshness.hpp"

namespace mp::engine
{

std::optional<MarkerFreshness>
classify_marker(TimePoint captured_at, std::optional<TimePoint> expires_at,
                TimePoint now) noexcept
{
    bool const expired = expires_at && *expires_at < now;
    if (expired)
    {
        if (now > *expires_at + kGracePeriod)
        {
            return std::nullopt;
        }
        return MarkerFreshness::ExpiredGracePeriod;
    }
    if (now - captured_at > kStaleThreshold)
    {
        return MarkerFreshness::Stale;
    }
    return MarkerFreshness::Fresh;
}

} // namespace mp::engine
