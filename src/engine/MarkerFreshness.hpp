#pragma once

#include "engine/Core.hpp"

#include <chrono>
#include <optional>

namespace mp::engine
{

inline constexpr std::chrono::minutes kStaleThreshold{5};
inline constexpr std::chrono::hours kGracePeriod{1};

// Pure classification of a marker at `now`. std::nullopt means the marker
// must be hidden: its sharing ended more than kGracePeriod ago.
std::optional<MarkerFreshness>
classify_marker(TimePoint captured_at, std::optional<TimePoint> expires_at,
                TimePoint now) noexcept;

} // namespace mp::engine
