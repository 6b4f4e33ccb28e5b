#pragma once

#include "engine/Core.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace mp::engine
{

// Meters per degree used for the coarsening grid.
inline constexpr double kMetersPerDegree = 111000.0;

struct OutboundLocation
{
    double latitude = 0.0;
    double longitude = 0.0;
    float accuracy_meters = 0.0F;
    TimePoint captured_at{};
    std::optional<TimePoint> expires_at;
    int approximate_radius_meters = 0;
};

// Wire form: {"lat","lng","acc","ts","expires","approxRadius","cease"} with
// millisecond timestamps.
std::string encode_location_telemetry(OutboundLocation const &location);
std::string encode_cease_telemetry(TimePoint timestamp);

struct ReceivedTelemetry
{
    bool cease = false;
    // Sender clock; for a cease it is compared with the latest received_at.
    TimePoint timestamp{};
    // Valid for non-cease messages; received_at is set from the argument.
    LocationUpdate location;
};

// Returns std::nullopt for malformed payloads. `source_hash` is required and
// normalized to PeerId form.
std::optional<ReceivedTelemetry>
parse_location_telemetry(std::string_view payload, TimePoint received_at);

// Snaps coordinates to a grid roughly `radius_meters` wide. Radius 0 leaves
// them untouched.
std::pair<double, double> coarsen_location(double latitude, double longitude,
                                           int radius_meters);

} // namespace mp::engine
