#include "engine/LocationTelemetry.hpp"

#include "engine/PresenceUtils.hpp"
#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <cmath>

#include <yyjson.h>

namespace mp::engine
{

std::string encode_location_telemetry(OutboundLocation const &location)
{
    json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    yyjson_mut_obj_add_real(native, root, "lat", location.latitude);
    yyjson_mut_obj_add_real(native, root, "lng", location.longitude);
    yyjson_mut_obj_add_real(native, root, "acc",
                            static_cast<double>(location.accuracy_meters));
    yyjson_mut_obj_add_int(native, root, "ts",
                           to_unix_millis(location.captured_at));
    if (location.expires_at)
    {
        yyjson_mut_obj_add_int(native, root, "expires",
                               to_unix_millis(*location.expires_at));
    }
    else
    {
        yyjson_mut_obj_add_null(native, root, "expires");
    }
    yyjson_mut_obj_add_int(native, root, "approxRadius",
                           location.approximate_radius_meters);
    yyjson_mut_obj_add_bool(native, root, "cease", false);
    return doc.write();
}

std::string encode_cease_telemetry(TimePoint timestamp)
{
    json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    yyjson_mut_obj_add_real(native, root, "lat", 0.0);
    yyjson_mut_obj_add_real(native, root, "lng", 0.0);
    yyjson_mut_obj_add_real(native, root, "acc", 0.0);
    yyjson_mut_obj_add_int(native, root, "ts", to_unix_millis(timestamp));
    yyjson_mut_obj_add_null(native, root, "expires");
    yyjson_mut_obj_add_int(native, root, "approxRadius", 0);
    yyjson_mut_obj_add_bool(native, root, "cease", true);
    return doc.write();
}

std::optional<ReceivedTelemetry>
parse_location_telemetry(std::string_view payload, TimePoint received_at)
{
    auto doc = json::Document::parse(payload);
    if (!doc.is_valid() || !yyjson_is_obj(doc.root()))
    {
        MP_LOG_WARN("location telemetry is not a JSON object");
        return std::nullopt;
    }
    auto *root = doc.root();
    auto source = json::string_field(root, "source_hash");
    auto sender = source ? normalize_peer_id(*source) : std::nullopt;
    if (!sender)
    {
        MP_LOG_WARN("location telemetry without a valid source_hash");
        return std::nullopt;
    }

    ReceivedTelemetry result;
    result.location.sender_id = *sender;
    result.location.received_at = received_at;
    if (json::bool_field(root, "cease").value_or(false))
    {
        result.cease = true;
        result.timestamp = from_unix_millis(json::int_field(root, "ts").value_or(0));
        return result;
    }

    auto lat = json::number_field(root, "lat");
    auto lng = json::number_field(root, "lng");
    auto acc = json::number_field(root, "acc");
    auto ts = json::int_field(root, "ts");
    if (!lat || !lng || !acc || !ts)
    {
        MP_LOG_WARN("location telemetry from {} is missing fields", *sender);
        return std::nullopt;
    }
    if (!std::isfinite(*lat) || !std::isfinite(*lng) || std::abs(*lat) > 90.0 ||
        std::abs(*lng) > 180.0)
    {
        MP_LOG_WARN("location telemetry from {} is out of range", *sender);
        return std::nullopt;
    }

    result.timestamp = from_unix_millis(*ts);
    result.location.latitude = *lat;
    result.location.longitude = *lng;
    result.location.accuracy_meters = static_cast<float>(*acc);
    result.location.captured_at = result.timestamp;
    if (auto expires = json::int_field(root, "expires"))
    {
        result.location.expires_at = from_unix_millis(*expires);
    }
    result.location.approximate_radius_meters =
        static_cast<int>(json::int_field(root, "approxRadius").value_or(0));
    if (auto *appearance = yyjson_obj_get(root, "appearance");
        appearance != nullptr && yyjson_is_obj(appearance))
    {
        result.location.appearance_json = json::write_value(appearance);
    }
    return result;
}

std::pair<double, double> coarsen_location(double latitude, double longitude,
                                           int radius_meters)
{
    if (radius_meters <= 0)
    {
        return {latitude, longitude};
    }
    double const grid = static_cast<double>(radius_meters) / kMetersPerDegree;
    return {std::round(latitude / grid) * grid,
            std::round(longitude / grid) * grid};
}

} // namespace mp::engine
