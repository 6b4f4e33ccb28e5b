#pragma once

#include "engine/Observable.hpp"
#include "engine/RetryPolicy.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mp::engine
{

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using WallClock = std::function<TimePoint()>;

// Normalized lowercase hex form of a destination hash.
using PeerId = std::string;

inline constexpr std::size_t kPeerIdLength = 16;
inline constexpr std::size_t kPeerIdHexLength = kPeerIdLength * 2;

inline constexpr char const kAspectDelivery[] = "lxmf.delivery";
inline constexpr char const kAspectAudioCall[] = "call.audio";
inline constexpr char const kAspectPropagation[] = "lxmf.propagation";

enum class NodeType
{
    Peer = 0,
    Node = 1,
    PropagationNode = 2,
};

enum class NetworkStatus
{
    Initializing,
    Connecting,
    Ready,
    Error,
    Shutdown,
};

enum class Relationship
{
    None,
    SharingWithThem,
    TheyShareWithMe,
    Mutual,
};

enum class MarkerFreshness
{
    Fresh,
    Stale,
    ExpiredGracePeriod,
};

enum class SharingDuration
{
    FifteenMinutes,
    OneHour,
    FourHours,
    UntilMidnight,
    Indefinite,
};

// Announce exactly as the transport hands it over.
struct RawAnnounce
{
    std::vector<std::uint8_t> destination_hash;
    std::vector<std::uint8_t> public_key;
    std::vector<std::uint8_t> app_data;
    std::vector<std::uint8_t> identity_hash;
    std::optional<std::string> display_name;
    int hops = 0;
    TimePoint timestamp{};
    std::string receiving_interface;
    NodeType node_type = NodeType::Peer;
    std::string aspect;
    std::optional<int> stamp_cost;
};

struct PeerAnnounce
{
    PeerId peer_id;
    std::vector<std::uint8_t> public_key;
    std::string display_name;
    NodeType node_type = NodeType::Peer;
    std::string aspect;
    int hop_count = 0;
    TimePoint last_seen_at{};
    std::string receiving_interface;
    std::string identity_hash;
    std::vector<std::uint8_t> app_data;
    std::optional<int> stamp_cost;
    bool favorite = false;
    std::optional<TimePoint> favorited_at;
};

struct AnnounceFilter
{
    // Empty means every node type.
    std::vector<NodeType> node_types;
    bool include_audio = true;
    std::string search;
    std::size_t limit = 0;
};

struct LocationUpdate
{
    PeerId sender_id;
    double latitude = 0.0;
    double longitude = 0.0;
    float accuracy_meters = 0.0F;
    TimePoint captured_at{};
    TimePoint received_at{};
    std::optional<TimePoint> expires_at;
    int approximate_radius_meters = 0;
    std::optional<std::string> appearance_json;
};

struct SharingSession
{
    PeerId peer_id;
    std::string display_name;
    TimePoint started_at{};
    std::optional<TimePoint> expires_at;
};

struct ContactMarker
{
    PeerId peer_id;
    std::string display_name;
    double latitude = 0.0;
    double longitude = 0.0;
    float accuracy_meters = 0.0F;
    TimePoint captured_at{};
    TimePoint received_at{};
    std::optional<TimePoint> expires_at;
    int approximate_radius_meters = 0;
    MarkerFreshness freshness = MarkerFreshness::Fresh;
    std::vector<std::uint8_t> public_key;

    bool operator==(ContactMarker const &) const = default;
};

struct IngestionStatistics
{
    std::uint64_t received = 0;
    std::uint64_t ingested = 0;
    std::uint64_t dropped_malformed = 0;
    std::uint64_t failed_persist = 0;
};

// Hands an outbound telemetry payload to the transport. Returns false when
// the payload could not be queued.
using TelemetrySink =
    std::function<bool(PeerId const &peer, std::string const &payload)>;

struct PresenceSettings
{
    std::filesystem::path state_path;
    unsigned idle_sleep_ms = 500;
    std::chrono::milliseconds reachability_interval{30'000};
    std::chrono::milliseconds marker_refresh_interval{30'000};
    std::chrono::milliseconds session_check_interval{30'000};
    std::chrono::milliseconds location_cleanup_interval{5 * 60 * 1000};
    std::chrono::milliseconds path_table_timeout{3'000};
    std::chrono::milliseconds eager_coalesce_window{0};
    std::chrono::milliseconds settings_flush_interval{500};
    std::vector<NodeType> reachable_node_types{NodeType::Peer, NodeType::Node};
    int location_precision_radius_m = 0;
    RetryPolicy attach_retry{};
};

struct SettingsUpdate
{
    std::optional<std::chrono::milliseconds> reachability_interval;
    std::optional<std::chrono::milliseconds> marker_refresh_interval;
    std::optional<std::chrono::milliseconds> path_table_timeout;
    std::optional<std::chrono::milliseconds> eager_coalesce_window;
    std::optional<std::vector<NodeType>> reachable_node_types;
    std::optional<int> location_precision_radius_m;
};

class MeshTransport;

class Core
{
  public:
    Core(PresenceSettings settings, MeshTransport &transport,
         WallClock clock = {});
    ~Core();
    static std::unique_ptr<Core> create(PresenceSettings settings,
                                        MeshTransport &transport,
                                        WallClock clock = {});

    Core(Core const &) = delete;
    Core &operator=(Core const &) = delete;

    void run();
    void stop() noexcept;
    bool is_running() const noexcept;

    // Presence
    Observable<int> &reachable_count() noexcept;
    std::optional<int> recompute_reachability();
    std::vector<PeerAnnounce> known_peers(AnnounceFilter const &filter = {}) const;
    bool delete_peer(PeerId const &peer);
    bool set_favorite(PeerId const &peer, bool favorite);
    IngestionStatistics ingestion_statistics() const;
    // Blocks until every announce queued so far has been applied.
    void flush_ingestion();

    // Contacts
    bool set_nickname(PeerId const &peer, std::optional<std::string> nickname);
    bool set_sharing_with_me(PeerId const &peer, bool sharing);

    // Location sharing
    void start_sharing(std::vector<PeerId> const &peers,
                       std::unordered_map<PeerId, std::string> const &names,
                       std::optional<std::chrono::milliseconds> duration);
    void start_sharing(std::vector<PeerId> const &peers,
                       std::unordered_map<PeerId, std::string> const &names,
                       SharingDuration duration);
    void stop_sharing(std::optional<PeerId> const &peer = std::nullopt);
    Relationship relationship_with(PeerId const &peer) const;
    std::vector<SharingSession> active_sessions() const;
    void share_location(double latitude, double longitude, float accuracy);
    void handle_location_telemetry(std::string const &payload);
    void set_telemetry_sink(TelemetrySink sink);

    // Markers
    Observable<std::vector<ContactMarker>> &markers() noexcept;
    void refresh_markers();

    // Settings
    PresenceSettings settings() const;
    void update_settings(SettingsUpdate const &update);

  private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mp::engine
