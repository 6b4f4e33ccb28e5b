#include "engine/PresenceStore.hpp"

#include "engine/PresenceUtils.hpp"
#include "utils/Hex.hpp"
#include "utils/Log.hpp"
#include "utils/StateStore.hpp"

#include <algorithm>
#include <utility>

namespace
{

using mp::engine::LocationUpdate;
using mp::engine::NodeType;
using mp::engine::PeerAnnounce;

mp::storage::PersistedAnnounce to_persisted(PeerAnnounce const &announce)
{
    mp::storage::PersistedAnnounce row;
    row.peer_id = announce.peer_id;
    row.public_key = announce.public_key;
    row.display_name = announce.display_name;
    row.node_type = static_cast<int>(announce.node_type);
    row.aspect = announce.aspect;
    row.hop_count = announce.hop_count;
    row.last_seen_at = mp::engine::to_unix_nanos(announce.last_seen_at);
    row.receiving_interface = announce.receiving_interface;
    row.identity_hash = announce.identity_hash;
    row.app_data = announce.app_data;
    row.stamp_cost = announce.stamp_cost;
    return row;
}

PeerAnnounce from_persisted(mp::storage::PersistedAnnounce row)
{
    PeerAnnounce announce;
    announce.peer_id = std::move(row.peer_id);
    announce.public_key = std::move(row.public_key);
    announce.display_name = std::move(row.display_name);
    switch (row.node_type)
    {
    case static_cast<int>(NodeType::Node):
        announce.node_type = NodeType::Node;
        break;
    case static_cast<int>(NodeType::PropagationNode):
        announce.node_type = NodeType::PropagationNode;
        break;
    default:
        announce.node_type = NodeType::Peer;
        break;
    }
    announce.aspect = std::move(row.aspect);
    announce.hop_count = row.hop_count;
    announce.last_seen_at = mp::engine::from_unix_nanos(row.last_seen_at);
    announce.receiving_interface = std::move(row.receiving_interface);
    announce.identity_hash = std::move(row.identity_hash);
    announce.app_data = std::move(row.app_data);
    announce.stamp_cost = row.stamp_cost;
    announce.favorite = row.favorite;
    if (row.favorited_at)
    {
        announce.favorited_at = mp::engine::from_unix_nanos(*row.favorited_at);
    }
    return announce;
}

mp::storage::PersistedLocation to_persisted(LocationUpdate const &update)
{
    mp::storage::PersistedLocation row;
    row.sender_id = update.sender_id;
    row.latitude = update.latitude;
    row.longitude = update.longitude;
    row.accuracy = update.accuracy_meters;
    row.captured_at = mp::engine::to_unix_nanos(update.captured_at);
    row.received_at = mp::engine::to_unix_nanos(update.received_at);
    if (update.expires_at)
    {
        row.expires_at = mp::engine::to_unix_nanos(*update.expires_at);
    }
    row.approximate_radius = update.approximate_radius_meters;
    row.appearance_json = update.appearance_json;
    return row;
}

LocationUpdate from_persisted(mp::storage::PersistedLocation row)
{
    LocationUpdate update;
    update.sender_id = std::move(row.sender_id);
    update.latitude = row.latitude;
    update.longitude = row.longitude;
    update.accuracy_meters = static_cast<float>(row.accuracy);
    update.captured_at = mp::engine::from_unix_nanos(row.captured_at);
    update.received_at = mp::engine::from_unix_nanos(row.received_at);
    if (row.expires_at)
    {
        update.expires_at = mp::engine::from_unix_nanos(*row.expires_at);
    }
    update.approximate_radius_meters = row.approximate_radius;
    update.appearance_json = std::move(row.appearance_json);
    return update;
}

} // namespace

namespace mp::engine
{

bool matches_filter(PeerAnnounce const &announce, AnnounceFilter const &filter)
{
    if (!filter.node_types.empty() &&
        std::find(filter.node_types.begin(), filter.node_types.end(),
                  announce.node_type) == filter.node_types.end())
    {
        return false;
    }
    if (!filter.include_audio && announce.aspect == kAspectAudioCall)
    {
        return false;
    }
    if (!filter.search.empty())
    {
        auto needle = utils::to_lower_ascii(filter.search);
        auto name = utils::to_lower_ascii(announce.display_name);
        if (name.find(needle) == std::string::npos &&
            announce.peer_id.find(needle) == std::string::npos)
        {
            return false;
        }
    }
    return true;
}

PresenceStore::PresenceStore(std::filesystem::path path)
    : database_(std::make_unique<storage::Database>(std::move(path)))
{
    if (!database_->is_valid())
    {
        MP_LOG_ERROR("presence store unavailable at {}",
                     database_->path().string());
    }
}

PresenceStore::~PresenceStore() = default;

bool PresenceStore::is_valid() const noexcept
{
    return database_ != nullptr && database_->is_valid();
}

std::optional<std::string>
PresenceStore::get_setting(std::string const &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return database_->get_setting(key);
}

bool PresenceStore::set_setting(std::string const &key,
                                std::string const &value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return database_->set_setting(key, value);
}

bool PresenceStore::remove_setting(std::string const &key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return database_->remove_setting(key);
}

bool PresenceStore::upsert(PeerAnnounce const &announce)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_valid())
    {
        return false;
    }
    if (auto existing = database_->load_announce(announce.peer_id);
        existing && !existing->public_key.empty() &&
        !announce.public_key.empty() &&
        existing->public_key != announce.public_key)
    {
        MP_LOG_WARN("peer {} announced a different public key; keeping the "
                    "first one",
                    announce.peer_id);
    }
    return database_->upsert_announce(to_persisted(announce));
}

std::optional<PeerAnnounce> PresenceStore::find(PeerId const &peer) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto row = database_->load_announce(peer);
    if (!row)
    {
        return std::nullopt;
    }
    return from_persisted(std::move(*row));
}

std::optional<PeerAnnounce>
PresenceStore::find_by_identity(std::string const &identity_hash) const
{
    if (identity_hash.empty())
    {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto row = database_->load_announce_by_identity(identity_hash);
    if (!row)
    {
        return std::nullopt;
    }
    return from_persisted(std::move(*row));
}

std::optional<std::vector<PeerAnnounce>>
PresenceStore::list_recent(AnnounceFilter const &filter) const
{
    std::optional<std::vector<storage::PersistedAnnounce>> rows;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rows = database_->load_announces();
    }
    if (!rows)
    {
        return std::nullopt;
    }
    std::vector<PeerAnnounce> result;
    result.reserve(rows->size());
    for (auto &row : *rows)
    {
        auto announce = from_persisted(std::move(row));
        if (!matches_filter(announce, filter))
        {
            continue;
        }
        result.push_back(std::move(announce));
        if (filter.limit > 0 && result.size() >= filter.limit)
        {
            break;
        }
    }
    return result;
}

std::optional<std::unordered_set<PeerId>>
PresenceStore::peer_ids_by_node_types(std::vector<NodeType> const &types) const
{
    std::vector<int> codes;
    codes.reserve(types.size());
    for (auto type : types)
    {
        codes.push_back(static_cast<int>(type));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto ids = database_->announce_ids_with_node_types(codes);
    if (!ids)
    {
        return std::nullopt;
    }
    return std::unordered_set<PeerId>(ids->begin(), ids->end());
}

bool PresenceStore::remove(PeerId const &peer)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return database_->delete_announce(peer);
}

bool PresenceStore::set_favorite(PeerId const &peer, bool favorite,
                                 TimePoint now)
{
    std::optional<std::int64_t> stamp;
    if (favorite)
    {
        stamp = to_unix_nanos(now);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return database_->update_favorite(peer, favorite, stamp);
}

std::optional<std::int64_t> PresenceStore::announce_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return database_->announce_count();
}

bool PresenceStore::insert_location(LocationUpdate const &update)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return database_->insert_location(to_persisted(update));
}

std::optional<LocationUpdate>
PresenceStore::latest_location_for(PeerId const &sender) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto row = database_->latest_location(sender);
    if (!row)
    {
        return std::nullopt;
    }
    return from_persisted(std::move(*row));
}

std::optional<std::vector<LocationUpdate>>
PresenceStore::latest_location_per_sender() const
{
    std::optional<std::vector<storage::PersistedLocation>> rows;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rows = database_->latest_locations_per_sender();
    }
    if (!rows)
    {
        return std::nullopt;
    }
    std::vector<LocationUpdate> result;
    result.reserve(rows->size());
    for (auto &row : *rows)
    {
        result.push_back(from_persisted(std::move(row)));
    }
    return result;
}

std::optional<int> PresenceStore::delete_locations_for(PeerId const &sender)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return database_->delete_locations(sender);
}

std::optional<int>
PresenceStore::delete_expired_locations(TimePoint now,
                                        std::chrono::milliseconds grace)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return database_->delete_locations_expired_before(
        to_unix_nanos(now - grace));
}

std::optional<int> PresenceStore::delete_superseded_locations()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return database_->delete_superseded_locations();
}

std::optional<std::int64_t> PresenceStore::location_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return database_->location_count();
}

std::optional<std::string> PresenceStore::nickname(PeerId const &peer) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto contact = database_->load_contact(peer);
    if (!contact || !contact->nickname || contact->nickname->empty())
    {
        return std::nullopt;
    }
    return contact->nickname;
}

bool PresenceStore::is_sharing_with_me(PeerId const &peer) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto contact = database_->load_contact(peer);
    return contact && contact->sharing_with_me;
}

bool PresenceStore::set_nickname(PeerId const &peer,
                                 std::optional<std::string> const &nickname)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return database_->set_contact_nickname(peer, nickname);
}

bool PresenceStore::set_sharing_with_me(PeerId const &peer, bool sharing)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return database_->set_contact_sharing(peer, sharing);
}

} // namespace mp::engine
