#pragma once

#include "engine/Stores.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mp::storage
{
class Database;
}

namespace mp::engine
{

// SQLite-backed implementation of the engine's storage contracts. Every call
// takes the store mutex, so writers are serialized.
class PresenceStore final : public AnnounceStore,
                            public LocationStore,
                            public ContactDirectory
{
  public:
    explicit PresenceStore(std::filesystem::path path);
    ~PresenceStore() override;

    PresenceStore(PresenceStore const &) = delete;
    PresenceStore &operator=(PresenceStore const &) = delete;

    bool is_valid() const noexcept;

    // Settings
    std::optional<std::string> get_setting(std::string const &key) const;
    bool set_setting(std::string const &key, std::string const &value);
    bool remove_setting(std::string const &key);

    // AnnounceStore
    bool upsert(PeerAnnounce const &announce) override;
    std::optional<PeerAnnounce> find(PeerId const &peer) const override;
    std::optional<PeerAnnounce>
    find_by_identity(std::string const &identity_hash) const override;
    std::optional<std::vector<PeerAnnounce>>
    list_recent(AnnounceFilter const &filter) const override;
    std::optional<std::unordered_set<PeerId>>
    peer_ids_by_node_types(std::vector<NodeType> const &types) const override;
    bool remove(PeerId const &peer) override;
    bool set_favorite(PeerId const &peer, bool favorite,
                      TimePoint now) override;
    std::optional<std::int64_t> announce_count() const;

    // LocationStore
    bool insert_location(LocationUpdate const &update) override;
    std::optional<LocationUpdate>
    latest_location_for(PeerId const &sender) const override;
    std::optional<std::vector<LocationUpdate>>
    latest_location_per_sender() const override;
    std::optional<int> delete_locations_for(PeerId const &sender) override;
    std::optional<int>
    delete_expired_locations(TimePoint now,
                             std::chrono::milliseconds grace) override;
    std::optional<int> delete_superseded_locations() override;
    std::optional<std::int64_t> location_count() const;

    // ContactDirectory
    std::optional<std::string> nickname(PeerId const &peer) const override;
    bool is_sharing_with_me(PeerId const &peer) const override;
    bool set_nickname(PeerId const &peer,
                      std::optional<std::string> const &nickname) override;
    bool set_sharing_with_me(PeerId const &peer, bool sharing) override;

  private:
    std::unique_ptr<storage::Database> database_;
    mutable std::mutex mutex_;
};

// Applies the listing filter used by known_peers(); exposed for reuse by
// in-memory stores.
bool matches_filter(PeerAnnounce const &announce, AnnounceFilter const &filter);

} // namespace mp::engine
