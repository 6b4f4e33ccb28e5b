#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <sqlite3.h>

namespace mp::storage {

// Timestamps are signed nanoseconds since the Unix epoch.
struct PersistedAnnounce {
  std::string peer_id;
  std::vector<std::uint8_t> public_key;
  std::string display_name;
  int node_type = 0;
  std::string aspect;
  int hop_count = 0;
  std::int64_t last_seen_at = 0;
  std::string receiving_interface;
  std::string identity_hash;
  std::vector<std::uint8_t> app_data;
  std::optional<int> stamp_cost;
  bool favorite = false;
  std::optional<std::int64_t> favorited_at;
};

struct PersistedLocation {
  std::string sender_id;
  double latitude = 0.0;
  double longitude = 0.0;
  double accuracy = 0.0;
  std::int64_t captured_at = 0;
  std::int64_t received_at = 0;
  std::optional<std::int64_t> expires_at;
  int approximate_radius = 0;
  std::optional<std::string> appearance_json;
};

struct PersistedContact {
  std::string peer_id;
  std::optional<std::string> nickname;
  bool sharing_with_me = false;
};

std::string serialize_string_list(std::vector<std::string> const &values);
std::vector<std::string> deserialize_string_list(std::string const &payload);

class Database {
public:
  explicit Database(std::filesystem::path path);
  ~Database();

  Database(Database const &) = delete;
  Database &operator=(Database const &) = delete;

  bool is_valid() const noexcept { return db_ != nullptr; }
  std::filesystem::path const &path() const noexcept { return path_; }

  std::optional<std::string> get_setting(std::string const &key) const;
  bool set_setting(std::string const &key, std::string const &value);
  bool remove_setting(std::string const &key);
  bool begin_transaction() const;
  bool commit_transaction() const;
  bool rollback_transaction() const;

  // Keeps the stored public key and favorite flags of an existing row.
  bool upsert_announce(PersistedAnnounce const &announce);
  std::optional<PersistedAnnounce> load_announce(std::string const &peer_id) const;
  std::optional<PersistedAnnounce>
  load_announce_by_identity(std::string const &identity_hash) const;
  // Most recently seen first. std::nullopt signals a query failure.
  std::optional<std::vector<PersistedAnnounce>> load_announces() const;
  std::optional<std::vector<std::string>>
  announce_ids_with_node_types(std::vector<int> const &node_types) const;
  bool delete_announce(std::string const &peer_id);
  bool update_favorite(std::string const &peer_id, bool favorite,
                       std::optional<std::int64_t> favorited_at);
  std::optional<std::int64_t> announce_count() const;

  bool insert_location(PersistedLocation const &location);
  std::optional<PersistedLocation> latest_location(std::string const &sender_id) const;
  std::optional<std::vector<PersistedLocation>> latest_locations_per_sender() const;
  std::optional<int> delete_locations(std::string const &sender_id);
  // Removes rows whose expiry lies before `cutoff`.
  std::optional<int> delete_locations_expired_before(std::int64_t cutoff);
  // Removes every row but the newest per sender.
  std::optional<int> delete_superseded_locations();
  std::optional<std::int64_t> location_count() const;

  std::optional<PersistedContact> load_contact(std::string const &peer_id) const;
  bool set_contact_nickname(std::string const &peer_id,
                            std::optional<std::string> const &nickname);
  bool set_contact_sharing(std::string const &peer_id, bool sharing_with_me);

private:
  bool ensure_schema();
  bool execute(std::string const &sql) const;
  bool run_migrations();
  bool ensure_schema_version_row() const;
  std::optional<int> schema_version() const;
  bool set_schema_version(int version) const;
  bool apply_migration_v1() const;
  bool apply_migration_v2() const;
  sqlite3_stmt *prepare_cached(std::string const &sql) const;
  int changes() const;

  std::filesystem::path path_;
  sqlite3 *db_ = nullptr;
  mutable std::unordered_map<std::string, sqlite3_stmt *> stmt_cache_;
};

} // namespace mp::storage
