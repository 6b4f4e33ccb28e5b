#include "utils/StateStore.hpp"

#include "utils/Json.hpp"
#include "utils/Log.hpp"
#include <yyjson.h>

#include <filesystem>
#include <format>
#include <system_error>

namespace mp::storage
{

std::string serialize_string_list(std::vector<std::string> const &values)
{
    mp::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "[]";
    }
    auto *native = doc.doc();
    auto *root = yyjson_mut_arr(native);
    doc.set_root(root);
    for (auto const &value : values)
    {
        yyjson_mut_arr_add_strcpy(native, root, value.c_str());
    }
    return doc.write("[]");
}

std::vector<std::string> deserialize_string_list(std::string const &payload)
{
    std::vector<std::string> result;
    if (payload.empty())
    {
        return result;
    }
    auto doc = mp::json::Document::parse(payload);
    if (!doc.is_valid())
    {
        return result;
    }
    auto *root = doc.root();
    if (root == nullptr || !yyjson_is_arr(root))
    {
        return result;
    }
    size_t idx, limit;
    yyjson_val *entry = nullptr;
    yyjson_arr_foreach(root, idx, limit, entry)
    {
        if (yyjson_is_str(entry))
        {
            result.emplace_back(yyjson_get_str(entry), yyjson_get_len(entry));
        }
    }
    return result;
}

namespace
{

constexpr int kDatabaseBusyTimeoutMs = 5000;

std::vector<std::uint8_t> copy_column_blob(sqlite3_stmt *stmt, int index)
{
    auto size = sqlite3_column_bytes(stmt, index);
    if (size <= 0)
    {
        return {};
    }
    auto data = sqlite3_column_blob(stmt, index);
    if (data == nullptr)
    {
        return {};
    }
    return std::vector<std::uint8_t>(
        reinterpret_cast<std::uint8_t const *>(data),
        reinterpret_cast<std::uint8_t const *>(data) +
            static_cast<std::size_t>(size));
}

std::string column_string(sqlite3_stmt *stmt, int index)
{
    auto *text = reinterpret_cast<char const *>(sqlite3_column_text(stmt, index));
    if (text == nullptr)
    {
        return {};
    }
    return std::string(text,
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt, index)));
}

std::optional<std::string> column_optional_string(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL)
    {
        return std::nullopt;
    }
    return column_string(stmt, index);
}

std::optional<std::int64_t> column_optional_int64(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL)
    {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt, index));
}

void bind_text(sqlite3_stmt *stmt, int index, std::string const &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(),
                      static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void bind_blob(sqlite3_stmt *stmt, int index,
               std::vector<std::uint8_t> const &value)
{
    // A non-null pointer keeps an empty vector a zero-length blob, not NULL.
    static constexpr std::uint8_t kEmpty = 0;
    sqlite3_bind_blob(stmt, index, value.empty() ? &kEmpty : value.data(),
                      static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void bind_optional_int64(sqlite3_stmt *stmt, int index,
                         std::optional<std::int64_t> const &value)
{
    if (value)
    {
        sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(*value));
    }
    else
    {
        sqlite3_bind_null(stmt, index);
    }
}

void finish(sqlite3_stmt *stmt)
{
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
}

constexpr char const *kAnnounceColumns =
    "peer_id, public_key, display_name, node_type, aspect, hop_count, "
    "last_seen_at, receiving_interface, identity_hash, app_data, stamp_cost, "
    "favorite, favorited_at";

PersistedAnnounce read_announce(sqlite3_stmt *stmt)
{
    PersistedAnnounce entry;
    entry.peer_id = column_string(stmt, 0);
    entry.public_key = copy_column_blob(stmt, 1);
    entry.display_name = column_string(stmt, 2);
    entry.node_type = sqlite3_column_int(stmt, 3);
    entry.aspect = column_string(stmt, 4);
    entry.hop_count = sqlite3_column_int(stmt, 5);
    entry.last_seen_at = static_cast<std::int64_t>(sqlite3_column_int64(stmt, 6));
    entry.receiving_interface = column_string(stmt, 7);
    entry.identity_hash = column_string(stmt, 8);
    entry.app_data = copy_column_blob(stmt, 9);
    if (auto cost = column_optional_int64(stmt, 10))
    {
        entry.stamp_cost = static_cast<int>(*cost);
    }
    entry.favorite = sqlite3_column_int(stmt, 11) != 0;
    entry.favorited_at = column_optional_int64(stmt, 12);
    return entry;
}

constexpr char const *kLocationColumns =
    "sender_id, latitude, longitude, accuracy, captured_at, received_at, "
    "expires_at, approximate_radius, appearance_json";

PersistedLocation read_location(sqlite3_stmt *stmt)
{
    PersistedLocation entry;
    entry.sender_id = column_string(stmt, 0);
    entry.latitude = sqlite3_column_double(stmt, 1);
    entry.longitude = sqlite3_column_double(stmt, 2);
    entry.accuracy = sqlite3_column_double(stmt, 3);
    entry.captured_at = static_cast<std::int64_t>(sqlite3_column_int64(stmt, 4));
    entry.received_at = static_cast<std::int64_t>(sqlite3_column_int64(stmt, 5));
    entry.expires_at = column_optional_int64(stmt, 6);
    entry.approximate_radius = sqlite3_column_int(stmt, 7);
    entry.appearance_json = column_optional_string(stmt, 8);
    return entry;
}

} // namespace

Database::Database(std::filesystem::path path) : path_(std::move(path))
{
    if (path_.empty())
    {
        return;
    }
    auto parent = path_.parent_path();
    if (!parent.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            MP_LOG_WARN("failed to create {}: {}", parent.string(),
                        ec.message());
        }
    }
    int rc = sqlite3_open_v2(path_.string().c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                 SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK)
    {
        MP_LOG_ERROR("failed to open sqlite database {}: {}", path_.string(),
                     sqlite3_errstr(rc));
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    char *err_msg = nullptr;
    rc = sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr,
                      &err_msg);
    if (rc != SQLITE_OK)
    {
        if (err_msg != nullptr)
        {
            MP_LOG_WARN("failed to enable WAL journal mode: {}", err_msg);
        }
    }
    if (err_msg != nullptr)
    {
        sqlite3_free(err_msg);
    }
    sqlite3_busy_timeout(db_, kDatabaseBusyTimeoutMs);
    if (!ensure_schema())
    {
        MP_LOG_ERROR("schema setup failed for {}", path_.string());
        for (auto &entry : stmt_cache_)
        {
            sqlite3_finalize(entry.second);
        }
        stmt_cache_.clear();
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Database::~Database()
{
    for (auto &entry : stmt_cache_)
    {
        if (entry.second != nullptr)
        {
            sqlite3_finalize(entry.second);
        }
    }
    stmt_cache_.clear();
    if (db_)
    {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool Database::ensure_schema()
{
    if (!db_)
    {
        return false;
    }
    constexpr char const *kSchemaVersionSql =
        "CREATE TABLE IF NOT EXISTS schema_version ("
        "id INTEGER PRIMARY KEY CHECK(id = 1),"
        "version INTEGER NOT NULL);";
    if (!execute(kSchemaVersionSql))
    {
        return false;
    }
    return run_migrations();
}

bool Database::execute(std::string const &sql) const
{
    if (!db_)
    {
        return false;
    }
    char *err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK)
    {
        MP_LOG_WARN("sqlite error: {}",
                    err_msg != nullptr ? err_msg : sqlite3_errstr(rc));
        if (err_msg != nullptr)
        {
            sqlite3_free(err_msg);
        }
        return false;
    }
    return true;
}

bool Database::run_migrations()
{
    if (!ensure_schema_version_row())
    {
        return false;
    }
    auto current = schema_version().value_or(0);
    struct Migration
    {
        int version;
        bool (Database::*apply)() const;
    };
    static constexpr Migration kMigrations[] = {
        {1, &Database::apply_migration_v1},
        {2, &Database::apply_migration_v2},
    };
    for (auto const &migration : kMigrations)
    {
        if (current >= migration.version)
        {
            continue;
        }
        if (!begin_transaction())
        {
            return false;
        }
        if (!(this->*migration.apply)() ||
            !set_schema_version(migration.version))
        {
            MP_LOG_ERROR("schema migration v{} failed", migration.version);
            rollback_transaction();
            return false;
        }
        if (!commit_transaction())
        {
            return false;
        }
        current = migration.version;
    }
    return true;
}

bool Database::ensure_schema_version_row() const
{
    constexpr char const *sql =
        "INSERT OR IGNORE INTO schema_version (id, version) VALUES (1, 0);";
    return execute(sql);
}

std::optional<int> Database::schema_version() const
{
    constexpr char const *sql =
        "SELECT version FROM schema_version WHERE id = 1 LIMIT 1;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    std::optional<int> result;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        result = static_cast<int>(sqlite3_column_int(stmt, 0));
    }
    finish(stmt);
    return result;
}

bool Database::set_schema_version(int version) const
{
    constexpr char const *sql =
        "INSERT OR REPLACE INTO schema_version (id, version) VALUES (1, ?);";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_int(stmt, 1, version);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    return rc == SQLITE_DONE;
}

bool Database::apply_migration_v1() const
{
    constexpr char const *kSettingsSql = "CREATE TABLE IF NOT EXISTS settings ("
                                         "key TEXT PRIMARY KEY,"
                                         "value TEXT NOT NULL);";
    constexpr char const *kAnnouncesSql =
        "CREATE TABLE IF NOT EXISTS announces ("
        "peer_id TEXT PRIMARY KEY,"
        "public_key BLOB,"
        "display_name TEXT NOT NULL,"
        "node_type INTEGER NOT NULL,"
        "aspect TEXT NOT NULL,"
        "hop_count INTEGER NOT NULL,"
        "last_seen_at INTEGER NOT NULL,"
        "receiving_interface TEXT,"
        "identity_hash TEXT,"
        "app_data BLOB,"
        "stamp_cost INTEGER,"
        "favorite INTEGER NOT NULL DEFAULT 0,"
        "favorited_at INTEGER);";
    constexpr char const *kLocationsSql =
        "CREATE TABLE IF NOT EXISTS received_locations ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "sender_id TEXT NOT NULL,"
        "latitude REAL NOT NULL,"
        "longitude REAL NOT NULL,"
        "accuracy REAL NOT NULL,"
        "captured_at INTEGER NOT NULL,"
        "received_at INTEGER NOT NULL,"
        "expires_at INTEGER,"
        "approximate_radius INTEGER NOT NULL DEFAULT 0);";
    constexpr char const *kContactsSql =
        "CREATE TABLE IF NOT EXISTS contacts ("
        "peer_id TEXT PRIMARY KEY,"
        "nickname TEXT,"
        "sharing_with_me INTEGER NOT NULL DEFAULT 0);";
    return execute(kSettingsSql) && execute(kAnnouncesSql) &&
           execute(kLocationsSql) && execute(kContactsSql);
}

bool Database::apply_migration_v2() const
{
    return execute("ALTER TABLE received_locations ADD COLUMN "
                   "appearance_json TEXT;") &&
           execute("CREATE INDEX IF NOT EXISTS idx_announces_last_seen "
                   "ON announces(last_seen_at DESC);") &&
           execute("CREATE INDEX IF NOT EXISTS idx_locations_sender "
                   "ON received_locations(sender_id, received_at DESC);");
}

sqlite3_stmt *Database::prepare_cached(std::string const &sql) const
{
    if (!db_)
    {
        return nullptr;
    }
    auto it = stmt_cache_.find(sql);
    if (it != stmt_cache_.end())
    {
        if (it->second != nullptr)
        {
            finish(it->second);
        }
        return it->second;
    }
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        MP_LOG_ERROR("sqlite prepare failed: {}", sqlite3_errmsg(db_));
        return nullptr;
    }
    stmt_cache_.emplace(sql, stmt);
    return stmt;
}

int Database::changes() const
{
    return db_ ? sqlite3_changes(db_) : 0;
}

bool Database::begin_transaction() const
{
    return execute("BEGIN TRANSACTION;");
}

bool Database::commit_transaction() const
{
    return execute("COMMIT;");
}

bool Database::rollback_transaction() const
{
    return execute("ROLLBACK;");
}

std::optional<std::string> Database::get_setting(std::string const &key) const
{
    constexpr char const *sql =
        "SELECT value FROM settings WHERE key = ? LIMIT 1;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    bind_text(stmt, 1, key);
    std::optional<std::string> value;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        value = column_optional_string(stmt, 0);
    }
    finish(stmt);
    return value;
}

bool Database::set_setting(std::string const &key, std::string const &value)
{
    constexpr char const *sql =
        "INSERT OR REPLACE INTO settings (key, value) VALUES (?, ?);";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    bind_text(stmt, 1, key);
    bind_text(stmt, 2, value);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    return rc == SQLITE_DONE;
}

bool Database::remove_setting(std::string const &key)
{
    constexpr char const *sql = "DELETE FROM settings WHERE key = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    bind_text(stmt, 1, key);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    return rc == SQLITE_DONE;
}

bool Database::upsert_announce(PersistedAnnounce const &announce)
{
    constexpr char const *sql =
        "INSERT INTO announces (peer_id, public_key, display_name, node_type, "
        "aspect, hop_count, last_seen_at, receiving_interface, identity_hash, "
        "app_data, stamp_cost, favorite, favorited_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, 0, NULL) "
        "ON CONFLICT(peer_id) DO UPDATE SET "
        "public_key = CASE WHEN length(announces.public_key) > 0 "
        "THEN announces.public_key ELSE excluded.public_key END, "
        "display_name = excluded.display_name, "
        "node_type = excluded.node_type, "
        "aspect = excluded.aspect, "
        "hop_count = excluded.hop_count, "
        "last_seen_at = excluded.last_seen_at, "
        "receiving_interface = excluded.receiving_interface, "
        "identity_hash = excluded.identity_hash, "
        "app_data = excluded.app_data, "
        "stamp_cost = excluded.stamp_cost;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    bind_text(stmt, 1, announce.peer_id);
    bind_blob(stmt, 2, announce.public_key);
    bind_text(stmt, 3, announce.display_name);
    sqlite3_bind_int(stmt, 4, announce.node_type);
    bind_text(stmt, 5, announce.aspect);
    sqlite3_bind_int(stmt, 6, announce.hop_count);
    sqlite3_bind_int64(stmt, 7,
                       static_cast<sqlite3_int64>(announce.last_seen_at));
    bind_text(stmt, 8, announce.receiving_interface);
    bind_text(stmt, 9, announce.identity_hash);
    bind_blob(stmt, 10, announce.app_data);
    if (announce.stamp_cost)
    {
        sqlite3_bind_int(stmt, 11, *announce.stamp_cost);
    }
    else
    {
        sqlite3_bind_null(stmt, 11);
    }
    int rc = sqlite3_step(stmt);
    finish(stmt);
    if (rc != SQLITE_DONE)
    {
        MP_LOG_WARN("announce upsert for {} failed: {}", announce.peer_id,
                    sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::optional<PersistedAnnounce>
Database::load_announce(std::string const &peer_id) const
{
    static std::string const sql = std::format(
        "SELECT {} FROM announces WHERE peer_id = ? LIMIT 1;", kAnnounceColumns);
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    bind_text(stmt, 1, peer_id);
    std::optional<PersistedAnnounce> result;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        result = read_announce(stmt);
    }
    finish(stmt);
    return result;
}

std::optional<PersistedAnnounce>
Database::load_announce_by_identity(std::string const &identity_hash) const
{
    static std::string const sql =
        std::format("SELECT {} FROM announces WHERE identity_hash = ? "
                    "ORDER BY last_seen_at DESC LIMIT 1;",
                    kAnnounceColumns);
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    bind_text(stmt, 1, identity_hash);
    std::optional<PersistedAnnounce> result;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        result = read_announce(stmt);
    }
    finish(stmt);
    return result;
}

std::optional<std::vector<PersistedAnnounce>> Database::load_announces() const
{
    static std::string const sql = std::format(
        "SELECT {} FROM announces ORDER BY last_seen_at DESC;", kAnnounceColumns);
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    std::vector<PersistedAnnounce> result;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
    {
        result.push_back(read_announce(stmt));
    }
    finish(stmt);
    if (rc != SQLITE_DONE)
    {
        MP_LOG_WARN("announce listing failed: {}", sqlite3_errstr(rc));
        return std::nullopt;
    }
    return result;
}

std::optional<std::vector<std::string>>
Database::announce_ids_with_node_types(std::vector<int> const &node_types) const
{
    if (node_types.empty())
    {
        return std::vector<std::string>{};
    }
    std::string placeholders;
    for (std::size_t i = 0; i < node_types.size(); ++i)
    {
        placeholders.append(i == 0 ? "?" : ", ?");
    }
    auto sql = std::format(
        "SELECT peer_id FROM announces WHERE node_type IN ({});", placeholders);
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < node_types.size(); ++i)
    {
        sqlite3_bind_int(stmt, static_cast<int>(i + 1), node_types[i]);
    }
    std::vector<std::string> result;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
    {
        result.push_back(column_string(stmt, 0));
    }
    finish(stmt);
    if (rc != SQLITE_DONE)
    {
        MP_LOG_WARN("peer id query failed: {}", sqlite3_errstr(rc));
        return std::nullopt;
    }
    return result;
}

bool Database::delete_announce(std::string const &peer_id)
{
    constexpr char const *sql = "DELETE FROM announces WHERE peer_id = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    bind_text(stmt, 1, peer_id);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    return rc == SQLITE_DONE && changes() > 0;
}

bool Database::update_favorite(std::string const &peer_id, bool favorite,
                               std::optional<std::int64_t> favorited_at)
{
    constexpr char const *sql =
        "UPDATE announces SET favorite = ?, favorited_at = ? WHERE peer_id = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_int(stmt, 1, favorite ? 1 : 0);
    bind_optional_int64(stmt, 2, favorited_at);
    bind_text(stmt, 3, peer_id);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    return rc == SQLITE_DONE && changes() > 0;
}

std::optional<std::int64_t> Database::announce_count() const
{
    constexpr char const *sql = "SELECT COUNT(*) FROM announces;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    std::optional<std::int64_t> result;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        result = static_cast<std::int64_t>(sqlite3_column_int64(stmt, 0));
    }
    finish(stmt);
    return result;
}

bool Database::insert_location(PersistedLocation const &location)
{
    constexpr char const *sql =
        "INSERT INTO received_locations (sender_id, latitude, longitude, "
        "accuracy, captured_at, received_at, expires_at, approximate_radius, "
        "appearance_json) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    bind_text(stmt, 1, location.sender_id);
    sqlite3_bind_double(stmt, 2, location.latitude);
    sqlite3_bind_double(stmt, 3, location.longitude);
    sqlite3_bind_double(stmt, 4, location.accuracy);
    sqlite3_bind_int64(stmt, 5,
                       static_cast<sqlite3_int64>(location.captured_at));
    sqlite3_bind_int64(stmt, 6,
                       static_cast<sqlite3_int64>(location.received_at));
    bind_optional_int64(stmt, 7, location.expires_at);
    sqlite3_bind_int(stmt, 8, location.approximate_radius);
    if (location.appearance_json)
    {
        bind_text(stmt, 9, *location.appearance_json);
    }
    else
    {
        sqlite3_bind_null(stmt, 9);
    }
    int rc = sqlite3_step(stmt);
    finish(stmt);
    if (rc != SQLITE_DONE)
    {
        MP_LOG_WARN("location insert for {} failed: {}", location.sender_id,
                    sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::optional<PersistedLocation>
Database::latest_location(std::string const &sender_id) const
{
    static std::string const sql =
        std::format("SELECT {} FROM received_locations WHERE sender_id = ? "
                    "ORDER BY received_at DESC, id DESC LIMIT 1;",
                    kLocationColumns);
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    bind_text(stmt, 1, sender_id);
    std::optional<PersistedLocation> result;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        result = read_location(stmt);
    }
    finish(stmt);
    return result;
}

std::optional<std::vector<PersistedLocation>>
Database::latest_locations_per_sender() const
{
    static std::string const sql = std::format(
        "SELECT {} FROM received_locations r WHERE r.id = ("
        "SELECT r2.id FROM received_locations r2 "
        "WHERE r2.sender_id = r.sender_id "
        "ORDER BY r2.received_at DESC, r2.id DESC LIMIT 1) "
        "ORDER BY r.received_at DESC;",
        kLocationColumns);
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    std::vector<PersistedLocation> result;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
    {
        result.push_back(read_location(stmt));
    }
    finish(stmt);
    if (rc != SQLITE_DONE)
    {
        MP_LOG_WARN("latest location query failed: {}", sqlite3_errstr(rc));
        return std::nullopt;
    }
    return result;
}

std::optional<int> Database::delete_locations(std::string const &sender_id)
{
    constexpr char const *sql =
        "DELETE FROM received_locations WHERE sender_id = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    bind_text(stmt, 1, sender_id);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    if (rc != SQLITE_DONE)
    {
        return std::nullopt;
    }
    return changes();
}

std::optional<int> Database::delete_locations_expired_before(std::int64_t cutoff)
{
    constexpr char const *sql =
        "DELETE FROM received_locations "
        "WHERE expires_at IS NOT NULL AND expires_at < ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(cutoff));
    int rc = sqlite3_step(stmt);
    finish(stmt);
    if (rc != SQLITE_DONE)
    {
        return std::nullopt;
    }
    return changes();
}

std::optional<int> Database::delete_superseded_locations()
{
    constexpr char const *sql =
        "DELETE FROM received_locations WHERE EXISTS ("
        "SELECT 1 FROM received_locations newer "
        "WHERE newer.sender_id = received_locations.sender_id AND "
        "(newer.received_at > received_locations.received_at OR "
        "(newer.received_at = received_locations.received_at AND "
        "newer.id > received_locations.id)));";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    int rc = sqlite3_step(stmt);
    finish(stmt);
    if (rc != SQLITE_DONE)
    {
        MP_LOG_WARN("superseded location cleanup failed: {}",
                    sqlite3_errmsg(db_));
        return std::nullopt;
    }
    return changes();
}

std::optional<std::int64_t> Database::location_count() const
{
    constexpr char const *sql = "SELECT COUNT(*) FROM received_locations;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    std::optional<std::int64_t> result;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        result = static_cast<std::int64_t>(sqlite3_column_int64(stmt, 0));
    }
    finish(stmt);
    return result;
}

std::optional<PersistedContact>
Database::load_contact(std::string const &peer_id) const
{
    constexpr char const *sql =
        "SELECT peer_id, nickname, sharing_with_me FROM contacts "
        "WHERE peer_id = ? LIMIT 1;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    bind_text(stmt, 1, peer_id);
    std::optional<PersistedContact> result;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        PersistedContact contact;
        contact.peer_id = column_string(stmt, 0);
        contact.nickname = column_optional_string(stmt, 1);
        contact.sharing_with_me = sqlite3_column_int(stmt, 2) != 0;
        result = std::move(contact);
    }
    finish(stmt);
    return result;
}

bool Database::set_contact_nickname(std::string const &peer_id,
                                    std::optional<std::string> const &nickname)
{
    constexpr char const *sql =
        "INSERT INTO contacts (peer_id, nickname) VALUES (?, ?) "
        "ON CONFLICT(peer_id) DO UPDATE SET nickname = excluded.nickname;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    bind_text(stmt, 1, peer_id);
    if (nickname)
    {
        bind_text(stmt, 2, *nickname);
    }
    else
    {
        sqlite3_bind_null(stmt, 2);
    }
    int rc = sqlite3_step(stmt);
    finish(stmt);
    return rc == SQLITE_DONE;
}

bool Database::set_contact_sharing(std::string const &peer_id,
                                   bool sharing_with_me)
{
    constexpr char const *sql =
        "INSERT INTO contacts (peer_id, sharing_with_me) VALUES (?, ?) "
        "ON CONFLICT(peer_id) DO UPDATE SET "
        "sharing_with_me = excluded.sharing_with_me;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    bind_text(stmt, 1, peer_id);
    sqlite3_bind_int(stmt, 2, sharing_with_me ? 1 : 0);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    return rc == SQLITE_DONE;
}

} // namespace mp::storage
