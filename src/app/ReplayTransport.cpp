#include "app/ReplayTransport.hpp"

#include "engine/PresenceUtils.hpp"
#include "utils/Hex.hpp"
#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <fstream>
#include <iterator>
#include <string>
#include <utility>

namespace mp::app
{

namespace
{

std::vector<std::uint8_t> bytes_field(yyjson_val *object, char const *key)
{
    auto text = mp::json::string_field(object, key);
    if (!text)
    {
        return {};
    }
    auto decoded = mp::utils::decode_hex(*text);
    if (!decoded)
    {
        MP_LOG_WARN("replay: '{}' is not hex", key);
        return {};
    }
    return std::move(*decoded);
}

std::optional<engine::RawAnnounce> parse_announce(yyjson_val *entry)
{
    if (!yyjson_is_obj(entry))
    {
        return std::nullopt;
    }
    engine::RawAnnounce announce;
    announce.destination_hash = bytes_field(entry, "destination_hash");
    announce.public_key = bytes_field(entry, "public_key");
    announce.app_data = bytes_field(entry, "app_data");
    announce.identity_hash = bytes_field(entry, "identity_hash");
    announce.display_name = mp::json::string_field(entry, "display_name");
    announce.hops =
        static_cast<int>(mp::json::int_field(entry, "hops").value_or(0));
    if (auto millis = mp::json::int_field(entry, "timestamp_ms"))
    {
        announce.timestamp = engine::from_unix_millis(*millis);
    }
    else
    {
        announce.timestamp = engine::Clock::now();
    }
    announce.receiving_interface =
        mp::json::string_field(entry, "interface").value_or("replay");
    if (auto type = mp::json::string_field(entry, "node_type"))
    {
        auto parsed = engine::parse_node_type(*type);
        if (!parsed)
        {
            MP_LOG_WARN("replay: unknown node type '{}'", *type);
            return std::nullopt;
        }
        announce.node_type = *parsed;
    }
    announce.aspect = mp::json::string_field(entry, "aspect").value_or("");
    if (auto cost = mp::json::int_field(entry, "stamp_cost"))
    {
        announce.stamp_cost = static_cast<int>(*cost);
    }
    return announce;
}

} // namespace

std::unique_ptr<ReplayTransport>
ReplayTransport::load(std::filesystem::path const &path)
{
    std::ifstream input(path, std::ios::binary);
    if (!input)
    {
        MP_LOG_ERROR("unable to open replay file {}", path.string());
        return nullptr;
    }
    std::string payload((std::istreambuf_iterator<char>(input)),
                        std::istreambuf_iterator<char>());
    return parse(payload);
}

std::unique_ptr<ReplayTransport> ReplayTransport::parse(std::string_view payload)
{
    auto doc = mp::json::Document::parse(payload);
    auto *root = doc.root();
    if (!doc.is_valid() || !yyjson_is_obj(root))
    {
        MP_LOG_ERROR("replay document is not a JSON object");
        return nullptr;
    }

    std::unique_ptr<ReplayTransport> transport(new ReplayTransport());
    if (auto status = mp::json::string_field(root, "status"))
    {
        auto parsed = engine::parse_network_status(*status);
        if (!parsed)
        {
            MP_LOG_ERROR("replay: unknown network status '{}'", *status);
            return nullptr;
        }
        transport->status_ = *parsed;
    }

    if (auto *table = yyjson_obj_get(root, "path_table");
        yyjson_is_arr(table))
    {
        std::size_t idx = 0;
        std::size_t max = 0;
        yyjson_val *entry = nullptr;
        yyjson_arr_foreach(table, idx, max, entry)
        {
            if (!yyjson_is_str(entry))
            {
                continue;
            }
            auto id = engine::normalize_peer_id(yyjson_get_str(entry));
            if (!id)
            {
                MP_LOG_WARN("replay: skipping path entry '{}'",
                            yyjson_get_str(entry));
                continue;
            }
            transport->path_table_.insert(std::move(*id));
        }
    }

    if (auto *list = yyjson_obj_get(root, "announces"); yyjson_is_arr(list))
    {
        std::size_t idx = 0;
        std::size_t max = 0;
        yyjson_val *entry = nullptr;
        yyjson_arr_foreach(list, idx, max, entry)
        {
            if (auto announce = parse_announce(entry))
            {
                transport->announces_.push_back(std::move(*announce));
            }
            else
            {
                MP_LOG_WARN("replay: skipping announce #{}", idx);
            }
        }
    }

    MP_LOG_INFO("replay loaded: {} announce(s), {} path(s)",
                transport->announces_.size(), transport->path_table_.size());
    return transport;
}

ReplayTransport::SubscriptionId
ReplayTransport::subscribe_announces(AnnounceHandler handler)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_id_++;
    handlers_.emplace(id, std::move(handler));
    return id;
}

void ReplayTransport::unsubscribe_announces(SubscriptionId id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.erase(id);
}

std::unordered_set<engine::PeerId> ReplayTransport::path_table_snapshot()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return path_table_;
}

engine::NetworkStatus ReplayTransport::network_status() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::size_t ReplayTransport::subscriber_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size();
}

void ReplayTransport::set_network_status(engine::NetworkStatus status)
{
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = status;
}

std::size_t ReplayTransport::emit_all()
{
    std::vector<AnnounceHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto const &entry : handlers_)
        {
            handlers.push_back(entry.second);
        }
    }
    if (handlers.empty())
    {
        return 0;
    }
    for (auto const &announce : announces_)
    {
        for (auto const &handler : handlers)
        {
            handler(announce);
        }
    }
    return announces_.size();
}

} // namespace mp::app
