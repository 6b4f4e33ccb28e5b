#pragma once

#include "engine/Core.hpp"
#include "utils/Hex.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace mp::engine {

inline std::optional<PeerId> peer_id_from_bytes(std::span<std::uint8_t const> bytes) {
  if (bytes.size() != kPeerIdLength) {
    return std::nullopt;
  }
  return utils::encode_hex(bytes);
}

// Accepts any case and ':' separators; the result is the canonical form.
inline std::optional<PeerId> normalize_peer_id(std::string_view text) {
  auto bytes = utils::decode_hex(text);
  if (!bytes) {
    return std::nullopt;
  }
  return peer_id_from_bytes(*bytes);
}

inline std::string truncated_id(std::string_view id, std::size_t length = 8) {
  return std::string(id.substr(0, length));
}

inline std::int64_t to_unix_nanos(TimePoint value) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(value.time_since_epoch())
      .count();
}

inline TimePoint from_unix_nanos(std::int64_t value) {
  return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(value)));
}

inline std::int64_t to_unix_millis(TimePoint value) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(value.time_since_epoch())
      .count();
}

inline TimePoint from_unix_millis(std::int64_t value) {
  return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(value)));
}

inline char const *to_string(NodeType type) {
  switch (type) {
  case NodeType::Peer:
    return "PEER";
  case NodeType::Node:
    return "NODE";
  case NodeType::PropagationNode:
    return "PROPAGATION_NODE";
  }
  return "PEER";
}

inline std::optional<NodeType> parse_node_type(std::string_view value) {
  auto upper = utils::to_upper_ascii(value);
  if (upper == "PEER") {
    return NodeType::Peer;
  }
  if (upper == "NODE") {
    return NodeType::Node;
  }
  if (upper == "PROPAGATION_NODE") {
    return NodeType::PropagationNode;
  }
  return std::nullopt;
}

inline char const *to_string(NetworkStatus status) {
  switch (status) {
  case NetworkStatus::Initializing:
    return "INITIALIZING";
  case NetworkStatus::Connecting:
    return "CONNECTING";
  case NetworkStatus::Ready:
    return "READY";
  case NetworkStatus::Error:
    return "ERROR";
  case NetworkStatus::Shutdown:
    return "SHUTDOWN";
  }
  return "ERROR";
}

inline std::optional<NetworkStatus> parse_network_status(std::string_view value) {
  auto upper = utils::to_upper_ascii(value);
  if (upper == "INITIALIZING") {
    return NetworkStatus::Initializing;
  }
  if (upper == "CONNECTING") {
    return NetworkStatus::Connecting;
  }
  if (upper == "READY") {
    return NetworkStatus::Ready;
  }
  if (upper == "ERROR") {
    return NetworkStatus::Error;
  }
  if (upper == "SHUTDOWN") {
    return NetworkStatus::Shutdown;
  }
  return std::nullopt;
}

inline char const *to_string(Relationship relationship) {
  switch (relationship) {
  case Relationship::None:
    return "NONE";
  case Relationship::SharingWithThem:
    return "SHARING_WITH_THEM";
  case Relationship::TheyShareWithMe:
    return "THEY_SHARE_WITH_ME";
  case Relationship::Mutual:
    return "MUTUAL";
  }
  return "NONE";
}

inline char const *to_string(MarkerFreshness freshness) {
  switch (freshness) {
  case MarkerFreshness::Fresh:
    return "FRESH";
  case MarkerFreshness::Stale:
    return "STALE";
  case MarkerFreshness::ExpiredGracePeriod:
    return "EXPIRED_GRACE_PERIOD";
  }
  return "FRESH";
}

// Resolves a preset to a concrete length at `now`; nothing means indefinite.
inline std::optional<std::chrono::milliseconds> duration_for(SharingDuration preset,
                                                             TimePoint now) {
  using namespace std::chrono_literals;
  switch (preset) {
  case SharingDuration::FifteenMinutes:
    return std::chrono::milliseconds(15min);
  case SharingDuration::OneHour:
    return std::chrono::milliseconds(1h);
  case SharingDuration::FourHours:
    return std::chrono::milliseconds(4h);
  case SharingDuration::UntilMidnight: {
    auto const seconds = Clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &seconds);
#else
    localtime_r(&seconds, &tm);
#endif
    tm.tm_hour = 0;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    tm.tm_mday += 1;
    tm.tm_isdst = -1;
    auto const midnight = Clock::from_time_t(std::mktime(&tm));
    if (midnight <= now) {
      return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(midnight - now);
  }
  case SharingDuration::Indefinite:
    return std::nullopt;
  }
  return std::nullopt;
}

} // namespace mp::engine
