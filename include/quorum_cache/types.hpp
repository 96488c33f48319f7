#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace quorum_cache {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Bytes = std::vector<std::uint8_t>;
using Tags = std::unordered_set<std::string>;

// Errors for arguments a store refuses. They describe the request, not the
// health of the node that reported them.
inline constexpr const char *kInvalidKeyLength = "invalid key length";
inline constexpr const char *kInvalidTtl = "invalid ttl";

inline bool is_argument_error(const std::string &err) {
  return err == kInvalidKeyLength || err == kInvalidTtl;
}

struct Entry {
  Bytes value;
  std::size_t size_bytes{0};
  TimePoint created_at{};
  TimePoint last_access{};
  std::uint64_t access_count{0};
  std::optional<TimePoint> ttl_deadline;
  std::uint64_t seq{0};
  Tags tags;

  bool is_expired(TimePoint now) const {
    return ttl_deadline.has_value() && now > *ttl_deadline;
  }

  void touch(TimePoint now) {
    ++access_count;
    last_access = now;
  }

  bool tagged_any(const Tags &wanted) const {
    for (const auto &t : wanted)
      if (tags.contains(t))
        return true;
    return false;
  }
};

inline Bytes to_bytes(const std::string &s) { return Bytes(s.begin(), s.end()); }

inline std::string to_string(const Bytes &b) {
  return std::string(b.begin(), b.end());
}

} // namespace quorum_cache
