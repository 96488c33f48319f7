#pragma once

#include "quorum_cache/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace quorum_cache {

// Victim selection is a function of the entry map and the policy's own
// tracking state only; the store calls the hooks under its lock.
class IEvictionPolicy {
public:
  virtual ~IEvictionPolicy() = default;
  virtual std::string name() const = 0;
  virtual void on_insert(const std::string &key, const Entry &entry) = 0;
  virtual void on_access(const std::string &key, const Entry &entry) = 0;
  virtual void on_erase(const std::string &key) = 0;
  virtual void reset() = 0;
  virtual std::optional<std::string>
  pick_victim(const std::unordered_map<std::string, Entry> &entries,
              TimePoint now) = 0;
};

// Returns nullptr for an unknown policy name. Names are case-insensitive:
// lru, lfu, fifo, ttl.
std::unique_ptr<IEvictionPolicy> make_policy_by_name(const std::string &mode);

} // namespace quorum_cache
