#pragma once

#include "quorum_cache/policy.hpp"

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace quorum_cache {

struct LocalConfig {
  std::size_t max_size{1000};
  std::size_t memory_limit_bytes{100 * 1024 * 1024};
  std::string eviction_policy{"lru"};
  std::uint64_t ttl_sweep_interval_seconds{300};
  bool lazy_expiration{true};
  std::size_t ttl_sweep_batch{1024};
  std::size_t max_key_len{256};
  std::int64_t default_ttl_seconds{0};
  std::int64_t max_ttl_seconds{0};
  std::string key_namespace;
};

struct LocalStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t sets{0};
  std::uint64_t deletes{0};
  std::uint64_t evictions{0};
  std::uint64_t expirations{0};
  std::uint64_t over_limit_inserts{0};
  std::size_t size{0};
  std::size_t memory_used{0};
  bool over_limit{false};
};

class LocalCache {
public:
  // Throws std::invalid_argument if cfg.eviction_policy is unknown.
  explicit LocalCache(LocalConfig cfg);
  LocalCache(LocalConfig cfg, std::unique_ptr<IEvictionPolicy> policy);
  ~LocalCache();

  LocalCache(const LocalCache &) = delete;
  LocalCache &operator=(const LocalCache &) = delete;

  std::optional<Bytes> get(const std::string &key);
  bool set(const std::string &key, const Bytes &value,
           std::optional<std::int64_t> ttl_seconds = std::nullopt,
           std::string *err = nullptr);
  // set() that also labels the entry for invalidate_by_tags().
  bool set_tagged(const std::string &key, const Bytes &value,
                  std::optional<std::int64_t> ttl_seconds, const Tags &tags,
                  std::string *err = nullptr);
  bool del(const std::string &key);
  bool exists(const std::string &key);
  bool expire(const std::string &key, std::int64_t ttl_seconds,
              std::string *err = nullptr);
  std::int64_t ttl(const std::string &key);
  std::size_t clear();
  // Removes entries carrying at least one of `tags`; returns how many.
  std::size_t invalidate_by_tags(const Tags &tags);

  std::size_t sweep_expired();
  void start();
  void stop();
  bool running() const { return sweeper_.joinable(); }

  LocalStats stats() const;
  std::string info() const;
  std::size_t size() const;
  std::size_t memory_used() const;
  std::size_t pending_expiries() const;
  const LocalConfig &config() const { return cfg_; }
  std::string policy_name() const { return policy_->name(); }

private:
  struct ExpiryNode {
    TimePoint deadline;
    std::string key;
    std::uint64_t generation;
    bool operator>(const ExpiryNode &other) const {
      return deadline > other.deadline;
    }
  };

  std::string make_key(const std::string &key) const;
  bool validate_ttl(std::optional<std::int64_t> &ttl_seconds,
                    std::string *err) const;
  bool live_entry(const std::string &key, TimePoint now);
  void schedule_expiry(const std::string &key, TimePoint deadline);
  void compact_expiries();
  void erase_internal(const std::string &key, bool eviction, bool expiration);
  void ensure_space(std::size_t needed, TimePoint now);
  void sweep_loop();

  LocalConfig cfg_;
  std::unique_ptr<IEvictionPolicy> policy_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, Entry> entries_;
  std::unordered_map<std::string, std::uint64_t> expiry_generation_;
  std::priority_queue<ExpiryNode, std::vector<ExpiryNode>,
                      std::greater<ExpiryNode>>
      expiry_heap_;
  LocalStats stats_;
  std::size_t memory_used_{0};
  std::uint64_t seq_{0};
  std::uint64_t expiry_seq_{0};

  std::thread sweeper_;
  std::mutex sweep_mu_;
  std::condition_variable sweep_cv_;
  bool stop_sweep_{false};
};

} // namespace quorum_cache
