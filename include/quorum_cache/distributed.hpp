#pragma once

#include "quorum_cache/backend.hpp"
#include "quorum_cache/hash_ring.hpp"
#include "quorum_cache/worker_pool.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace quorum_cache {

enum class ConsistencyLevel { One, Quorum, All };

std::optional<ConsistencyLevel> parse_consistency(const std::string &name);
std::string to_string(ConsistencyLevel level);

// one -> 1, quorum -> floor(r / 2) + 1, all -> r.
std::size_t replicas_required(ConsistencyLevel level,
                              std::size_t replication_factor);

struct DistributedConfig {
  std::vector<CacheNode> nodes;
  std::size_t virtual_nodes{160};
  std::string hash_algorithm{"sha256"};
  std::size_t replication_factor{1};
  ConsistencyLevel read_consistency{ConsistencyLevel::One};
  ConsistencyLevel write_consistency{ConsistencyLevel::One};
  bool read_repair{true};
  std::uint32_t failure_threshold{3};
  std::uint64_t health_check_interval_seconds{30};
  std::uint64_t recovery_interval_seconds{60};
  std::uint64_t node_timeout_ms{1000};
  std::size_t worker_threads{8};
  std::size_t max_key_len{256};
};

bool validate(const DistributedConfig &cfg, std::string *err = nullptr);

struct DistributedStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t sets{0};
  std::uint64_t deletes{0};
  std::uint64_t errors{0};
  std::uint64_t node_failures{0};
  std::uint64_t read_repairs{0};
  std::uint64_t read_repair_failures{0};
  std::uint64_t quarantines{0};
  std::uint64_t recoveries{0};
};

struct NodeStatus {
  CacheNode node;
  bool connected{false};
  bool in_ring{false};
  bool quarantined{false};
  std::uint32_t failures{0};
};

using BackendFactory =
    std::function<std::shared_ptr<ICacheBackend>(const CacheNode &)>;

// Shards keys over per-node backends with a consistent-hash ring and
// replicates them with tunable read/write consistency. Nodes that fail
// failure_threshold consecutive calls are quarantined (removed from the ring)
// until a health probe succeeds.
class DistributedCache final : public ICacheBackend {
public:
  // Throws std::invalid_argument when validate(cfg) fails.
  DistributedCache(DistributedConfig cfg, BackendFactory factory);
  ~DistributedCache() override;

  DistributedCache(const DistributedCache &) = delete;
  DistributedCache &operator=(const DistributedCache &) = delete;

  std::string name() const override { return "distributed"; }
  bool connect(std::string *err = nullptr) override;
  bool disconnect(std::string *err = nullptr) override;
  bool ping(std::string *err = nullptr) override;
  bool get(const std::string &key, std::optional<Bytes> *out,
           std::string *err = nullptr) override;
  bool set(const std::string &key, const Bytes &value,
           std::optional<std::int64_t> ttl_seconds,
           std::string *err = nullptr) override;
  bool del(const std::string &key, std::string *err = nullptr) override;
  bool exists(const std::string &key, bool *out,
              std::string *err = nullptr) override;
  bool expire(const std::string &key, std::int64_t ttl_seconds,
              std::string *err = nullptr) override;
  bool ttl(const std::string &key, std::int64_t *out,
           std::string *err = nullptr) override;
  bool clear(std::string *err = nullptr) override;
  bool set_tagged(const std::string &key, const Bytes &value,
                  std::optional<std::int64_t> ttl_seconds, const Tags &tags,
                  std::string *err = nullptr) override;
  // Best effort on every available node; `removed` sums what they dropped.
  bool invalidate_by_tags(const Tags &tags, std::size_t *removed,
                          std::string *err = nullptr) override;

  bool add_node(const CacheNode &node, std::string *err = nullptr);
  bool remove_node(const std::string &node_id);

  // Probes quarantined nodes due for a retry; returns how many recovered.
  std::size_t check_health();

  bool is_quarantined(const std::string &node_id) const;
  std::uint32_t failure_count(const std::string &node_id) const;
  std::shared_ptr<ICacheBackend> backend(const std::string &node_id) const;

  const ConsistentHashRing &ring() const { return ring_; }
  const DistributedConfig &config() const { return cfg_; }
  bool connected() const { return connected_; }
  DistributedStats stats() const;
  std::vector<NodeStatus> cluster_stats() const;
  std::string info() const;

private:
  struct NodeHandle {
    CacheNode node;
    std::shared_ptr<ICacheBackend> backend;
    bool connected{false};
    // Calls that timed out but are still running on a worker. While
    // non-zero the node gets no new work.
    std::shared_ptr<std::atomic<std::uint32_t>> overdue;
  };

  struct FailureState {
    std::uint32_t failures{0};
    bool quarantined{false};
    TimePoint last_attempt{};
  };

  struct Reply {
    bool completed{false};
    bool ok{false};
    std::optional<Bytes> value;
    bool flag{false};
    std::int64_t number{-1};
    std::string err;
  };

  using NodeCall = std::function<Reply(const NodeHandle &)>;

  struct Counters {
    std::atomic<std::uint64_t> hits{0};
    std::atomic<std::uint64_t> misses{0};
    std::atomic<std::uint64_t> sets{0};
    std::atomic<std::uint64_t> deletes{0};
    std::atomic<std::uint64_t> errors{0};
    std::atomic<std::uint64_t> node_failures{0};
    std::atomic<std::uint64_t> read_repairs{0};
    std::atomic<std::uint64_t> read_repair_failures{0};
    std::atomic<std::uint64_t> quarantines{0};
    std::atomic<std::uint64_t> recoveries{0};
  };

  std::vector<NodeHandle> replicas_for(const std::string &key,
                                       std::size_t count) const;
  std::vector<NodeHandle> all_available() const;

  std::vector<Reply> fan_out(const std::vector<NodeHandle> &targets,
                             const NodeCall &call, std::size_t required_ok,
                             bool wait_all, bool account = true);
  static Reply invoke(const NodeCall &call, const NodeHandle &target);
  static bool lane_blocked(const NodeHandle &h);
  bool check_args(const std::string &key,
                  std::optional<std::int64_t> ttl_seconds, std::string *err);
  void record_result(const std::string &node_id, bool ok,
                     const std::string &err);
  bool read_path(const std::string &key, const NodeCall &call,
                 const char *op, std::vector<NodeHandle> *targets,
                 std::vector<Reply> *replies, std::string *err);
  bool write_path(const std::string &key, const NodeCall &call,
                  const char *op, std::string *err);
  void best_effort(const std::vector<NodeHandle> &targets, const NodeCall &call,
                   const char *op);
  void schedule_read_repair(const std::string &key, const Bytes &value,
                            const NodeHandle &source,
                            std::vector<NodeHandle> stale);
  NodeHandle make_handle(const CacheNode &node) const;
  void health_loop();
  void stop_health();
  void fail(std::string *err, const std::string &msg);

  DistributedConfig cfg_;
  BackendFactory factory_;
  ConsistentHashRing ring_;

  // Guards nodes_ and failures_ and serializes ring mutations.
  mutable std::mutex topology_mu_;
  std::unordered_map<std::string, NodeHandle> nodes_;
  std::unordered_map<std::string, FailureState> failures_;

  Counters counters_;
  std::atomic<bool> connected_{false};

  std::thread health_thread_;
  std::mutex health_mu_;
  std::condition_variable health_cv_;
  bool stop_health_{false};

  // Destroyed first so in-flight work never outlives the members it uses.
  WorkerPool pool_;
};

} // namespace quorum_cache
