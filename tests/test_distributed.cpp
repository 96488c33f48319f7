#include "quorum_cache/distributed.hpp"
#include "quorum_cache/logging.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <unordered_map>

using namespace quorum_cache;

namespace {

LocalConfig quiet() {
  LocalConfig cfg;
  cfg.ttl_sweep_interval_seconds = 0;
  return cfg;
}

// LocalBackend with injectable failures, latency and exceptions.
class FlakyBackend final : public ICacheBackend {
public:
  FlakyBackend(const std::string &name, LocalConfig cfg)
      : inner_(std::move(cfg), name) {}

  void set_failing(bool v) { failing_ = v; }
  void set_throwing(bool v) { throwing_ = v; }
  void set_delay(std::chrono::milliseconds d) { delay_ms_ = d.count(); }
  int calls() const { return calls_; }
  LocalBackend &inner() { return inner_; }

  std::string name() const override { return inner_.name(); }
  bool connect(std::string *err) override {
    return gate(err) && inner_.connect(err);
  }
  bool disconnect(std::string *err) override { return inner_.disconnect(err); }
  bool ping(std::string *err) override { return gate(err) && inner_.ping(err); }
  bool get(const std::string &key, std::optional<Bytes> *out,
           std::string *err) override {
    return gate(err) && inner_.get(key, out, err);
  }
  bool set(const std::string &key, const Bytes &value,
           std::optional<std::int64_t> ttl_seconds, std::string *err) override {
    return gate(err) && inner_.set(key, value, ttl_seconds, err);
  }
  bool del(const std::string &key, std::string *err) override {
    return gate(err) && inner_.del(key, err);
  }
  bool exists(const std::string &key, bool *out, std::string *err) override {
    return gate(err) && inner_.exists(key, out, err);
  }
  bool expire(const std::string &key, std::int64_t ttl_seconds,
              std::string *err) override {
    return gate(err) && inner_.expire(key, ttl_seconds, err);
  }
  bool ttl(const std::string &key, std::int64_t *out,
           std::string *err) override {
    return gate(err) && inner_.ttl(key, out, err);
  }
  bool clear(std::string *err) override { return gate(err) && inner_.clear(err); }
  bool set_tagged(const std::string &key, const Bytes &value,
                  std::optional<std::int64_t> ttl_seconds, const Tags &tags,
                  std::string *err) override {
    return gate(err) && inner_.set_tagged(key, value, ttl_seconds, tags, err);
  }
  bool invalidate_by_tags(const Tags &tags, std::size_t *removed,
                          std::string *err) override {
    return gate(err) && inner_.invalidate_by_tags(tags, removed, err);
  }

private:
  bool gate(std::string *err) {
    ++calls_;
    if (delay_ms_ > 0)
      std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_.load()));
    if (throwing_)
      throw std::runtime_error("backend exploded");
    if (failing_) {
      if (err)
        *err = "injected failure";
      return false;
    }
    return true;
  }

  LocalBackend inner_;
  std::atomic<bool> failing_{false};
  std::atomic<bool> throwing_{false};
  std::atomic<long long> delay_ms_{0};
  std::atomic<int> calls_{0};
};

struct Cluster {
  std::mutex mu;
  std::unordered_map<std::string, std::shared_ptr<FlakyBackend>> nodes;
  std::set<std::string> down_at_start;
  LocalConfig local = quiet();

  BackendFactory factory() {
    return [this](const CacheNode &node) {
      auto b = std::make_shared<FlakyBackend>(node.id, local);
      if (down_at_start.contains(node.id))
        b->set_failing(true);
      std::lock_guard<std::mutex> lock(mu);
      nodes[node.id] = b;
      return std::static_pointer_cast<ICacheBackend>(b);
    };
  }

  FlakyBackend &operator[](const std::string &id) {
    std::lock_guard<std::mutex> lock(mu);
    return *nodes.at(id);
  }

  bool holds(const std::string &id, const std::string &key) {
    return (*this)[id].inner().cache().exists(key);
  }
};

DistributedConfig abc(std::size_t replication_factor) {
  DistributedConfig cfg;
  cfg.nodes = {{"A", "127.0.0.1", 7001, 1},
               {"B", "127.0.0.1", 7002, 1},
               {"C", "127.0.0.1", 7003, 1}};
  cfg.replication_factor = replication_factor;
  cfg.health_check_interval_seconds = 0;
  cfg.recovery_interval_seconds = 0;
  cfg.node_timeout_ms = 500;
  cfg.worker_threads = 4;
  return cfg;
}

// First "key-N" whose primary replica is `owner`, skipping `taken`.
std::string key_on(const DistributedCache &cache, const std::string &owner,
                   const std::set<std::string> &taken = {}) {
  for (int i = 0;; ++i) {
    auto key = "key-" + std::to_string(i);
    const auto node = cache.ring().get_node(key);
    if (node && node->id == owner && !taken.contains(key))
      return key;
  }
}

template <typename Pred> bool eventually(Pred &&pred) {
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred())
      return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return pred();
}

struct QuietLogs {
  QuietLogs() { set_log_level("off"); }
};
const QuietLogs quiet_logs;

} // namespace

TEST_CASE("consistency names and replica counts", "[distributed][config]") {
  CHECK(parse_consistency("one") == ConsistencyLevel::One);
  CHECK(parse_consistency("QUORUM") == ConsistencyLevel::Quorum);
  CHECK(parse_consistency("all") == ConsistencyLevel::All);
  CHECK_FALSE(parse_consistency("most").has_value());
  CHECK(to_string(ConsistencyLevel::Quorum) == "quorum");

  CHECK(replicas_required(ConsistencyLevel::One, 3) == 1);
  CHECK(replicas_required(ConsistencyLevel::Quorum, 1) == 1);
  CHECK(replicas_required(ConsistencyLevel::Quorum, 2) == 2);
  CHECK(replicas_required(ConsistencyLevel::Quorum, 3) == 2);
  CHECK(replicas_required(ConsistencyLevel::Quorum, 4) == 3);
  CHECK(replicas_required(ConsistencyLevel::All, 3) == 3);
}

TEST_CASE("invalid coordinator configuration is rejected at construction",
          "[distributed][config]") {
  Cluster c;
  auto cfg = abc(2);
  std::string err;
  CHECK(validate(cfg, &err));

  auto empty = cfg;
  empty.nodes.clear();
  CHECK_THROWS_AS(DistributedCache(empty, c.factory()), std::invalid_argument);

  auto dup = cfg;
  dup.nodes.push_back({"A", "127.0.0.1", 7009, 1});
  CHECK_FALSE(validate(dup, &err));
  CHECK(err == "duplicate node id: A");

  auto zero_r = cfg;
  zero_r.replication_factor = 0;
  CHECK_THROWS_AS(DistributedCache(zero_r, c.factory()), std::invalid_argument);

  auto threshold = cfg;
  threshold.failure_threshold = 0;
  CHECK_FALSE(validate(threshold));

  auto hash = cfg;
  hash.hash_algorithm = "crc32";
  CHECK_THROWS_AS(DistributedCache(hash, c.factory()), std::invalid_argument);

  auto too_strict = cfg;
  too_strict.replication_factor = 7;
  too_strict.read_consistency = ConsistencyLevel::Quorum;
  CHECK_FALSE(validate(too_strict, &err));
  CHECK(err.find("read consistency quorum") != std::string::npos);

  auto all_writes = cfg;
  all_writes.replication_factor = 4;
  all_writes.write_consistency = ConsistencyLevel::All;
  CHECK_THROWS_AS(DistributedCache(all_writes, c.factory()),
                  std::invalid_argument);

  auto no_workers = cfg;
  no_workers.worker_threads = 0;
  CHECK_FALSE(validate(no_workers, &err));
  CHECK(err == "worker_threads must be positive");
  CHECK_THROWS_AS(DistributedCache(no_workers, c.factory()),
                  std::invalid_argument);

  auto no_keys = cfg;
  no_keys.max_key_len = 0;
  CHECK_FALSE(validate(no_keys, &err));

  CHECK_THROWS_AS(DistributedCache(cfg, BackendFactory{}),
                  std::invalid_argument);
}

TEST_CASE("operations before connect fail", "[distributed]") {
  Cluster c;
  DistributedCache cache(abc(1), c.factory());
  std::string err;
  CHECK_FALSE(cache.set("k", to_bytes("v"), std::nullopt, &err));
  CHECK(err == "not connected");
  CHECK_FALSE(cache.ping(&err));
}

TEST_CASE("single replica round trip lands on the primary",
          "[distributed][basic]") {
  Cluster c;
  DistributedCache cache(abc(1), c.factory());
  std::string err;
  REQUIRE(cache.connect(&err));
  REQUIRE(cache.ping(&err));
  CHECK(cache.ring().size() == 3);

  for (int i = 0; i < 50; ++i) {
    const auto key = "user:" + std::to_string(i);
    REQUIRE(cache.set(key, to_bytes("v" + std::to_string(i)), std::nullopt,
                      &err));
    std::optional<Bytes> out;
    REQUIRE(cache.get(key, &out, &err));
    REQUIRE(out.has_value());
    CHECK(to_string(*out) == "v" + std::to_string(i));
    const auto primary = cache.ring().get_node(key)->id;
    CHECK(c.holds(primary, key));
  }
  std::optional<Bytes> out;
  REQUIRE(cache.get("missing", &out, &err));
  CHECK_FALSE(out.has_value());

  const auto s = cache.stats();
  CHECK(s.sets == 50);
  CHECK(s.hits == 50);
  CHECK(s.misses == 1);
}

TEST_CASE("all-consistency writes reach every replica",
          "[distributed][replication]") {
  Cluster c;
  auto cfg = abc(3);
  cfg.write_consistency = ConsistencyLevel::All;
  DistributedCache cache(cfg, c.factory());
  std::string err;
  REQUIRE(cache.connect(&err));
  REQUIRE(cache.set("k", to_bytes("v"), 60, &err));
  for (const auto *id : {"A", "B", "C"}) {
    CHECK(c.holds(id, "k"));
    CHECK(c[id].inner().cache().ttl("k") >= 59);
  }

  std::int64_t left = 0;
  REQUIRE(cache.ttl("k", &left, &err));
  CHECK(left >= 59);
  bool found = false;
  REQUIRE(cache.exists("k", &found, &err));
  CHECK(found);

  REQUIRE(cache.del("k", &err));
  for (const auto *id : {"A", "B", "C"})
    CHECK_FALSE(c.holds(id, "k"));
  REQUIRE(cache.exists("k", &found, &err));
  CHECK_FALSE(found);
}

TEST_CASE("quorum write tolerates one unreachable replica of three",
          "[distributed][quorum]") {
  Cluster c;
  auto cfg = abc(3);
  cfg.write_consistency = ConsistencyLevel::Quorum;
  cfg.failure_threshold = 100;
  DistributedCache cache(cfg, c.factory());
  std::string err;
  REQUIRE(cache.connect(&err));

  c["B"].set_failing(true);
  REQUIRE(cache.set("k", to_bytes("v"), std::nullopt, &err));
  CHECK(eventually([&] { return c.holds("A", "k") && c.holds("C", "k"); }));

  c["C"].set_failing(true);
  CHECK_FALSE(cache.set("k2", to_bytes("v"), std::nullopt, &err));
  CHECK(err.find("write consistency quorum not met") != std::string::npos);
  CHECK(cache.stats().errors >= 1);
}

TEST_CASE("one-level write succeeds while a single replica answers",
          "[distributed][one]") {
  Cluster c;
  auto cfg = abc(3);
  cfg.failure_threshold = 100;
  DistributedCache cache(cfg, c.factory());
  std::string err;
  REQUIRE(cache.connect(&err));
  c["A"].set_failing(true);
  c["B"].set_failing(true);
  REQUIRE(cache.set("k", to_bytes("v"), std::nullopt, &err));
  CHECK(eventually([&] { return c.holds("C", "k"); }));

  c["C"].set_failing(true);
  CHECK_FALSE(cache.set("k", to_bytes("v"), std::nullopt, &err));
  CHECK(err.find("not met") != std::string::npos);
}

TEST_CASE("failing nodes are quarantined and recover through health checks",
          "[distributed][health]") {
  Cluster c;
  auto cfg = abc(3);
  cfg.write_consistency = ConsistencyLevel::All;
  cfg.failure_threshold = 2;
  DistributedCache cache(cfg, c.factory());
  std::string err;
  REQUIRE(cache.connect(&err));
  const auto positions = cache.ring().positions("B");
  REQUIRE_FALSE(positions.empty());

  c["B"].set_failing(true);
  CHECK_FALSE(cache.set("k1", to_bytes("v"), std::nullopt, &err));
  CHECK(cache.failure_count("B") == 1);
  CHECK_FALSE(cache.is_quarantined("B"));
  CHECK_FALSE(cache.set("k2", to_bytes("v"), std::nullopt, &err));
  CHECK(cache.is_quarantined("B"));
  CHECK_FALSE(cache.ring().contains("B"));
  CHECK(cache.ring().size() == 2);
  CHECK(cache.stats().quarantines == 1);

  // Writes go to the remaining replicas only.
  REQUIRE(cache.set("k3", to_bytes("v"), std::nullopt, &err));
  CHECK(c.holds("A", "k3"));
  CHECK(c.holds("C", "k3"));
  CHECK_FALSE(c.holds("B", "k3"));

  CHECK(cache.check_health() == 0);
  CHECK(cache.is_quarantined("B"));

  c["B"].set_failing(false);
  CHECK(cache.check_health() == 1);
  CHECK_FALSE(cache.is_quarantined("B"));
  CHECK(cache.failure_count("B") == 0);
  CHECK(cache.ring().contains("B"));
  CHECK(cache.ring().positions("B") == positions);
  CHECK(cache.stats().recoveries == 1);
}

TEST_CASE("a success resets the consecutive failure count",
          "[distributed][health]") {
  Cluster c;
  auto cfg = abc(3);
  cfg.write_consistency = ConsistencyLevel::All;
  cfg.failure_threshold = 2;
  DistributedCache cache(cfg, c.factory());
  std::string err;
  REQUIRE(cache.connect(&err));
  c["A"].set_failing(true);
  CHECK_FALSE(cache.set("k", to_bytes("v"), std::nullopt, &err));
  CHECK(cache.failure_count("A") == 1);
  c["A"].set_failing(false);
  REQUIRE(cache.set("k", to_bytes("v"), std::nullopt, &err));
  CHECK(cache.failure_count("A") == 0);
  c["A"].set_failing(true);
  CHECK_FALSE(cache.set("k", to_bytes("v"), std::nullopt, &err));
  CHECK_FALSE(cache.is_quarantined("A"));
}

TEST_CASE("recovery waits for the recovery interval", "[distributed][health]") {
  Cluster c;
  c.down_at_start = {"C"};
  auto cfg = abc(1);
  cfg.recovery_interval_seconds = 3600;
  DistributedCache cache(cfg, c.factory());
  std::string err;
  REQUIRE(cache.connect(&err));
  CHECK(cache.is_quarantined("C"));
  CHECK(cache.failure_count("C") == cfg.failure_threshold);
  CHECK(cache.ring().size() == 2);
  c["C"].set_failing(false);
  CHECK(cache.check_health() == 0);
  CHECK(cache.is_quarantined("C"));
}

TEST_CASE("nodes that fail to connect join once reachable",
          "[distributed][health]") {
  Cluster c;
  c.down_at_start = {"B"};
  DistributedCache cache(abc(2), c.factory());
  std::string err;
  REQUIRE(cache.connect(&err));
  CHECK(cache.is_quarantined("B"));
  CHECK_FALSE(c["B"].inner().connected());
  c["B"].set_failing(false);
  CHECK(cache.check_health() == 1);
  CHECK(c["B"].inner().connected());
  CHECK(cache.ring().size() == 3);
}

TEST_CASE("no reachable nodes is reported as no nodes available",
          "[distributed][topology]") {
  Cluster c;
  c.down_at_start = {"A", "B", "C"};
  DistributedCache cache(abc(1), c.factory());
  std::string err;
  CHECK_FALSE(cache.connect(&err));
  CHECK(err == "no nodes available");
  CHECK_FALSE(cache.connected());
}

TEST_CASE("quarantining every node leaves no nodes available",
          "[distributed][topology]") {
  Cluster c;
  auto cfg = abc(3);
  cfg.write_consistency = ConsistencyLevel::All;
  cfg.failure_threshold = 1;
  DistributedCache cache(cfg, c.factory());
  std::string err;
  REQUIRE(cache.connect(&err));
  for (const auto *id : {"A", "B", "C"})
    c[id].set_failing(true);
  CHECK_FALSE(cache.set("k", to_bytes("v"), std::nullopt, &err));
  CHECK(cache.ring().size() == 0);

  std::optional<Bytes> out;
  CHECK_FALSE(cache.get("k", &out, &err));
  CHECK(err == "no nodes available");
  CHECK_FALSE(cache.set("k", to_bytes("v"), std::nullopt, &err));
  CHECK(err == "no nodes available");
  CHECK_FALSE(cache.del("k", &err));
  CHECK(err == "no nodes available");
  CHECK_FALSE(cache.clear(&err));
  CHECK(err == "no nodes available");
  CHECK_FALSE(cache.ping(&err));
}

TEST_CASE("three nodes with two replicas: one writes and quorum reads",
          "[distributed][scenario]") {
  Cluster c;
  auto cfg = abc(2);
  cfg.virtual_nodes = 3;
  cfg.write_consistency = ConsistencyLevel::One;
  cfg.read_consistency = ConsistencyLevel::Quorum;
  cfg.failure_threshold = 1;
  DistributedCache cache(cfg, c.factory());
  std::string err;
  REQUIRE(cache.connect(&err));

  const std::string key = "order:42";
  const auto replicas = cache.ring().get_nodes(key, 2);
  REQUIRE(replicas.size() == 2);
  const auto primary = replicas[0].id;
  const auto secondary = replicas[1].id;
  std::string third;
  for (const auto *id : {"A", "B", "C"})
    if (id != primary && id != secondary)
      third = id;

  // Quarantine the secondary: a quorum read needs both replicas.
  c[secondary].set_failing(true);
  bool found = false;
  CHECK_FALSE(cache.exists(key, &found, &err));
  REQUIRE(cache.is_quarantined(secondary));

  // The write goes to the primary and the next node on the ring.
  REQUIRE(cache.set(key, to_bytes("shipped"), std::nullopt, &err));
  const auto now_replicas = cache.ring().get_nodes(key, 2);
  REQUIRE(now_replicas.size() == 2);
  CHECK(now_replicas[0].id == primary);
  CHECK(now_replicas[1].id == third);
  CHECK(eventually([&] { return c.holds(primary, key) && c.holds(third, key); }));

  std::optional<Bytes> out;
  REQUIRE(cache.get(key, &out, &err));
  REQUIRE(out.has_value());
  CHECK(to_string(*out) == "shipped");

  // Only one of the two replicas reachable: the quorum read fails.
  c[third].set_failing(true);
  CHECK_FALSE(cache.get(key, &out, &err));
  CHECK(err.find("read consistency quorum not met") != std::string::npos);
  REQUIRE(cache.is_quarantined(third));
  CHECK_FALSE(cache.get(key, &out, &err));
  CHECK(err.find("read consistency quorum not met") != std::string::npos);
}

TEST_CASE("read repair refills replicas that missed a value",
          "[distributed][repair]") {
  Cluster c;
  auto cfg = abc(3);
  cfg.write_consistency = ConsistencyLevel::All;
  cfg.read_consistency = ConsistencyLevel::All;
  DistributedCache cache(cfg, c.factory());
  std::string err;
  REQUIRE(cache.connect(&err));
  REQUIRE(cache.set("k", to_bytes("v"), 120, &err));

  const auto replicas = cache.ring().get_nodes("k", 3);
  const auto stale = replicas[1].id;
  REQUIRE(c[stale].inner().cache().del("k"));

  std::optional<Bytes> out;
  REQUIRE(cache.get("k", &out, &err));
  REQUIRE(out.has_value());
  CHECK(eventually([&] { return c.holds(stale, "k"); }));
  CHECK(eventually([&] { return cache.stats().read_repairs == 1; }));
  CHECK(c[stale].inner().cache().ttl("k") > 0);
}

TEST_CASE("read repair can be disabled", "[distributed][repair]") {
  Cluster c;
  auto cfg = abc(3);
  cfg.write_consistency = ConsistencyLevel::All;
  cfg.read_consistency = ConsistencyLevel::All;
  cfg.read_repair = false;
  DistributedCache cache(cfg, c.factory());
  std::string err;
  REQUIRE(cache.connect(&err));
  REQUIRE(cache.set("k", to_bytes("v"), std::nullopt, &err));
  const auto stale = cache.ring().get_nodes("k", 3)[2].id;
  REQUIRE(c[stale].inner().cache().del("k"));
  std::optional<Bytes> out;
  REQUIRE(cache.get("k", &out, &err));
  REQUIRE(out.has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  CHECK_FALSE(c.holds(stale, "k"));
  CHECK(cache.stats().read_repairs == 0);
}

TEST_CASE("slow nodes time out and count as failures",
          "[distributed][timeout]") {
  Cluster c;
  auto cfg = abc(3);
  cfg.node_timeout_ms = 50;
  cfg.failure_threshold = 100;
  cfg.write_consistency = ConsistencyLevel::All;
  DistributedCache cache(cfg, c.factory());
  std::string err;
  REQUIRE(cache.connect(&err));
  c["B"].set_delay(std::chrono::milliseconds(300));

  const auto start = std::chrono::steady_clock::now();
  CHECK_FALSE(cache.set("k", to_bytes("v"), std::nullopt, &err));
  CHECK(std::chrono::steady_clock::now() - start <
        std::chrono::milliseconds(250));
  CHECK(err.find("timeout") != std::string::npos);
  CHECK(cache.failure_count("B") == 1);

  // The late completion is not counted a second time.
  std::this_thread::sleep_for(std::chrono::milliseconds(400));
  CHECK(cache.failure_count("B") == 1);
  c["B"].set_delay(std::chrono::milliseconds(0));
}

TEST_CASE("a hung node is cut off instead of starving healthy nodes",
          "[distributed][timeout]") {
  Cluster c;
  auto cfg = abc(1);
  cfg.worker_threads = 2;
  cfg.node_timeout_ms = 100;
  cfg.failure_threshold = 3;
  DistributedCache cache(cfg, c.factory());
  std::string err;
  REQUIRE(cache.connect(&err));

  std::set<std::string> on_b;
  while (on_b.size() < 3)
    on_b.insert(key_on(cache, "B", on_b));
  std::set<std::string> healthy;
  while (healthy.size() < 9)
    healthy.insert(key_on(cache, healthy.size() % 2 ? "A" : "C", healthy));

  c["B"].set_delay(std::chrono::milliseconds(800));
  const int calls_before = c["B"].calls();
  const auto start = std::chrono::steady_clock::now();
  for (const auto &key : on_b)
    CHECK_FALSE(cache.set(key, to_bytes("v"), std::nullopt, &err));
  // Only the first call waited out the timeout; the others failed at once.
  CHECK(std::chrono::steady_clock::now() - start <
        std::chrono::milliseconds(400));
  CHECK(err.find("previous call still running") != std::string::npos);
  CHECK(cache.is_quarantined("B"));
  CHECK(c["B"].calls() == calls_before + 1);

  for (const auto &key : healthy)
    CHECK(cache.set(key, to_bytes("v"), std::nullopt, &err));
  CHECK_FALSE(cache.is_quarantined("A"));
  CHECK_FALSE(cache.is_quarantined("C"));
  CHECK(cache.failure_count("A") == 0);
  CHECK(cache.failure_count("C") == 0);
  CHECK(cache.stats().sets == healthy.size());

  // Health checks leave the node alone while the hung call holds a worker.
  CHECK(cache.check_health() == 0);
  CHECK(c["B"].calls() == calls_before + 1);

  c["B"].set_delay(std::chrono::milliseconds(0));
  CHECK(eventually([&] { return cache.check_health() == 1; }));
  CHECK_FALSE(cache.is_quarantined("B"));
}

TEST_CASE("calls that never reach a worker are not charged to their node",
          "[distributed][timeout]") {
  Cluster c;
  auto cfg = abc(1);
  cfg.worker_threads = 1;
  cfg.node_timeout_ms = 100;
  cfg.failure_threshold = 1;
  DistributedCache cache(cfg, c.factory());
  std::string err;
  REQUIRE(cache.connect(&err));
  const auto key_b = key_on(cache, "B");
  const auto key_a = key_on(cache, "A");

  c["B"].set_delay(std::chrono::milliseconds(600));
  CHECK_FALSE(cache.set(key_b, to_bytes("v"), std::nullopt, &err));
  CHECK(err.find("timeout after 100ms") != std::string::npos);
  CHECK(cache.is_quarantined("B"));

  // The only worker is still inside B's call.
  CHECK_FALSE(cache.set(key_a, to_bytes("v"), std::nullopt, &err));
  CHECK(err.find("no worker free within 100ms") != std::string::npos);
  CHECK(cache.failure_count("A") == 0);
  CHECK_FALSE(cache.is_quarantined("A"));

  c["B"].set_delay(std::chrono::milliseconds(0));
  CHECK(eventually(
      [&] { return cache.set(key_a, to_bytes("v"), std::nullopt, &err); }));
  CHECK(c.holds("A", key_a));
  CHECK(cache.failure_count("A") == 0);
}

TEST_CASE("rejected arguments are not charged to any node",
          "[distributed][errors]") {
  Cluster c;
  c.local.max_ttl_seconds = 60;
  auto cfg = abc(3);
  cfg.write_consistency = ConsistencyLevel::Quorum;
  cfg.failure_threshold = 3;
  DistributedCache cache(cfg, c.factory());
  std::string err;
  REQUIRE(cache.connect(&err));
  const std::string long_key(300, 'x');

  for (int i = 0; i < 3; ++i) {
    CHECK_FALSE(cache.set(long_key, to_bytes("v"), -5, &err));
    CHECK(err == "invalid key length");
    CHECK_FALSE(cache.set("", to_bytes("v"), std::nullopt, &err));
    CHECK(err == "invalid key length");
    CHECK_FALSE(cache.set("k", to_bytes("v"), -5, &err));
    CHECK(err == "invalid ttl");
    CHECK_FALSE(cache.expire(long_key, 10, &err));
    CHECK(err == "invalid key length");
    // Within the coordinator's limits but above what each node accepts.
    CHECK_FALSE(cache.set("k", to_bytes("v"), 120, &err));
    CHECK(err.find("invalid ttl") != std::string::npos);
  }
  for (const auto *id : {"A", "B", "C"}) {
    CHECK(cache.failure_count(id) == 0);
    CHECK_FALSE(cache.is_quarantined(id));
  }
  CHECK(cache.stats().node_failures == 0);
  CHECK(cache.ring().size() == 3);
  REQUIRE(cache.set("k", to_bytes("v"), 30, &err));
}

TEST_CASE("tag invalidation reaches every available replica",
          "[distributed][tags]") {
  Cluster c;
  auto cfg = abc(2);
  cfg.write_consistency = ConsistencyLevel::All;
  cfg.failure_threshold = 100;
  DistributedCache cache(cfg, c.factory());
  std::string err;
  std::size_t removed = 0;
  CHECK_FALSE(cache.invalidate_by_tags({"users"}, &removed, &err));
  CHECK(err == "not connected");
  REQUIRE(cache.connect(&err));

  REQUIRE(cache.set_tagged("user:1", to_bytes("a"), std::nullopt,
                           {"users", "eu"}, &err));
  REQUIRE(cache.set_tagged("user:2", to_bytes("b"), 60, {"users"}, &err));
  REQUIRE(cache.set_tagged("page:1", to_bytes("c"), std::nullopt, {"pages"},
                           &err));
  REQUIRE(cache.set("plain", to_bytes("d"), std::nullopt, &err));

  REQUIRE(cache.invalidate_by_tags({"users"}, &removed, &err));
  CHECK(removed == 4);
  for (const auto *id : {"A", "B", "C"}) {
    CHECK_FALSE(c.holds(id, "user:1"));
    CHECK_FALSE(c.holds(id, "user:2"));
  }
  bool found = false;
  REQUIRE(cache.exists("page:1", &found, &err));
  CHECK(found);
  REQUIRE(cache.exists("plain", &found, &err));
  CHECK(found);

  REQUIRE(cache.invalidate_by_tags({}, &removed, &err));
  CHECK(removed == 0);

  // Nodes that fail are skipped and keep their copies.
  const bool c_held = c.holds("C", "page:1");
  const std::size_t others =
      (c.holds("A", "page:1") ? 1 : 0) + (c.holds("B", "page:1") ? 1 : 0);
  c["C"].set_failing(true);
  REQUIRE(cache.invalidate_by_tags({"pages"}, &removed, &err));
  CHECK(removed == others);
  CHECK(c.holds("C", "page:1") == c_held);
  CHECK(cache.failure_count("C") == 1);
}

TEST_CASE("throwing backends are treated as failed calls",
          "[distributed][errors]") {
  Cluster c;
  auto cfg = abc(3);
  cfg.write_consistency = ConsistencyLevel::Quorum;
  cfg.failure_threshold = 100;
  DistributedCache cache(cfg, c.factory());
  std::string err;
  REQUIRE(cache.connect(&err));
  c["A"].set_throwing(true);
  CHECK(cache.set("k", to_bytes("v"), std::nullopt, &err));
  CHECK(eventually([&] { return cache.failure_count("A") == 1; }));
  c["A"].set_throwing(false);
}

TEST_CASE("delete and clear are best effort", "[distributed][basic]") {
  Cluster c;
  auto cfg = abc(3);
  cfg.write_consistency = ConsistencyLevel::All;
  cfg.failure_threshold = 100;
  DistributedCache cache(cfg, c.factory());
  std::string err;
  REQUIRE(cache.connect(&err));
  REQUIRE(cache.set("a", to_bytes("1"), std::nullopt, &err));
  REQUIRE(cache.set("b", to_bytes("2"), std::nullopt, &err));

  c["C"].set_failing(true);
  REQUIRE(cache.del("a", &err));
  CHECK_FALSE(c.holds("A", "a"));
  CHECK(c.holds("C", "a"));
  CHECK(cache.stats().deletes == 1);

  REQUIRE(cache.clear(&err));
  CHECK(c["A"].inner().cache().size() == 0);
  CHECK(c["B"].inner().cache().size() == 0);
  CHECK(c["C"].inner().cache().size() == 2);
}

TEST_CASE("expire through the coordinator", "[distributed][ttl]") {
  Cluster c;
  auto cfg = abc(2);
  cfg.write_consistency = ConsistencyLevel::All;
  cfg.read_consistency = ConsistencyLevel::All;
  DistributedCache cache(cfg, c.factory());
  std::string err;
  REQUIRE(cache.connect(&err));
  REQUIRE(cache.set("k", to_bytes("v"), std::nullopt, &err));
  std::int64_t left = 0;
  REQUIRE(cache.ttl("k", &left, &err));
  CHECK(left == -1);
  REQUIRE(cache.expire("k", 30, &err));
  REQUIRE(cache.ttl("k", &left, &err));
  CHECK(left >= 29);
  CHECK_FALSE(cache.expire("k", -1, &err));
  CHECK(err == "invalid ttl");
  REQUIRE(cache.expire("k", 0, &err));
  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  std::optional<Bytes> out;
  REQUIRE(cache.get("k", &out, &err));
  CHECK_FALSE(out.has_value());
}

TEST_CASE("nodes can join and leave at runtime", "[distributed][membership]") {
  Cluster c;
  DistributedCache cache(abc(1), c.factory());
  std::string err;
  CHECK_FALSE(cache.add_node({"D", "127.0.0.1", 7004, 1}, &err));
  REQUIRE(cache.connect(&err));

  REQUIRE(cache.add_node({"D", "127.0.0.1", 7004, 1}, &err));
  CHECK(cache.ring().size() == 4);
  CHECK(cache.backend("D") != nullptr);
  CHECK_FALSE(cache.add_node({"D", "127.0.0.1", 7004, 1}, &err));
  CHECK(err == "duplicate node id: D");

  REQUIRE(cache.remove_node("D"));
  CHECK_FALSE(cache.remove_node("D"));
  CHECK(cache.ring().size() == 3);
  CHECK(cache.backend("D") == nullptr);
  CHECK_FALSE(c["D"].inner().connected());
}

TEST_CASE("cluster stats and info describe every node",
          "[distributed][stats]") {
  Cluster c;
  c.down_at_start = {"C"};
  DistributedCache cache(abc(1), c.factory());
  std::string err;
  REQUIRE(cache.connect(&err));
  const auto nodes = cache.cluster_stats();
  REQUIRE(nodes.size() == 3);
  CHECK(nodes[0].node.id == "A");
  CHECK(nodes[0].in_ring);
  CHECK_FALSE(nodes[0].quarantined);
  CHECK(nodes[2].node.id == "C");
  CHECK_FALSE(nodes[2].in_ring);
  CHECK(nodes[2].quarantined);
  CHECK_FALSE(nodes[2].connected);

  const auto info = cache.info();
  CHECK(info.find("nodes:3") != std::string::npos);
  CHECK(info.find("nodes_in_ring:2") != std::string::npos);
  CHECK(info.find("read_consistency:one") != std::string::npos);

  REQUIRE(cache.disconnect(&err));
  CHECK_FALSE(cache.connected());
  CHECK(cache.ring().size() == 0);
  CHECK(cache.cluster_stats().empty());
}

TEST_CASE("the health thread recovers nodes on its own",
          "[distributed][health]") {
  Cluster c;
  c.down_at_start = {"A"};
  auto cfg = abc(1);
  cfg.health_check_interval_seconds = 1;
  DistributedCache cache(cfg, c.factory());
  std::string err;
  REQUIRE(cache.connect(&err));
  REQUIRE(cache.is_quarantined("A"));
  c["A"].set_failing(false);
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(4);
  while (cache.is_quarantined("A") &&
         std::chrono::steady_clock::now() < deadline)
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  CHECK_FALSE(cache.is_quarantined("A"));
  REQUIRE(cache.disconnect(&err));
}
