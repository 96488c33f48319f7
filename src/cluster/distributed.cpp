#include "quorum_cache/distributed.hpp"
#include "quorum_cache/logging.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace quorum_cache {
namespace {

DistributedConfig checked(DistributedConfig cfg) {
  std::string err;
  if (!validate(cfg, &err))
    throw std::invalid_argument(err);
  return cfg;
}

} // namespace

std::optional<ConsistencyLevel> parse_consistency(const std::string &name) {
  std::string n = name;
  std::transform(n.begin(), n.end(), n.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (n == "one")
    return ConsistencyLevel::One;
  if (n == "quorum")
    return ConsistencyLevel::Quorum;
  if (n == "all")
    return ConsistencyLevel::All;
  return std::nullopt;
}

std::string to_string(ConsistencyLevel level) {
  switch (level) {
  case ConsistencyLevel::One:
    return "one";
  case ConsistencyLevel::Quorum:
    return "quorum";
  case ConsistencyLevel::All:
    return "all";
  }
  return "unknown";
}

std::size_t replicas_required(ConsistencyLevel level,
                              std::size_t replication_factor) {
  switch (level) {
  case ConsistencyLevel::One:
    return 1;
  case ConsistencyLevel::Quorum:
    return replication_factor / 2 + 1;
  case ConsistencyLevel::All:
    return replication_factor;
  }
  return replication_factor;
}

bool validate(const DistributedConfig &cfg, std::string *err) {
  auto reject = [err](const std::string &msg) {
    if (err)
      *err = msg;
    return false;
  };
  if (cfg.nodes.empty())
    return reject("no nodes configured");
  std::unordered_set<std::string> ids;
  for (const auto &node : cfg.nodes) {
    if (node.id.empty())
      return reject("node id must not be empty");
    if (!ids.insert(node.id).second)
      return reject("duplicate node id: " + node.id);
  }
  if (cfg.replication_factor == 0)
    return reject("replication_factor must be positive");
  if (cfg.failure_threshold == 0)
    return reject("failure_threshold must be positive");
  if (cfg.virtual_nodes == 0)
    return reject("virtual_nodes must be positive");
  if (cfg.node_timeout_ms == 0)
    return reject("node_timeout_ms must be positive");
  if (cfg.worker_threads == 0)
    return reject("worker_threads must be positive");
  if (cfg.max_key_len == 0)
    return reject("max_key_len must be positive");
  if (!make_hash_function(cfg.hash_algorithm))
    return reject("unsupported hash algorithm: " + cfg.hash_algorithm);
  const auto read = replicas_required(cfg.read_consistency, cfg.replication_factor);
  if (read > cfg.nodes.size())
    return reject("read consistency " + to_string(cfg.read_consistency) +
                  " needs " + std::to_string(read) + " replicas but only " +
                  std::to_string(cfg.nodes.size()) + " nodes are configured");
  const auto write =
      replicas_required(cfg.write_consistency, cfg.replication_factor);
  if (write > cfg.nodes.size())
    return reject("write consistency " + to_string(cfg.write_consistency) +
                  " needs " + std::to_string(write) + " replicas but only " +
                  std::to_string(cfg.nodes.size()) + " nodes are configured");
  return true;
}

DistributedCache::DistributedCache(DistributedConfig cfg,
                                   BackendFactory factory)
    : cfg_(checked(std::move(cfg))), factory_(std::move(factory)),
      ring_(cfg_.virtual_nodes, make_hash_function(cfg_.hash_algorithm)),
      pool_(cfg_.worker_threads) {
  if (!factory_)
    throw std::invalid_argument("backend factory required");
}

DistributedCache::~DistributedCache() {
  std::string err;
  if (!disconnect(&err))
    logger()->error("disconnect during shutdown failed: {}", err);
}

void DistributedCache::fail(std::string *err, const std::string &msg) {
  if (err)
    *err = msg;
}

DistributedCache::NodeHandle
DistributedCache::make_handle(const CacheNode &node) const {
  NodeHandle h{node, nullptr, false,
               std::make_shared<std::atomic<std::uint32_t>>(0)};
  try {
    h.backend = factory_(node);
  } catch (const std::exception &e) {
    logger()->error("creating backend for {} failed: {}", node.id, e.what());
  }
  if (!h.backend)
    logger()->error("no backend for node {}", node.id);
  return h;
}

DistributedCache::Reply DistributedCache::invoke(const NodeCall &call,
                                                 const NodeHandle &target) {
  if (!target.backend) {
    Reply r;
    r.err = "no backend";
    return r;
  }
  try {
    return call(target);
  } catch (const std::exception &e) {
    Reply r;
    r.err = e.what();
    return r;
  }
}

bool DistributedCache::lane_blocked(const NodeHandle &h) {
  return h.overdue && h.overdue->load() > 0;
}

std::vector<DistributedCache::Reply>
DistributedCache::fan_out(const std::vector<NodeHandle> &targets,
                          const NodeCall &call, std::size_t required_ok,
                          bool wait_all, bool account) {
  using Steady = std::chrono::steady_clock;
  // Shared with the tasks so calls that miss the deadline can still land.
  struct State {
    std::mutex mu;
    std::condition_variable cv;
    std::vector<Reply> replies;
    std::vector<std::optional<Steady::time_point>> started;
    std::size_t done{0};
    std::size_t ok{0};
  };
  const std::size_t n = targets.size();
  const auto timeout = std::chrono::milliseconds(cfg_.node_timeout_ms);
  const std::string timeout_text =
      std::to_string(cfg_.node_timeout_ms) + "ms";
  auto state = std::make_shared<State>();
  state->replies.resize(n);
  state->started.resize(n);

  // A node still busy with a timed-out call is failed without a worker.
  std::vector<std::string> refused;
  for (std::size_t i = 0; i < n; ++i) {
    if (!lane_blocked(targets[i]))
      continue;
    auto &r = state->replies[i];
    r.completed = true;
    r.err = "previous call still running";
    ++state->done;
    refused.push_back(targets[i].node.id);
  }
  if (account)
    for (const auto &id : refused)
      record_result(id, false, "previous call still running");

  for (std::size_t i = 0; i < n; ++i) {
    if (state->replies[i].completed)
      continue;
    pool_.submit([this, state, call, target = targets[i], i, account] {
      {
        std::lock_guard<std::mutex> lock(state->mu);
        // Abandoned while still queued.
        if (state->replies[i].completed)
          return;
        state->started[i] = Steady::now();
      }
      Reply r = invoke(call, target);
      r.completed = true;
      {
        std::lock_guard<std::mutex> lock(state->mu);
        if (state->replies[i].completed) {
          // Already counted as a timeout by the caller.
          if (target.overdue)
            --*target.overdue;
          return;
        }
        if (account && !is_argument_error(r.err))
          record_result(target.node.id, r.ok, r.err);
        ++state->done;
        if (r.ok)
          ++state->ok;
        state->replies[i] = std::move(r);
      }
      state->cv.notify_all();
    });
  }

  std::vector<std::string> timed_out;
  std::vector<Reply> out;
  {
    std::unique_lock<std::mutex> lock(state->mu);
    auto satisfied = [&] {
      if (state->done == n)
        return true;
      if (wait_all)
        return false;
      return state->ok >= required_ok ||
             state->ok + (n - state->done) < required_ok;
    };
    // A call's timeout runs from the moment a worker starts it. A call no
    // worker picked up within the timeout is abandoned and not charged.
    const auto submitted = Steady::now();
    while (!satisfied()) {
      const auto now = Steady::now();
      auto next = Steady::time_point::max();
      bool expired = false;
      for (std::size_t i = 0; i < n; ++i) {
        auto &r = state->replies[i];
        if (r.completed)
          continue;
        const auto &started = state->started[i];
        const auto deadline = (started ? *started : submitted) + timeout;
        if (deadline > now) {
          next = std::min(next, deadline);
          continue;
        }
        r.completed = true;
        r.ok = false;
        ++state->done;
        expired = true;
        if (started) {
          r.err = "timeout after " + timeout_text;
          if (targets[i].overdue)
            ++*targets[i].overdue;
          timed_out.push_back(targets[i].node.id);
        } else {
          r.err = "no worker free within " + timeout_text;
        }
      }
      if (!expired)
        state->cv.wait_until(lock, next);
    }
    out = state->replies;
  }
  if (account)
    for (const auto &id : timed_out)
      record_result(id, false, "timeout");
  return out;
}

void DistributedCache::record_result(const std::string &node_id, bool ok,
                                     const std::string &err) {
  bool quarantined_now = false;
  std::uint32_t failures = 0;
  {
    std::lock_guard<std::mutex> lock(topology_mu_);
    if (!nodes_.contains(node_id))
      return;
    auto it = failures_.find(node_id);
    if (ok) {
      if (it != failures_.end() && !it->second.quarantined)
        failures_.erase(it);
      return;
    }
    ++counters_.node_failures;
    auto &state = failures_[node_id];
    failures = ++state.failures;
    if (!state.quarantined && state.failures >= cfg_.failure_threshold) {
      state.quarantined = true;
      state.last_attempt = Clock::now();
      ring_.remove_node(node_id);
      ++counters_.quarantines;
      quarantined_now = true;
    }
  }
  if (quarantined_now)
    logger()->warn("node {} quarantined after {} consecutive failures: {}",
                   node_id, failures, err);
  else
    logger()->debug("node {} call failed ({}/{}): {}", node_id, failures,
                    cfg_.failure_threshold, err);
}

std::vector<DistributedCache::NodeHandle>
DistributedCache::replicas_for(const std::string &key,
                               std::size_t count) const {
  const auto owners = ring_.get_nodes(key, count);
  std::vector<NodeHandle> out;
  out.reserve(owners.size());
  std::lock_guard<std::mutex> lock(topology_mu_);
  for (const auto &node : owners) {
    auto it = nodes_.find(node.id);
    if (it == nodes_.end() || !it->second.connected || !it->second.backend)
      continue;
    auto f = failures_.find(node.id);
    if (f != failures_.end() && f->second.quarantined)
      continue;
    out.push_back(it->second);
  }
  return out;
}

std::vector<DistributedCache::NodeHandle>
DistributedCache::all_available() const {
  std::vector<NodeHandle> out;
  std::lock_guard<std::mutex> lock(topology_mu_);
  for (const auto &[id, h] : nodes_) {
    if (!h.connected || !h.backend)
      continue;
    auto f = failures_.find(id);
    if (f != failures_.end() && f->second.quarantined)
      continue;
    out.push_back(h);
  }
  std::sort(out.begin(), out.end(), [](const NodeHandle &a, const NodeHandle &b) {
    return a.node.id < b.node.id;
  });
  return out;
}

bool DistributedCache::connect(std::string *err) {
  if (connected_)
    return true;
  std::vector<NodeHandle> handles;
  handles.reserve(cfg_.nodes.size());
  for (const auto &node : cfg_.nodes)
    handles.push_back(make_handle(node));

  const NodeCall open = [](const NodeHandle &t) {
    Reply r;
    r.ok = t.backend->connect(&r.err);
    return r;
  };
  const auto replies = fan_out(handles, open, handles.size(), true, false);

  std::size_t up = 0;
  {
    std::lock_guard<std::mutex> lock(topology_mu_);
    for (std::size_t i = 0; i < handles.size(); ++i) {
      auto &h = handles[i];
      h.connected = replies[i].ok;
      nodes_[h.node.id] = h;
      if (h.connected) {
        ring_.add_node(h.node);
        failures_.erase(h.node.id);
        ++up;
      } else {
        failures_[h.node.id] =
            FailureState{cfg_.failure_threshold, true, Clock::now()};
        ++counters_.quarantines;
      }
    }
    if (up == 0) {
      nodes_.clear();
      failures_.clear();
    }
  }
  for (std::size_t i = 0; i < handles.size(); ++i)
    if (!replies[i].ok)
      logger()->error("connecting to node {} failed: {}", handles[i].node.id,
                      replies[i].err);

  if (up == 0) {
    fail(err, "no nodes available");
    return false;
  }
  connected_ = true;
  if (cfg_.health_check_interval_seconds > 0) {
    {
      std::lock_guard<std::mutex> lock(health_mu_);
      stop_health_ = false;
    }
    health_thread_ = std::thread([this] { health_loop(); });
  }
  logger()->info("connected to {}/{} nodes (replication_factor={}, read={}, "
                 "write={})",
                 up, handles.size(), cfg_.replication_factor,
                 to_string(cfg_.read_consistency),
                 to_string(cfg_.write_consistency));
  return true;
}

bool DistributedCache::disconnect(std::string *) {
  stop_health();
  if (!connected_.exchange(false))
    return true;

  std::vector<NodeHandle> open;
  {
    std::lock_guard<std::mutex> lock(topology_mu_);
    for (const auto &[id, h] : nodes_)
      if (h.connected && h.backend)
        open.push_back(h);
  }
  const NodeCall close = [](const NodeHandle &t) {
    Reply r;
    r.ok = t.backend->disconnect(&r.err);
    return r;
  };
  const auto replies = fan_out(open, close, open.size(), true, false);
  for (std::size_t i = 0; i < open.size(); ++i)
    if (!replies[i].ok)
      logger()->warn("disconnecting node {} failed: {}", open[i].node.id,
                     replies[i].err);
  {
    std::lock_guard<std::mutex> lock(topology_mu_);
    for (const auto &[id, h] : nodes_)
      ring_.remove_node(id);
    nodes_.clear();
    failures_.clear();
  }
  logger()->info("disconnected from {} nodes", open.size());
  return true;
}

bool DistributedCache::ping(std::string *err) {
  if (!connected_) {
    fail(err, "not connected");
    return false;
  }
  if (ring_.size() == 0) {
    fail(err, "no nodes available");
    return false;
  }
  return true;
}

bool DistributedCache::read_path(const std::string &key, const NodeCall &call,
                                 const char *op,
                                 std::vector<NodeHandle> *targets,
                                 std::vector<Reply> *replies,
                                 std::string *err) {
  if (!connected_) {
    fail(err, "not connected");
    return false;
  }
  const auto level = cfg_.read_consistency;
  const auto required = replicas_required(level, cfg_.replication_factor);
  auto candidates = replicas_for(key, required);
  if (candidates.empty()) {
    ++counters_.errors;
    fail(err, "no nodes available");
    return false;
  }
  if (candidates.size() < required) {
    ++counters_.errors;
    fail(err, std::string(op) + ": read consistency " + to_string(level) +
                  " not met (" + std::to_string(candidates.size()) + "/" +
                  std::to_string(required) + " replicas available)");
    return false;
  }
  auto rs = fan_out(candidates, call, required, true);
  std::size_t ok = 0;
  std::string details;
  for (std::size_t i = 0; i < rs.size(); ++i) {
    if (rs[i].ok) {
      ++ok;
    } else {
      if (!details.empty())
        details += "; ";
      details += candidates[i].node.id + ": " + rs[i].err;
    }
  }
  if (ok < required) {
    ++counters_.errors;
    fail(err, std::string(op) + ": read consistency " + to_string(level) +
                  " not met (" + std::to_string(ok) + "/" +
                  std::to_string(required) + "): " + details);
    return false;
  }
  *targets = std::move(candidates);
  *replies = std::move(rs);
  return true;
}

bool DistributedCache::write_path(const std::string &key, const NodeCall &call,
                                  const char *op, std::string *err) {
  if (!connected_) {
    fail(err, "not connected");
    return false;
  }
  const auto targets = replicas_for(key, cfg_.replication_factor);
  if (targets.empty()) {
    ++counters_.errors;
    fail(err, "no nodes available");
    return false;
  }
  const auto level = cfg_.write_consistency;
  std::size_t required = targets.size();
  if (level == ConsistencyLevel::One)
    required = 1;
  else if (level == ConsistencyLevel::Quorum)
    required = targets.size() / 2 + 1;

  const auto replies =
      fan_out(targets, call, required, level == ConsistencyLevel::All);
  std::size_t ok = 0;
  std::string details;
  for (std::size_t i = 0; i < replies.size(); ++i) {
    if (replies[i].ok) {
      ++ok;
    } else if (replies[i].completed) {
      if (!details.empty())
        details += "; ";
      details += targets[i].node.id + ": " + replies[i].err;
    }
  }
  if (ok >= required)
    return true;
  ++counters_.errors;
  fail(err, std::string(op) + ": write consistency " + to_string(level) +
                " not met (" + std::to_string(ok) + "/" +
                std::to_string(required) + "): " + details);
  return false;
}

void DistributedCache::best_effort(const std::vector<NodeHandle> &targets,
                                   const NodeCall &call, const char *op) {
  const auto replies = fan_out(targets, call, targets.size(), true);
  for (std::size_t i = 0; i < replies.size(); ++i)
    if (!replies[i].ok)
      logger()->warn("{} on node {} failed: {}", op, targets[i].node.id,
                     replies[i].err);
}

void DistributedCache::schedule_read_repair(const std::string &key,
                                            const Bytes &value,
                                            const NodeHandle &source,
                                            std::vector<NodeHandle> stale) {
  pool_.submit([this, key, value, source, stale = std::move(stale)] {
    if (lane_blocked(source))
      return;
    std::int64_t remaining = -1;
    std::string err;
    try {
      if (!source.backend->ttl(key, &remaining, &err))
        logger()->debug("read repair: ttl of {} on {} unknown: {}", key,
                        source.node.id, err);
    } catch (const std::exception &e) {
      logger()->debug("read repair: ttl of {} on {} unknown: {}", key,
                      source.node.id, e.what());
    }
    // Expired on the source in the meantime.
    if (remaining == 0)
      return;
    std::optional<std::int64_t> ttl;
    if (remaining > 0)
      ttl = remaining;
    for (const auto &target : stale) {
      if (lane_blocked(target)) {
        ++counters_.read_repair_failures;
        continue;
      }
      std::string set_err;
      bool ok = false;
      try {
        ok = target.backend->set(key, value, ttl, &set_err);
      } catch (const std::exception &e) {
        set_err = e.what();
      }
      if (ok) {
        ++counters_.read_repairs;
        logger()->debug("read repair: {} copied from {} to {}", key,
                        source.node.id, target.node.id);
      } else {
        ++counters_.read_repair_failures;
        logger()->debug("read repair of {} on {} failed: {}", key,
                        target.node.id, set_err);
      }
    }
  });
}

bool DistributedCache::get(const std::string &key, std::optional<Bytes> *out,
                           std::string *err) {
  const NodeCall call = [key](const NodeHandle &t) {
    Reply r;
    r.ok = t.backend->get(key, &r.value, &r.err);
    return r;
  };
  std::vector<NodeHandle> targets;
  std::vector<Reply> replies;
  if (!read_path(key, call, "get", &targets, &replies, err))
    return false;

  std::optional<std::size_t> found;
  for (std::size_t i = 0; i < replies.size(); ++i) {
    if (replies[i].ok && replies[i].value) {
      found = i;
      break;
    }
  }
  if (!found) {
    ++counters_.misses;
    if (out)
      out->reset();
    return true;
  }
  ++counters_.hits;
  const Bytes &value = *replies[*found].value;
  if (cfg_.read_repair) {
    std::vector<NodeHandle> stale;
    for (std::size_t i = 0; i < replies.size(); ++i)
      if (i != *found && replies[i].ok && !replies[i].value)
        stale.push_back(targets[i]);
    if (!stale.empty())
      schedule_read_repair(key, value, targets[*found], std::move(stale));
  }
  if (out)
    *out = value;
  return true;
}

bool DistributedCache::check_args(const std::string &key,
                                  std::optional<std::int64_t> ttl_seconds,
                                  std::string *err) {
  if (key.empty() || key.size() > cfg_.max_key_len) {
    fail(err, kInvalidKeyLength);
    return false;
  }
  if (ttl_seconds.has_value() && *ttl_seconds < 0) {
    fail(err, kInvalidTtl);
    return false;
  }
  return true;
}

bool DistributedCache::set(const std::string &key, const Bytes &value,
                           std::optional<std::int64_t> ttl_seconds,
                           std::string *err) {
  return set_tagged(key, value, ttl_seconds, Tags{}, err);
}

bool DistributedCache::set_tagged(const std::string &key, const Bytes &value,
                                  std::optional<std::int64_t> ttl_seconds,
                                  const Tags &tags, std::string *err) {
  if (!check_args(key, ttl_seconds, err))
    return false;
  auto payload = std::make_shared<const Bytes>(value);
  auto labels = std::make_shared<const Tags>(tags);
  const NodeCall call = [key, payload, labels,
                         ttl_seconds](const NodeHandle &t) {
    Reply r;
    if (labels->empty())
      r.ok = t.backend->set(key, *payload, ttl_seconds, &r.err);
    else
      r.ok = t.backend->set_tagged(key, *payload, ttl_seconds, *labels, &r.err);
    return r;
  };
  if (!write_path(key, call, "set", err))
    return false;
  ++counters_.sets;
  return true;
}

bool DistributedCache::del(const std::string &key, std::string *err) {
  if (!connected_) {
    fail(err, "not connected");
    return false;
  }
  const auto targets = replicas_for(key, cfg_.replication_factor);
  if (targets.empty()) {
    ++counters_.errors;
    fail(err, "no nodes available");
    return false;
  }
  const NodeCall call = [key](const NodeHandle &t) {
    Reply r;
    r.ok = t.backend->del(key, &r.err);
    return r;
  };
  best_effort(targets, call, "del");
  ++counters_.deletes;
  return true;
}

bool DistributedCache::exists(const std::string &key, bool *out,
                              std::string *err) {
  const NodeCall call = [key](const NodeHandle &t) {
    Reply r;
    r.ok = t.backend->exists(key, &r.flag, &r.err);
    return r;
  };
  std::vector<NodeHandle> targets;
  std::vector<Reply> replies;
  if (!read_path(key, call, "exists", &targets, &replies, err))
    return false;
  const bool any = std::any_of(replies.begin(), replies.end(),
                               [](const Reply &r) { return r.ok && r.flag; });
  if (out)
    *out = any;
  return true;
}

bool DistributedCache::expire(const std::string &key, std::int64_t ttl_seconds,
                              std::string *err) {
  if (!check_args(key, ttl_seconds, err))
    return false;
  const NodeCall call = [key, ttl_seconds](const NodeHandle &t) {
    Reply r;
    r.ok = t.backend->expire(key, ttl_seconds, &r.err);
    return r;
  };
  return write_path(key, call, "expire", err);
}

bool DistributedCache::ttl(const std::string &key, std::int64_t *out,
                           std::string *err) {
  const NodeCall call = [key](const NodeHandle &t) {
    Reply r;
    r.ok = t.backend->ttl(key, &r.number, &r.err);
    return r;
  };
  std::vector<NodeHandle> targets;
  std::vector<Reply> replies;
  if (!read_path(key, call, "ttl", &targets, &replies, err))
    return false;
  std::int64_t remaining = -1;
  for (const auto &r : replies) {
    if (r.ok && r.number >= 0) {
      remaining = r.number;
      break;
    }
  }
  if (out)
    *out = remaining;
  return true;
}

bool DistributedCache::clear(std::string *err) {
  if (!connected_) {
    fail(err, "not connected");
    return false;
  }
  const auto targets = all_available();
  if (targets.empty()) {
    ++counters_.errors;
    fail(err, "no nodes available");
    return false;
  }
  const NodeCall call = [](const NodeHandle &t) {
    Reply r;
    r.ok = t.backend->clear(&r.err);
    return r;
  };
  best_effort(targets, call, "clear");
  return true;
}

bool DistributedCache::invalidate_by_tags(const Tags &tags,
                                          std::size_t *removed,
                                          std::string *err) {
  if (removed)
    *removed = 0;
  if (!connected_) {
    fail(err, "not connected");
    return false;
  }
  if (tags.empty())
    return true;
  const auto targets = all_available();
  if (targets.empty()) {
    ++counters_.errors;
    fail(err, "no nodes available");
    return false;
  }
  auto labels = std::make_shared<const Tags>(tags);
  const NodeCall call = [labels](const NodeHandle &t) {
    Reply r;
    std::size_t n = 0;
    r.ok = t.backend->invalidate_by_tags(*labels, &n, &r.err);
    r.number = static_cast<std::int64_t>(n);
    return r;
  };
  const auto replies = fan_out(targets, call, targets.size(), true);
  std::size_t total = 0;
  for (std::size_t i = 0; i < replies.size(); ++i) {
    if (replies[i].ok)
      total += static_cast<std::size_t>(replies[i].number);
    else
      logger()->warn("invalidate_by_tags on node {} failed: {}",
                     targets[i].node.id, replies[i].err);
  }
  if (removed)
    *removed = total;
  logger()->debug("invalidate_by_tags removed {} entries", total);
  return true;
}

bool DistributedCache::add_node(const CacheNode &node, std::string *err) {
  if (!connected_) {
    fail(err, "not connected");
    return false;
  }
  if (node.id.empty()) {
    fail(err, "node id must not be empty");
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(topology_mu_);
    if (nodes_.contains(node.id)) {
      fail(err, "duplicate node id: " + node.id);
      return false;
    }
  }
  auto h = make_handle(node);
  const NodeCall open = [](const NodeHandle &t) {
    Reply r;
    r.ok = t.backend->connect(&r.err);
    return r;
  };
  const auto replies = fan_out({h}, open, 1, true, false);
  const bool ok = replies.front().ok;
  {
    std::lock_guard<std::mutex> lock(topology_mu_);
    if (nodes_.contains(node.id)) {
      fail(err, "duplicate node id: " + node.id);
      return false;
    }
    h.connected = ok;
    nodes_[node.id] = h;
    if (ok) {
      ring_.add_node(node);
    } else {
      failures_[node.id] =
          FailureState{cfg_.failure_threshold, true, Clock::now()};
      ++counters_.quarantines;
    }
  }
  if (!ok) {
    logger()->error("node {} added but unreachable: {}", node.id,
                    replies.front().err);
    fail(err, node.id + ": " + replies.front().err);
    return false;
  }
  logger()->info("node {} joined the ring", node.id);
  return true;
}

bool DistributedCache::remove_node(const std::string &node_id) {
  NodeHandle h;
  {
    std::lock_guard<std::mutex> lock(topology_mu_);
    auto it = nodes_.find(node_id);
    if (it == nodes_.end())
      return false;
    h = it->second;
    nodes_.erase(it);
    failures_.erase(node_id);
    ring_.remove_node(node_id);
  }
  if (h.connected && h.backend) {
    const NodeCall close = [](const NodeHandle &t) {
      Reply r;
      r.ok = t.backend->disconnect(&r.err);
      return r;
    };
    const auto replies = fan_out({h}, close, 1, true, false);
    if (!replies.front().ok)
      logger()->warn("disconnecting removed node {} failed: {}", node_id,
                     replies.front().err);
  }
  logger()->info("node {} left the ring", node_id);
  return true;
}

std::size_t DistributedCache::check_health() {
  if (!connected_)
    return 0;
  const auto now = Clock::now();
  const auto spacing = std::chrono::seconds(cfg_.recovery_interval_seconds);
  std::vector<NodeHandle> due;
  {
    std::lock_guard<std::mutex> lock(topology_mu_);
    for (const auto &[id, state] : failures_) {
      if (!state.quarantined || now - state.last_attempt < spacing)
        continue;
      auto it = nodes_.find(id);
      if (it != nodes_.end())
        due.push_back(it->second);
    }
  }
  if (due.empty())
    return 0;
  for (auto &h : due)
    if (!h.backend)
      h.backend = make_handle(h.node).backend;

  const NodeCall probe = [](const NodeHandle &t) {
    Reply r;
    r.ok = t.connected ? t.backend->ping(&r.err) : t.backend->connect(&r.err);
    return r;
  };
  const auto replies = fan_out(due, probe, due.size(), true, false);

  std::vector<std::string> recovered;
  {
    std::lock_guard<std::mutex> lock(topology_mu_);
    for (std::size_t i = 0; i < due.size(); ++i) {
      const auto &id = due[i].node.id;
      auto it = nodes_.find(id);
      auto f = failures_.find(id);
      if (it == nodes_.end() || f == failures_.end() || !f->second.quarantined)
        continue;
      if (!it->second.backend)
        it->second.backend = due[i].backend;
      if (replies[i].ok) {
        it->second.connected = true;
        failures_.erase(f);
        ring_.add_node(it->second.node);
        ++counters_.recoveries;
        recovered.push_back(id);
      } else {
        f->second.last_attempt = now;
      }
    }
  }
  for (std::size_t i = 0; i < due.size(); ++i)
    if (!replies[i].ok)
      logger()->debug("node {} still unhealthy: {}", due[i].node.id,
                      replies[i].err);
  for (const auto &id : recovered)
    logger()->info("node {} recovered and rejoined the ring", id);
  return recovered.size();
}

void DistributedCache::health_loop() {
  const auto interval = std::chrono::seconds(cfg_.health_check_interval_seconds);
  std::unique_lock<std::mutex> lock(health_mu_);
  while (!stop_health_) {
    if (health_cv_.wait_for(lock, interval, [this] { return stop_health_; }))
      break;
    lock.unlock();
    check_health();
    lock.lock();
  }
}

void DistributedCache::stop_health() {
  if (!health_thread_.joinable())
    return;
  {
    std::lock_guard<std::mutex> lock(health_mu_);
    stop_health_ = true;
  }
  health_cv_.notify_all();
  health_thread_.join();
}

bool DistributedCache::is_quarantined(const std::string &node_id) const {
  std::lock_guard<std::mutex> lock(topology_mu_);
  auto it = failures_.find(node_id);
  return it != failures_.end() && it->second.quarantined;
}

std::uint32_t DistributedCache::failure_count(const std::string &node_id) const {
  std::lock_guard<std::mutex> lock(topology_mu_);
  auto it = failures_.find(node_id);
  return it == failures_.end() ? 0 : it->second.failures;
}

std::shared_ptr<ICacheBackend>
DistributedCache::backend(const std::string &node_id) const {
  std::lock_guard<std::mutex> lock(topology_mu_);
  auto it = nodes_.find(node_id);
  return it == nodes_.end() ? nullptr : it->second.backend;
}

DistributedStats DistributedCache::stats() const {
  DistributedStats s;
  s.hits = counters_.hits;
  s.misses = counters_.misses;
  s.sets = counters_.sets;
  s.deletes = counters_.deletes;
  s.errors = counters_.errors;
  s.node_failures = counters_.node_failures;
  s.read_repairs = counters_.read_repairs;
  s.read_repair_failures = counters_.read_repair_failures;
  s.quarantines = counters_.quarantines;
  s.recoveries = counters_.recoveries;
  return s;
}

std::vector<NodeStatus> DistributedCache::cluster_stats() const {
  std::vector<NodeStatus> out;
  std::lock_guard<std::mutex> lock(topology_mu_);
  out.reserve(nodes_.size());
  for (const auto &[id, h] : nodes_) {
    NodeStatus st;
    st.node = h.node;
    st.connected = h.connected;
    st.in_ring = ring_.contains(id);
    auto f = failures_.find(id);
    if (f != failures_.end()) {
      st.quarantined = f->second.quarantined;
      st.failures = f->second.failures;
    }
    out.push_back(std::move(st));
  }
  std::sort(out.begin(), out.end(), [](const NodeStatus &a, const NodeStatus &b) {
    return a.node.id < b.node.id;
  });
  return out;
}

std::string DistributedCache::info() const {
  const auto s = stats();
  const auto nodes = cluster_stats();
  std::size_t in_ring = 0;
  for (const auto &n : nodes)
    in_ring += n.in_ring ? 1 : 0;
  std::ostringstream os;
  os << "nodes:" << nodes.size() << "\n";
  os << "nodes_in_ring:" << in_ring << "\n";
  os << "virtual_nodes:" << cfg_.virtual_nodes << "\n";
  os << "hash_algorithm:" << cfg_.hash_algorithm << "\n";
  os << "replication_factor:" << cfg_.replication_factor << "\n";
  os << "read_consistency:" << to_string(cfg_.read_consistency) << "\n";
  os << "write_consistency:" << to_string(cfg_.write_consistency) << "\n";
  os << "hits:" << s.hits << "\n";
  os << "misses:" << s.misses << "\n";
  os << "sets:" << s.sets << "\n";
  os << "deletes:" << s.deletes << "\n";
  os << "errors:" << s.errors << "\n";
  os << "node_failures:" << s.node_failures << "\n";
  os << "read_repairs:" << s.read_repairs << "\n";
  os << "read_repair_failures:" << s.read_repair_failures << "\n";
  os << "quarantines:" << s.quarantines << "\n";
  os << "recoveries:" << s.recoveries << "\n";
  return os.str();
}

} // namespace quorum_cache
