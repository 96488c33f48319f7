#include "quorum_cache/local_cache.hpp"
#include "quorum_cache/logging.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <stdexcept>

namespace quorum_cache {

LocalCache::LocalCache(LocalConfig cfg)
    : LocalCache(cfg, make_policy_by_name(cfg.eviction_policy)) {}

LocalCache::LocalCache(LocalConfig cfg, std::unique_ptr<IEvictionPolicy> policy)
    : cfg_(std::move(cfg)), policy_(std::move(policy)) {
  if (!policy_)
    throw std::invalid_argument("unsupported eviction policy: " +
                                cfg_.eviction_policy);
  cfg_.eviction_policy = policy_->name();
}

LocalCache::~LocalCache() { stop(); }

std::optional<Bytes> LocalCache::get(const std::string &key) {
  const auto k = make_key(key);
  const auto now = Clock::now();
  std::lock_guard<std::mutex> lock(mu_);
  if (!live_entry(k, now)) {
    ++stats_.misses;
    return std::nullopt;
  }
  auto &e = entries_[k];
  e.touch(now);
  policy_->on_access(k, e);
  ++stats_.hits;
  return e.value;
}

bool LocalCache::set(const std::string &key, const Bytes &value,
                     std::optional<std::int64_t> ttl_seconds,
                     std::string *err) {
  return set_tagged(key, value, ttl_seconds, Tags{}, err);
}

bool LocalCache::set_tagged(const std::string &key, const Bytes &value,
                            std::optional<std::int64_t> ttl_seconds,
                            const Tags &tags, std::string *err) {
  if (key.empty() || key.size() > cfg_.max_key_len) {
    if (err)
      *err = kInvalidKeyLength;
    return false;
  }
  if (!validate_ttl(ttl_seconds, err))
    return false;

  const auto k = make_key(key);
  const auto now = Clock::now();
  Entry candidate;
  candidate.value = value;
  candidate.size_bytes = k.size() + value.size();
  candidate.created_at = now;
  candidate.last_access = now;
  candidate.tags = tags;
  if (ttl_seconds.has_value() && *ttl_seconds > 0)
    candidate.ttl_deadline = now + std::chrono::seconds(*ttl_seconds);

  std::lock_guard<std::mutex> lock(mu_);
  if (entries_.contains(k))
    erase_internal(k, false, false);

  ensure_space(candidate.size_bytes, now);
  if (entries_.size() >= cfg_.max_size ||
      memory_used_ + candidate.size_bytes > cfg_.memory_limit_bytes)
    ++stats_.over_limit_inserts;

  candidate.seq = ++seq_;
  const auto deadline = candidate.ttl_deadline;
  memory_used_ += candidate.size_bytes;
  auto &stored = entries_[k] = std::move(candidate);
  policy_->on_insert(k, stored);
  if (deadline.has_value())
    schedule_expiry(k, *deadline);
  ++stats_.sets;
  return true;
}

bool LocalCache::del(const std::string &key) {
  const auto k = make_key(key);
  std::lock_guard<std::mutex> lock(mu_);
  if (!entries_.contains(k))
    return false;
  erase_internal(k, false, false);
  ++stats_.deletes;
  return true;
}

bool LocalCache::exists(const std::string &key) {
  const auto k = make_key(key);
  std::lock_guard<std::mutex> lock(mu_);
  return live_entry(k, Clock::now());
}

bool LocalCache::expire(const std::string &key, std::int64_t ttl_seconds,
                        std::string *err) {
  std::optional<std::int64_t> ttl = ttl_seconds;
  if (!validate_ttl(ttl, err))
    return false;
  const auto k = make_key(key);
  const auto now = Clock::now();
  std::lock_guard<std::mutex> lock(mu_);
  if (!live_entry(k, now))
    return false;
  auto &e = entries_[k];
  e.ttl_deadline = now + std::chrono::seconds(*ttl);
  schedule_expiry(k, *e.ttl_deadline);
  return true;
}

std::int64_t LocalCache::ttl(const std::string &key) {
  const auto k = make_key(key);
  const auto now = Clock::now();
  std::lock_guard<std::mutex> lock(mu_);
  if (!live_entry(k, now))
    return -1;
  const auto &e = entries_[k];
  if (!e.ttl_deadline.has_value())
    return -1;
  const auto secs =
      std::chrono::duration_cast<std::chrono::seconds>(*e.ttl_deadline - now)
          .count();
  return std::max<std::int64_t>(0, secs);
}

std::size_t LocalCache::clear() {
  std::lock_guard<std::mutex> lock(mu_);
  if (cfg_.key_namespace.empty()) {
    const auto removed = entries_.size();
    entries_.clear();
    expiry_generation_.clear();
    expiry_heap_ = {};
    policy_->reset();
    memory_used_ = 0;
    return removed;
  }
  const auto prefix = cfg_.key_namespace + ":";
  std::vector<std::string> doomed;
  for (const auto &[k, e] : entries_) {
    if (k.starts_with(prefix))
      doomed.push_back(k);
  }
  for (const auto &k : doomed)
    erase_internal(k, false, false);
  return doomed.size();
}

std::size_t LocalCache::invalidate_by_tags(const Tags &tags) {
  if (tags.empty())
    return 0;
  const auto prefix =
      cfg_.key_namespace.empty() ? std::string() : cfg_.key_namespace + ":";
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::string> doomed;
  for (const auto &[k, e] : entries_) {
    if (k.starts_with(prefix) && e.tagged_any(tags))
      doomed.push_back(k);
  }
  for (const auto &k : doomed)
    erase_internal(k, false, false);
  stats_.deletes += doomed.size();
  return doomed.size();
}

std::size_t LocalCache::sweep_expired() {
  std::lock_guard<std::mutex> lock(mu_);
  const auto now = Clock::now();
  std::size_t removed = 0;
  std::size_t popped = 0;
  while (!expiry_heap_.empty() &&
         (cfg_.ttl_sweep_batch == 0 || popped < cfg_.ttl_sweep_batch)) {
    const auto &node = expiry_heap_.top();
    if (node.deadline >= now)
      break;
    const auto key = node.key;
    const auto gen = node.generation;
    expiry_heap_.pop();
    ++popped;
    auto git = expiry_generation_.find(key);
    if (git == expiry_generation_.end() || git->second != gen)
      continue;
    auto it = entries_.find(key);
    if (it != entries_.end() && it->second.is_expired(now)) {
      erase_internal(key, false, true);
      ++removed;
    }
  }
  return removed;
}

void LocalCache::start() {
  if (cfg_.ttl_sweep_interval_seconds == 0 || sweeper_.joinable())
    return;
  {
    std::lock_guard<std::mutex> lock(sweep_mu_);
    stop_sweep_ = false;
  }
  sweeper_ = std::thread([this] { sweep_loop(); });
}

void LocalCache::stop() {
  if (!sweeper_.joinable())
    return;
  {
    std::lock_guard<std::mutex> lock(sweep_mu_);
    stop_sweep_ = true;
  }
  sweep_cv_.notify_all();
  sweeper_.join();
}

LocalStats LocalCache::stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  LocalStats s = stats_;
  s.size = entries_.size();
  s.memory_used = memory_used_;
  s.over_limit = entries_.size() > cfg_.max_size ||
                 memory_used_ > cfg_.memory_limit_bytes;
  return s;
}

std::string LocalCache::info() const {
  const auto s = stats();
  std::ostringstream os;
  os << "eviction_policy:" << policy_->name() << "\n";
  os << "keys:" << s.size << "\n";
  os << "max_size:" << cfg_.max_size << "\n";
  os << "memory_used_bytes:" << s.memory_used << "\n";
  os << "memory_limit_bytes:" << cfg_.memory_limit_bytes << "\n";
  os << "over_limit:" << (s.over_limit ? 1 : 0) << "\n";
  os << "hits:" << s.hits << "\n";
  os << "misses:" << s.misses << "\n";
  os << "sets:" << s.sets << "\n";
  os << "deletes:" << s.deletes << "\n";
  os << "evictions:" << s.evictions << "\n";
  os << "expirations:" << s.expirations << "\n";
  os << "over_limit_inserts:" << s.over_limit_inserts << "\n";
  return os.str();
}

std::size_t LocalCache::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

std::size_t LocalCache::memory_used() const {
  std::lock_guard<std::mutex> lock(mu_);
  return memory_used_;
}

std::size_t LocalCache::pending_expiries() const {
  std::lock_guard<std::mutex> lock(mu_);
  return expiry_heap_.size();
}

std::string LocalCache::make_key(const std::string &key) const {
  if (cfg_.key_namespace.empty())
    return key;
  return cfg_.key_namespace + ":" + key;
}

bool LocalCache::validate_ttl(std::optional<std::int64_t> &ttl_seconds,
                              std::string *err) const {
  if (!ttl_seconds.has_value()) {
    if (cfg_.default_ttl_seconds > 0)
      ttl_seconds = cfg_.default_ttl_seconds;
    return true;
  }
  if (*ttl_seconds < 0 ||
      (cfg_.max_ttl_seconds > 0 && *ttl_seconds > cfg_.max_ttl_seconds)) {
    if (err)
      *err = kInvalidTtl;
    return false;
  }
  return true;
}

bool LocalCache::live_entry(const std::string &key, TimePoint now) {
  auto it = entries_.find(key);
  if (it == entries_.end())
    return false;
  if (cfg_.lazy_expiration && it->second.is_expired(now)) {
    erase_internal(key, false, true);
    return false;
  }
  return true;
}

void LocalCache::schedule_expiry(const std::string &key, TimePoint deadline) {
  const auto gen = ++expiry_seq_;
  expiry_generation_[key] = gen;
  expiry_heap_.push({deadline, key, gen});
  // Re-expiring a key leaves its old node behind until that deadline.
  if (expiry_heap_.size() > 2 * expiry_generation_.size() + 64)
    compact_expiries();
}

void LocalCache::compact_expiries() {
  std::vector<ExpiryNode> live;
  live.reserve(expiry_generation_.size());
  while (!expiry_heap_.empty()) {
    const auto &node = expiry_heap_.top();
    auto git = expiry_generation_.find(node.key);
    if (git != expiry_generation_.end() && git->second == node.generation)
      live.push_back(node);
    expiry_heap_.pop();
  }
  expiry_heap_ = decltype(expiry_heap_)(std::greater<ExpiryNode>(),
                                        std::move(live));
}

void LocalCache::erase_internal(const std::string &key, bool eviction,
                                bool expiration) {
  auto it = entries_.find(key);
  if (it == entries_.end())
    return;
  memory_used_ -= it->second.size_bytes;
  policy_->on_erase(key);
  entries_.erase(it);
  expiry_generation_.erase(key);
  if (eviction)
    ++stats_.evictions;
  if (expiration)
    ++stats_.expirations;
}

void LocalCache::ensure_space(std::size_t needed, TimePoint now) {
  while (!entries_.empty() &&
         (entries_.size() >= cfg_.max_size ||
          memory_used_ + needed > cfg_.memory_limit_bytes)) {
    auto victim = policy_->pick_victim(entries_, now);
    if (!victim.has_value() || !entries_.contains(*victim))
      break;
    erase_internal(*victim, true, false);
  }
}

void LocalCache::sweep_loop() {
  const auto interval = std::chrono::seconds(cfg_.ttl_sweep_interval_seconds);
  std::unique_lock<std::mutex> lock(sweep_mu_);
  while (!stop_sweep_) {
    if (sweep_cv_.wait_for(lock, interval, [this] { return stop_sweep_; }))
      break;
    lock.unlock();
    const auto removed = sweep_expired();
    if (removed > 0)
      logger()->debug("ttl sweep removed {} expired entries", removed);
    lock.lock();
  }
}

} // namespace quorum_cache
