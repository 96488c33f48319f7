#include "quorum_cache/policy.hpp"

#include <algorithm>
#include <cctype>
#include <list>
#include <tuple>

namespace quorum_cache {
namespace {

// Front of order_ is the least recently touched key.
class LruPolicy final : public IEvictionPolicy {
public:
  std::string name() const override { return "lru"; }

  void on_insert(const std::string &key, const Entry &) override {
    auto it = index_.find(key);
    if (it != index_.end()) {
      order_.splice(order_.end(), order_, it->second);
      return;
    }
    order_.push_back(key);
    index_[key] = std::prev(order_.end());
  }

  void on_access(const std::string &key, const Entry &entry) override {
    on_insert(key, entry);
  }

  void on_erase(const std::string &key) override {
    auto it = index_.find(key);
    if (it == index_.end())
      return;
    order_.erase(it->second);
    index_.erase(it);
  }

  void reset() override {
    order_.clear();
    index_.clear();
  }

  std::optional<std::string>
  pick_victim(const std::unordered_map<std::string, Entry> &entries,
              TimePoint) override {
    if (entries.empty() || order_.empty())
      return std::nullopt;
    return order_.front();
  }

private:
  std::list<std::string> order_;
  std::unordered_map<std::string, std::list<std::string>::iterator> index_;
};

class LfuPolicy final : public IEvictionPolicy {
public:
  std::string name() const override { return "lfu"; }
  void on_insert(const std::string &, const Entry &) override {}
  void on_access(const std::string &, const Entry &) override {}
  void on_erase(const std::string &) override {}
  void reset() override {}

  std::optional<std::string>
  pick_victim(const std::unordered_map<std::string, Entry> &entries,
              TimePoint) override {
    if (entries.empty())
      return std::nullopt;
    auto it = std::min_element(
        entries.begin(), entries.end(), [](const auto &a, const auto &b) {
          if (a.second.access_count == b.second.access_count)
            return a.second.seq < b.second.seq;
          return a.second.access_count < b.second.access_count;
        });
    return it->first;
  }
};

class FifoPolicy final : public IEvictionPolicy {
public:
  std::string name() const override { return "fifo"; }
  void on_insert(const std::string &, const Entry &) override {}
  void on_access(const std::string &, const Entry &) override {}
  void on_erase(const std::string &) override {}
  void reset() override {}

  std::optional<std::string>
  pick_victim(const std::unordered_map<std::string, Entry> &entries,
              TimePoint) override {
    if (entries.empty())
      return std::nullopt;
    auto it = std::min_element(
        entries.begin(), entries.end(), [](const auto &a, const auto &b) {
          if (a.second.created_at == b.second.created_at)
            return a.second.seq < b.second.seq;
          return a.second.created_at < b.second.created_at;
        });
    return it->first;
  }
};

// Expired entries first, then nearest deadline, entries without a TTL last.
class TtlPolicy final : public IEvictionPolicy {
public:
  std::string name() const override { return "ttl"; }
  void on_insert(const std::string &, const Entry &) override {}
  void on_access(const std::string &, const Entry &) override {}
  void on_erase(const std::string &) override {}
  void reset() override {}

  std::optional<std::string>
  pick_victim(const std::unordered_map<std::string, Entry> &entries,
              TimePoint now) override {
    if (entries.empty())
      return std::nullopt;
    auto rank = [now](const Entry &e) {
      int tier = 2;
      TimePoint deadline = TimePoint::max();
      if (e.ttl_deadline.has_value()) {
        deadline = *e.ttl_deadline;
        tier = e.is_expired(now) ? 0 : 1;
      }
      return std::make_tuple(tier, deadline, e.seq);
    };
    auto it = std::min_element(
        entries.begin(), entries.end(), [&](const auto &a, const auto &b) {
          return rank(a.second) < rank(b.second);
        });
    return it->first;
  }
};

} // namespace

std::unique_ptr<IEvictionPolicy> make_policy_by_name(const std::string &mode) {
  std::string m = mode;
  std::transform(m.begin(), m.end(), m.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (m == "lru")
    return std::make_unique<LruPolicy>();
  if (m == "lfu")
    return std::make_unique<LfuPolicy>();
  if (m == "fifo")
    return std::make_unique<FifoPolicy>();
  if (m == "ttl")
    return std::make_unique<TtlPolicy>();
  return nullptr;
}

} // namespace quorum_cache
