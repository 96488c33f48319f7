#include "quorum_cache/hash_ring.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <unordered_set>

namespace quorum_cache {

ConsistentHashRing::ConsistentHashRing(std::size_t virtual_nodes,
                                       HashFunction hash)
    : virtual_nodes_(virtual_nodes), hash_(std::move(hash)) {
  if (virtual_nodes_ == 0)
    throw std::invalid_argument("virtual_nodes must be positive");
  if (!hash_)
    throw std::invalid_argument("hash function required");
}

bool ConsistentHashRing::add_node(const CacheNode &node) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  if (nodes_.contains(node.id))
    return false;
  nodes_[node.id] = node;
  auto &owned = node_positions_[node.id];
  const std::size_t count = virtual_nodes_ * std::max<std::uint32_t>(1, node.weight);
  owned.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    const auto pos = hash_(node.id + ":" + std::to_string(i));
    // First owner keeps a colliding slot.
    if (ring_.emplace(pos, node.id).second)
      owned.push_back(pos);
  }
  return true;
}

bool ConsistentHashRing::remove_node(const std::string &node_id) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  auto it = node_positions_.find(node_id);
  if (it == node_positions_.end())
    return false;
  for (auto pos : it->second)
    ring_.erase(pos);
  node_positions_.erase(it);
  nodes_.erase(node_id);
  return true;
}

std::optional<CacheNode> ConsistentHashRing::get_node(std::string_view key) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  if (ring_.empty())
    return std::nullopt;
  auto it = ring_.lower_bound(hash_(key));
  if (it == ring_.end())
    it = ring_.begin();
  return nodes_.at(it->second);
}

std::vector<CacheNode> ConsistentHashRing::get_nodes(std::string_view key,
                                                     std::size_t count) const {
  std::vector<CacheNode> out;
  std::shared_lock<std::shared_mutex> lock(mu_);
  if (ring_.empty() || count == 0)
    return out;
  const std::size_t wanted = std::min(count, nodes_.size());
  out.reserve(wanted);
  std::unordered_set<std::string> seen;
  auto it = ring_.lower_bound(hash_(key));
  for (std::size_t steps = 0; steps < ring_.size() && out.size() < wanted;
       ++steps, ++it) {
    if (it == ring_.end())
      it = ring_.begin();
    if (seen.insert(it->second).second)
      out.push_back(nodes_.at(it->second));
  }
  return out;
}

std::vector<std::uint64_t>
ConsistentHashRing::positions(const std::string &node_id) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = node_positions_.find(node_id);
  if (it == node_positions_.end())
    return {};
  return it->second;
}

std::vector<CacheNode> ConsistentHashRing::all_nodes() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  std::vector<CacheNode> out;
  out.reserve(nodes_.size());
  for (const auto &[id, node] : nodes_)
    out.push_back(node);
  return out;
}

bool ConsistentHashRing::contains(const std::string &node_id) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return nodes_.contains(node_id);
}

std::size_t ConsistentHashRing::size() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return nodes_.size();
}

std::size_t ConsistentHashRing::ring_size() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return ring_.size();
}

} // namespace quorum_cache
