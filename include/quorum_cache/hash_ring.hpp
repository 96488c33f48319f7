#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace quorum_cache {

struct CacheNode {
  std::string id;
  std::string host;
  int port{0};
  std::uint32_t weight{1};

  static CacheNode endpoint(const std::string &host, int port,
                            std::uint32_t weight = 1) {
    return {host + ":" + std::to_string(port), host, port, weight};
  }

  bool operator==(const CacheNode &other) const { return id == other.id; }
};

using HashFunction = std::function<std::uint64_t(std::string_view)>;

// md5, sha1, sha256 (first 8 digest bytes, big-endian) or fnv1a.
// Returns an empty function for an unknown algorithm.
HashFunction make_hash_function(const std::string &algorithm);

class ConsistentHashRing {
public:
  ConsistentHashRing(std::size_t virtual_nodes, HashFunction hash);

  bool add_node(const CacheNode &node);
  bool remove_node(const std::string &node_id);

  std::optional<CacheNode> get_node(std::string_view key) const;
  std::vector<CacheNode> get_nodes(std::string_view key,
                                   std::size_t count) const;

  std::vector<std::uint64_t> positions(const std::string &node_id) const;
  std::vector<CacheNode> all_nodes() const;
  bool contains(const std::string &node_id) const;
  std::size_t size() const;
  std::size_t ring_size() const;
  std::size_t virtual_nodes() const { return virtual_nodes_; }

private:
  std::size_t virtual_nodes_;
  HashFunction hash_;
  std::map<std::uint64_t, std::string> ring_;
  std::unordered_map<std::string, CacheNode> nodes_;
  std::unordered_map<std::string, std::vector<std::uint64_t>> node_positions_;
  mutable std::shared_mutex mu_;
};

} // namespace quorum_cache

template <> struct std::hash<quorum_cache::CacheNode> {
  std::size_t operator()(const quorum_cache::CacheNode &n) const noexcept {
    return std::hash<std::string>{}(n.id);
  }
};
