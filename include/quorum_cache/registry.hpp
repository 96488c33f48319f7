#pragma once

#include "quorum_cache/backend.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace quorum_cache {

// Named backends with explicit lifecycle. Registries never share state.
class CacheRegistry {
public:
  CacheRegistry() = default;
  ~CacheRegistry();

  CacheRegistry(const CacheRegistry &) = delete;
  CacheRegistry &operator=(const CacheRegistry &) = delete;

  bool add(const std::string &name, std::shared_ptr<ICacheBackend> backend,
           std::string *err = nullptr);
  std::shared_ptr<ICacheBackend> get(const std::string &name) const;
  std::vector<std::string> names() const;
  std::size_t size() const;

  // Connects every backend; on failure err lists the ones that failed.
  bool init(std::string *err = nullptr);
  // Disconnects in reverse registration order and forgets every backend.
  void shutdown();

private:
  mutable std::mutex mu_;
  std::vector<std::string> order_;
  std::unordered_map<std::string, std::shared_ptr<ICacheBackend>> backends_;
};

} // namespace quorum_cache
