#include "quorum_cache/registry.hpp"
#include "quorum_cache/logging.hpp"

#include <algorithm>

namespace quorum_cache {

CacheRegistry::~CacheRegistry() { shutdown(); }

bool CacheRegistry::add(const std::string &name,
                        std::shared_ptr<ICacheBackend> backend,
                        std::string *err) {
  if (name.empty() || !backend) {
    if (err)
      *err = "name and backend required";
    return false;
  }
  std::lock_guard<std::mutex> lock(mu_);
  if (backends_.contains(name)) {
    if (err)
      *err = "cache already registered: " + name;
    return false;
  }
  backends_[name] = std::move(backend);
  order_.push_back(name);
  return true;
}

std::shared_ptr<ICacheBackend>
CacheRegistry::get(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = backends_.find(name);
  return it == backends_.end() ? nullptr : it->second;
}

std::vector<std::string> CacheRegistry::names() const {
  std::lock_guard<std::mutex> lock(mu_);
  return order_;
}

std::size_t CacheRegistry::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return order_.size();
}

bool CacheRegistry::init(std::string *err) {
  std::vector<std::pair<std::string, std::shared_ptr<ICacheBackend>>> todo;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto &name : order_)
      todo.emplace_back(name, backends_[name]);
  }
  std::string failed;
  for (const auto &[name, backend] : todo) {
    std::string e;
    if (backend->connect(&e)) {
      logger()->info("cache {} ({}) ready", name, backend->name());
      continue;
    }
    logger()->error("cache {} failed to connect: {}", name, e);
    if (!failed.empty())
      failed += "; ";
    failed += name + ": " + e;
  }
  if (!failed.empty()) {
    if (err)
      *err = failed;
    return false;
  }
  return true;
}

void CacheRegistry::shutdown() {
  std::vector<std::pair<std::string, std::shared_ptr<ICacheBackend>>> todo;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto &name : order_)
      todo.emplace_back(name, backends_[name]);
    order_.clear();
    backends_.clear();
  }
  std::reverse(todo.begin(), todo.end());
  for (const auto &[name, backend] : todo) {
    std::string e;
    if (!backend->disconnect(&e))
      logger()->warn("cache {} failed to disconnect: {}", name, e);
  }
}

} // namespace quorum_cache
