#include "quorum_cache/backend.hpp"
#include "quorum_cache/logging.hpp"

namespace quorum_cache {

LocalBackend::LocalBackend(LocalConfig cfg, std::string name)
    : name_(std::move(name)), cache_(std::move(cfg)) {}

bool LocalBackend::connect(std::string *) {
  if (connected_.exchange(true))
    return true;
  cache_.start();
  logger()->debug("local backend {} connected (policy={})", name_,
                  cache_.policy_name());
  return true;
}

bool LocalBackend::disconnect(std::string *) {
  if (!connected_.exchange(false))
    return true;
  cache_.stop();
  cache_.clear();
  logger()->debug("local backend {} disconnected", name_);
  return true;
}

bool LocalBackend::ping(std::string *err) { return check_connected(err); }

bool LocalBackend::get(const std::string &key, std::optional<Bytes> *out,
                       std::string *err) {
  if (!check_connected(err))
    return false;
  auto v = cache_.get(key);
  if (out)
    *out = std::move(v);
  return true;
}

bool LocalBackend::set(const std::string &key, const Bytes &value,
                       std::optional<std::int64_t> ttl_seconds,
                       std::string *err) {
  if (!check_connected(err))
    return false;
  return cache_.set(key, value, ttl_seconds, err);
}

bool LocalBackend::del(const std::string &key, std::string *err) {
  if (!check_connected(err))
    return false;
  cache_.del(key);
  return true;
}

bool LocalBackend::exists(const std::string &key, bool *out,
                          std::string *err) {
  if (!check_connected(err))
    return false;
  const bool found = cache_.exists(key);
  if (out)
    *out = found;
  return true;
}

// Expiring an absent key is not an error.
bool LocalBackend::expire(const std::string &key, std::int64_t ttl_seconds,
                          std::string *err) {
  if (!check_connected(err))
    return false;
  std::string local_err;
  if (!cache_.expire(key, ttl_seconds, &local_err) && !local_err.empty()) {
    if (err)
      *err = local_err;
    return false;
  }
  return true;
}

bool LocalBackend::ttl(const std::string &key, std::int64_t *out,
                       std::string *err) {
  if (!check_connected(err))
    return false;
  const auto remaining = cache_.ttl(key);
  if (out)
    *out = remaining;
  return true;
}

bool LocalBackend::clear(std::string *err) {
  if (!check_connected(err))
    return false;
  cache_.clear();
  return true;
}

bool LocalBackend::set_tagged(const std::string &key, const Bytes &value,
                              std::optional<std::int64_t> ttl_seconds,
                              const Tags &tags, std::string *err) {
  if (!check_connected(err))
    return false;
  return cache_.set_tagged(key, value, ttl_seconds, tags, err);
}

bool LocalBackend::invalidate_by_tags(const Tags &tags, std::size_t *removed,
                                      std::string *err) {
  if (!check_connected(err))
    return false;
  const auto n = cache_.invalidate_by_tags(tags);
  if (removed)
    *removed = n;
  return true;
}

bool LocalBackend::check_connected(std::string *err) const {
  if (connected_)
    return true;
  if (err)
    *err = name_ + ": not connected";
  return false;
}

} // namespace quorum_cache
