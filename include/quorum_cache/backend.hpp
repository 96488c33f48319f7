#pragma once

#include "quorum_cache/local_cache.hpp"
#include "quorum_cache/types.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace quorum_cache {

// Storage contract every per-node unit implements. Absence is an empty
// optional; a false return means the operation itself failed.
class ICacheBackend {
public:
  virtual ~ICacheBackend() = default;
  virtual std::string name() const = 0;
  virtual bool connect(std::string *err = nullptr) = 0;
  virtual bool disconnect(std::string *err = nullptr) = 0;
  virtual bool ping(std::string *err = nullptr) = 0;
  virtual bool get(const std::string &key, std::optional<Bytes> *out,
                   std::string *err = nullptr) = 0;
  virtual bool set(const std::string &key, const Bytes &value,
                   std::optional<std::int64_t> ttl_seconds,
                   std::string *err = nullptr) = 0;
  virtual bool del(const std::string &key, std::string *err = nullptr) = 0;
  virtual bool exists(const std::string &key, bool *out,
                      std::string *err = nullptr) = 0;
  virtual bool expire(const std::string &key, std::int64_t ttl_seconds,
                      std::string *err = nullptr) = 0;
  virtual bool ttl(const std::string &key, std::int64_t *out,
                   std::string *err = nullptr) = 0;
  virtual bool clear(std::string *err = nullptr) = 0;

  // Stores without tag support take untagged writes only.
  virtual bool set_tagged(const std::string &key, const Bytes &value,
                          std::optional<std::int64_t> ttl_seconds,
                          const Tags &tags, std::string *err = nullptr) {
    if (tags.empty())
      return set(key, value, ttl_seconds, err);
    if (err)
      *err = name() + ": tags not supported";
    return false;
  }
  virtual bool invalidate_by_tags(const Tags &, std::size_t *removed,
                                  std::string *err = nullptr) {
    if (removed)
      *removed = 0;
    if (err)
      *err = name() + ": tags not supported";
    return false;
  }
};

// A LocalCache behind the backend contract. connect() starts the TTL
// sweeper; operations on a disconnected backend fail.
class LocalBackend final : public ICacheBackend {
public:
  explicit LocalBackend(LocalConfig cfg, std::string name = "local");

  std::string name() const override { return name_; }
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
  bool invalidate_by_tags(const Tags &tags, std::size_t *removed,
                          std::string *err = nullptr) override;

  bool connected() const { return connected_; }
  LocalCache &cache() { return cache_; }
  const LocalCache &cache() const { return cache_; }

private:
  bool check_connected(std::string *err) const;

  std::string name_;
  LocalCache cache_;
  std::atomic<bool> connected_{false};
};

} // namespace quorum_cache
