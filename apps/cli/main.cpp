#include "quorum_cache/config.hpp"
#include "quorum_cache/distributed.hpp"
#include "quorum_cache/logging.hpp"
#include "quorum_cache/registry.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_map>

using namespace quorum_cache;

namespace {

// LocalBackend that FAIL/HEAL can take offline.
class SwitchableBackend final : public ICacheBackend {
public:
  SwitchableBackend(LocalConfig cfg, const std::string &name)
      : inner_(std::move(cfg), name) {}

  void set_down(bool down) { down_ = down; }
  bool down() const { return down_; }

  std::string name() const override { return inner_.name(); }
  bool connect(std::string *err) override {
    return up(err) && inner_.connect(err);
  }
  bool disconnect(std::string *err) override { return inner_.disconnect(err); }
  bool ping(std::string *err) override { return up(err) && inner_.ping(err); }
  bool get(const std::string &key, std::optional<Bytes> *out,
           std::string *err) override {
    return up(err) && inner_.get(key, out, err);
  }
  bool set(const std::string &key, const Bytes &value,
           std::optional<std::int64_t> ttl_seconds, std::string *err) override {
    return up(err) && inner_.set(key, value, ttl_seconds, err);
  }
  bool del(const std::string &key, std::string *err) override {
    return up(err) && inner_.del(key, err);
  }
  bool exists(const std::string &key, bool *out, std::string *err) override {
    return up(err) && inner_.exists(key, out, err);
  }
  bool expire(const std::string &key, std::int64_t ttl_seconds,
              std::string *err) override {
    return up(err) && inner_.expire(key, ttl_seconds, err);
  }
  bool ttl(const std::string &key, std::int64_t *out,
           std::string *err) override {
    return up(err) && inner_.ttl(key, out, err);
  }
  bool clear(std::string *err) override { return up(err) && inner_.clear(err); }
  bool set_tagged(const std::string &key, const Bytes &value,
                  std::optional<std::int64_t> ttl_seconds, const Tags &tags,
                  std::string *err) override {
    return up(err) && inner_.set_tagged(key, value, ttl_seconds, tags, err);
  }
  bool invalidate_by_tags(const Tags &tags, std::size_t *removed,
                          std::string *err) override {
    return up(err) && inner_.invalidate_by_tags(tags, removed, err);
  }

  std::size_t size() const { return inner_.cache().size(); }

private:
  bool up(std::string *err) const {
    if (!down_)
      return true;
    if (err)
      *err = inner_.name() + ": node down";
    return false;
  }

  LocalBackend inner_;
  std::atomic<bool> down_{false};
};

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

bool parse_count(const std::string &s, std::size_t &out) {
  try {
    std::size_t idx = 0;
    out = static_cast<std::size_t>(std::stoul(s, &idx));
    return idx == s.size();
  } catch (const std::exception &) {
    return false;
  }
}

int usage() {
  std::cerr << "usage: quorum_cache_cli [--config path] [--nodes N] "
               "[--log-level L]\n";
  return 2;
}

void print_error(const std::string &err) {
  std::cout << "(error) " << err << "\n";
}

} // namespace

int main(int argc, char **argv) {
  std::string config_path;
  std::string log_level = "warn";
  std::size_t node_count = 3;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc)
      config_path = argv[++i];
    else if (a == "--nodes" && i + 1 < argc) {
      if (!parse_count(argv[++i], node_count) || node_count == 0)
        return usage();
    } else if (a == "--log-level" && i + 1 < argc)
      log_level = argv[++i];
    else
      return usage();
  }
  if (!set_log_level(log_level)) {
    std::cerr << "unknown log level: " << log_level << "\n";
    return 2;
  }

  LocalConfig local;
  DistributedConfig dist;
  if (!config_path.empty()) {
    std::string err;
    if (!load_config_file(config_path, local, dist, &err)) {
      std::cerr << "config error: " << err << "\n";
      return 1;
    }
  }
  if (dist.nodes.empty())
    for (std::size_t i = 0; i < node_count; ++i)
      dist.nodes.push_back(
          CacheNode::endpoint("127.0.0.1", 7000 + static_cast<int>(i)));

  std::mutex backends_mu;
  std::unordered_map<std::string, std::shared_ptr<SwitchableBackend>> backends;
  auto factory = [&](const CacheNode &node) {
    auto b = std::make_shared<SwitchableBackend>(local, node.id);
    std::lock_guard<std::mutex> lock(backends_mu);
    backends[node.id] = b;
    return std::static_pointer_cast<ICacheBackend>(b);
  };

  std::shared_ptr<DistributedCache> cluster;
  try {
    cluster = std::make_shared<DistributedCache>(dist, factory);
  } catch (const std::invalid_argument &e) {
    std::cerr << "config error: " << e.what() << "\n";
    return 1;
  }
  CacheRegistry registry;
  std::string err;
  if (!registry.add("default", cluster, &err) || !registry.init(&err)) {
    std::cerr << "startup failed: " << err << "\n";
    return 1;
  }
  std::cout << "quorum_cache_cli: " << dist.nodes.size()
            << " nodes, replication_factor=" << dist.replication_factor
            << " read=" << to_string(dist.read_consistency)
            << " write=" << to_string(dist.write_consistency) << "\n";

  std::string line;
  while (std::getline(std::cin, line)) {
    std::istringstream in(line);
    std::string cmd;
    if (!(in >> cmd))
      continue;
    cmd = upper(cmd);
    if (cmd == "QUIT" || cmd == "EXIT")
      break;
    std::string key;
    err.clear();
    if (cmd == "GET" && in >> key) {
      std::optional<Bytes> v;
      if (!cluster->get(key, &v, &err))
        print_error(err);
      else if (!v)
        std::cout << "(nil)\n";
      else
        std::cout << "\"" << to_string(*v) << "\"\n";
    } else if (cmd == "SET" && in >> key) {
      std::string value;
      if (!(in >> value)) {
        print_error("usage: SET key value [ttl]");
        continue;
      }
      std::optional<std::int64_t> ttl;
      std::int64_t t = 0;
      if (in >> t)
        ttl = t;
      if (cluster->set(key, to_bytes(value), ttl, &err))
        std::cout << "OK\n";
      else
        print_error(err);
    } else if (cmd == "TAGSET" && in >> key) {
      std::string value;
      std::string tag;
      if (!(in >> value)) {
        print_error("usage: TAGSET key value tag [tag ...]");
        continue;
      }
      Tags tags;
      while (in >> tag)
        tags.insert(tag);
      if (cluster->set_tagged(key, to_bytes(value), std::nullopt, tags, &err))
        std::cout << "OK\n";
      else
        print_error(err);
    } else if (cmd == "INVALIDATE") {
      Tags tags;
      std::string tag;
      while (in >> tag)
        tags.insert(tag);
      std::size_t removed = 0;
      if (tags.empty())
        print_error("usage: INVALIDATE tag [tag ...]");
      else if (cluster->invalidate_by_tags(tags, &removed, &err))
        std::cout << "(integer) " << removed << "\n";
      else
        print_error(err);
    } else if (cmd == "DEL" && in >> key) {
      if (cluster->del(key, &err))
        std::cout << "OK\n";
      else
        print_error(err);
    } else if (cmd == "EXISTS" && in >> key) {
      bool found = false;
      if (cluster->exists(key, &found, &err))
        std::cout << "(integer) " << (found ? 1 : 0) << "\n";
      else
        print_error(err);
    } else if (cmd == "EXPIRE" && in >> key) {
      std::int64_t t = 0;
      if (!(in >> t)) {
        print_error("usage: EXPIRE key seconds");
        continue;
      }
      if (cluster->expire(key, t, &err))
        std::cout << "OK\n";
      else
        print_error(err);
    } else if (cmd == "TTL" && in >> key) {
      std::int64_t t = -1;
      if (cluster->ttl(key, &t, &err))
        std::cout << "(integer) " << t << "\n";
      else
        print_error(err);
    } else if (cmd == "CLEAR") {
      if (cluster->clear(&err))
        std::cout << "OK\n";
      else
        print_error(err);
    } else if (cmd == "NODES") {
      for (const auto &st : cluster->cluster_stats()) {
        std::size_t keys = 0;
        bool down = false;
        {
          std::lock_guard<std::mutex> lock(backends_mu);
          auto it = backends.find(st.node.id);
          if (it != backends.end()) {
            keys = it->second->size();
            down = it->second->down();
          }
        }
        std::cout << st.node.id << " ring=" << (st.in_ring ? "yes" : "no")
                  << " quarantined=" << (st.quarantined ? "yes" : "no")
                  << " failures=" << st.failures << " keys=" << keys
                  << (down ? " [down]" : "") << "\n";
      }
    } else if (cmd == "INFO") {
      std::cout << cluster->info();
    } else if ((cmd == "FAIL" || cmd == "HEAL") && in >> key) {
      std::lock_guard<std::mutex> lock(backends_mu);
      auto it = backends.find(key);
      if (it == backends.end()) {
        print_error("unknown node: " + key);
        continue;
      }
      it->second->set_down(cmd == "FAIL");
      std::cout << "OK\n";
    } else if (cmd == "HEALTH") {
      std::cout << "(integer) " << cluster->check_health() << "\n";
    } else {
      print_error("unknown command or missing argument: " + line);
    }
  }
  registry.shutdown();
  return 0;
}
