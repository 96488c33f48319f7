#include "quorum_cache/config.hpp"
#include "quorum_cache/policy.hpp"

#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace quorum_cache {
namespace {

bool parse_u64(const std::string &s, std::uint64_t &out) {
  try {
    std::size_t idx = 0;
    out = std::stoull(s, &idx);
    return idx == s.size();
  } catch (const std::exception &) {
    return false;
  }
}

bool parse_i64(const std::string &s, std::int64_t &out) {
  try {
    std::size_t idx = 0;
    out = std::stoll(s, &idx);
    return idx == s.size();
  } catch (const std::exception &) {
    return false;
  }
}

// The numeric extractors throw std::out_of_range when the field is present
// but does not fit; the loaders turn that into a rejection.
bool extract_u64(const std::string &text, const std::string &key,
                 std::uint64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  std::uint64_t v = 0;
  if (!parse_u64(m[1].str(), v))
    throw std::out_of_range(key + " out of range");
  out = v;
  return true;
}
bool extract_i64(const std::string &text, const std::string &key,
                 std::int64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(-?[0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  std::int64_t v = 0;
  if (!parse_i64(m[1].str(), v))
    throw std::out_of_range(key + " out of range");
  out = v;
  return true;
}
bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}
bool extract_bool(const std::string &text, const std::string &key, bool &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str() == "true";
  return true;
}

// Body of the object stored under `key`, braces included.
bool extract_object(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\\{");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  const std::size_t start =
      static_cast<std::size_t>(m.position(0) + m.length(0)) - 1;
  int depth = 0;
  for (std::size_t i = start; i < text.size(); ++i) {
    if (text[i] == '{')
      ++depth;
    else if (text[i] == '}' && --depth == 0) {
      out = text.substr(start, i - start + 1);
      return true;
    }
  }
  return false;
}

bool looks_like_object(const std::string &text) {
  return text.find('{') != std::string::npos &&
         text.find('}') != std::string::npos;
}

bool reject(std::string *err, const std::string &msg) {
  if (err)
    *err = msg;
  return false;
}

bool parse_nodes(const std::string &text, std::vector<CacheNode> &out,
                 bool &present, std::string *err) {
  std::regex array_re("\"nodes\"\\s*:\\s*\\[([^\\]]*)\\]");
  std::smatch m;
  present = std::regex_search(text, m, array_re);
  if (!present)
    return true;
  const std::string body = m[1].str();
  std::regex object_re("\\{[^{}]*\\}");
  std::vector<CacheNode> nodes;
  for (auto it = std::sregex_iterator(body.begin(), body.end(), object_re);
       it != std::sregex_iterator(); ++it) {
    const std::string obj = it->str();
    std::string host;
    std::string id;
    std::uint64_t port = 0;
    const bool has_host = extract_string(obj, "host", host) && !host.empty();
    const bool has_id = extract_string(obj, "id", id) && !id.empty();
    // A logical id alone names a node whose backend needs no address.
    if (!has_host && !has_id)
      return reject(err, "node entry needs a host or an id");
    const std::string label = has_id ? id : host;
    const bool has_port = extract_u64(obj, "port", port);
    if ((has_host || has_port) && (port == 0 || port > 65535))
      return reject(err, "node " + label + " has an invalid port");
    std::uint64_t weight = 1;
    if (extract_u64(obj, "weight", weight) && (weight == 0 || weight > 1000))
      return reject(err, "node " + label + " has an invalid weight");
    CacheNode node{has_id ? id : host + ":" + std::to_string(port), host,
                   static_cast<int>(port), static_cast<std::uint32_t>(weight)};
    nodes.push_back(std::move(node));
  }
  out = std::move(nodes);
  return true;
}

bool apply_local(const std::string &text, LocalConfig &next,
                 std::string *err) {
  std::uint64_t u;
  std::int64_t i;
  std::string s;
  bool b;
  if (extract_u64(text, "max_size", u)) {
    if (u == 0)
      return reject(err, "max_size must be positive");
    next.max_size = static_cast<std::size_t>(u);
  }
  if (extract_u64(text, "memory_limit_bytes", u)) {
    if (u == 0)
      return reject(err, "memory_limit_bytes must be positive");
    next.memory_limit_bytes = static_cast<std::size_t>(u);
  }
  if (extract_string(text, "eviction_policy", s)) {
    if (!make_policy_by_name(s))
      return reject(err, "unknown eviction policy: " + s);
    next.eviction_policy = s;
  }
  if (extract_u64(text, "ttl_sweep_interval_seconds", u))
    next.ttl_sweep_interval_seconds = u;
  if (extract_bool(text, "lazy_expiration", b))
    next.lazy_expiration = b;
  if (extract_u64(text, "ttl_sweep_batch", u)) {
    if (u == 0)
      return reject(err, "ttl_sweep_batch must be positive");
    next.ttl_sweep_batch = static_cast<std::size_t>(u);
  }
  if (extract_u64(text, "max_key_len", u)) {
    if (u == 0)
      return reject(err, "max_key_len must be positive");
    next.max_key_len = static_cast<std::size_t>(u);
  }
  if (extract_i64(text, "default_ttl_seconds", i)) {
    if (i < 0)
      return reject(err, "default_ttl_seconds must not be negative");
    next.default_ttl_seconds = i;
  }
  if (extract_i64(text, "max_ttl_seconds", i)) {
    if (i < 0)
      return reject(err, "max_ttl_seconds must not be negative");
    next.max_ttl_seconds = i;
  }
  if (extract_string(text, "namespace", s))
    next.key_namespace = s;
  return true;
}

bool apply_distributed(const std::string &text, DistributedConfig &next,
                       std::string *err) {
  std::uint64_t u;
  std::string s;
  bool b;
  bool have_nodes = false;
  if (!parse_nodes(text, next.nodes, have_nodes, err))
    return false;
  if (extract_u64(text, "virtual_nodes", u)) {
    if (u == 0 || u > 100000)
      return reject(err, "virtual_nodes out of range");
    next.virtual_nodes = static_cast<std::size_t>(u);
  }
  if (extract_string(text, "hash_algorithm", s)) {
    if (!make_hash_function(s))
      return reject(err, "unsupported hash algorithm: " + s);
    next.hash_algorithm = s;
  }
  if (extract_u64(text, "replication_factor", u)) {
    if (u == 0)
      return reject(err, "replication_factor must be positive");
    next.replication_factor = static_cast<std::size_t>(u);
  }
  if (extract_string(text, "read_consistency", s)) {
    auto level = parse_consistency(s);
    if (!level)
      return reject(err, "unknown read consistency: " + s);
    next.read_consistency = *level;
  }
  if (extract_string(text, "write_consistency", s)) {
    auto level = parse_consistency(s);
    if (!level)
      return reject(err, "unknown write consistency: " + s);
    next.write_consistency = *level;
  }
  if (extract_bool(text, "read_repair", b))
    next.read_repair = b;
  if (extract_u64(text, "failure_threshold", u)) {
    if (u == 0 || u > 1000000)
      return reject(err, "failure_threshold out of range");
    next.failure_threshold = static_cast<std::uint32_t>(u);
  }
  if (extract_u64(text, "health_check_interval_seconds", u))
    next.health_check_interval_seconds = u;
  if (extract_u64(text, "recovery_interval_seconds", u))
    next.recovery_interval_seconds = u;
  if (extract_u64(text, "node_timeout_ms", u)) {
    if (u == 0)
      return reject(err, "node_timeout_ms must be positive");
    next.node_timeout_ms = u;
  }
  if (extract_u64(text, "worker_threads", u)) {
    if (u == 0 || u > 1024)
      return reject(err, "worker_threads out of range");
    next.worker_threads = static_cast<std::size_t>(u);
  }
  if (extract_u64(text, "max_key_len", u)) {
    if (u == 0)
      return reject(err, "max_key_len must be positive");
    next.max_key_len = static_cast<std::size_t>(u);
  }
  return true;
}

} // namespace

bool load_local_config(const std::string &text, LocalConfig &cfg,
                       std::string *err) {
  if (!looks_like_object(text))
    return reject(err, "invalid schema");
  LocalConfig next = cfg;
  try {
    if (!apply_local(text, next, err))
      return false;
  } catch (const std::out_of_range &e) {
    return reject(err, e.what());
  }
  cfg = std::move(next);
  return true;
}

bool load_distributed_config(const std::string &text, DistributedConfig &cfg,
                             std::string *err) {
  if (!looks_like_object(text))
    return reject(err, "invalid schema");
  DistributedConfig next = cfg;
  try {
    if (!apply_distributed(text, next, err))
      return false;
  } catch (const std::out_of_range &e) {
    return reject(err, e.what());
  }
  cfg = std::move(next);
  return true;
}

bool load_config_file(const std::string &path, LocalConfig &local,
                      DistributedConfig &distributed, std::string *err) {
  std::ifstream in(path);
  if (!in.good())
    return reject(err, "cannot open config: " + path);
  std::stringstream ss;
  ss << in.rdbuf();
  const std::string text = ss.str();

  std::string local_text = text;
  std::string distributed_text = text;
  const bool has_local = extract_object(text, "local", local_text);
  const bool has_distributed =
      extract_object(text, "distributed", distributed_text);
  if (has_local || has_distributed) {
    // A missing section parses as an empty object.
    if (!has_local)
      local_text = "{}";
    if (!has_distributed)
      distributed_text = "{}";
  }

  LocalConfig next_local = local;
  DistributedConfig next_distributed = distributed;
  std::string e;
  if (!load_local_config(local_text, next_local, &e))
    return reject(err, path + ": " + e);
  if (!load_distributed_config(distributed_text, next_distributed, &e))
    return reject(err, path + ": " + e);
  local = std::move(next_local);
  distributed = std::move(next_distributed);
  return true;
}

} // namespace quorum_cache
