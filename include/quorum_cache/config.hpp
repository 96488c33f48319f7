#pragma once

#include "quorum_cache/distributed.hpp"
#include "quorum_cache/local_cache.hpp"

#include <string>

namespace quorum_cache {

// JSON-ish loaders. Absent keys keep the current value; on error the output
// is left untouched and false is returned.
bool load_local_config(const std::string &text, LocalConfig &cfg,
                       std::string *err = nullptr);
bool load_distributed_config(const std::string &text, DistributedConfig &cfg,
                             std::string *err = nullptr);

// Reads a file holding a "local" and/or "distributed" object. A file without
// either section is parsed as a flat document for both.
bool load_config_file(const std::string &path, LocalConfig &local,
                      DistributedConfig &distributed,
                      std::string *err = nullptr);

} // namespace quorum_cache
