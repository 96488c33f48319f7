#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace quorum_cache {

// Shared "quorum_cache" logger. Reuses a logger the application registered
// under that name, otherwise creates a colored stdout logger.
std::shared_ptr<spdlog::logger> logger();

// trace, debug, info, warn, error, off. Returns false for an unknown name.
bool set_log_level(const std::string &level);

} // namespace quorum_cache
