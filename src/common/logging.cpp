#include "quorum_cache/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace quorum_cache {
namespace {
constexpr const char *kLoggerName = "quorum_cache";
std::mutex logger_mu;
} // namespace

std::shared_ptr<spdlog::logger> logger() {
  std::lock_guard<std::mutex> lock(logger_mu);
  auto log = spdlog::get(kLoggerName);
  if (!log) {
    log = spdlog::stdout_color_mt(kLoggerName);
    log->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [%t] %v");
    log->set_level(spdlog::level::info);
  }
  return log;
}

bool set_log_level(const std::string &level) {
  const auto parsed = spdlog::level::from_str(level);
  if (parsed == spdlog::level::off && level != "off")
    return false;
  logger()->set_level(parsed);
  return true;
}

} // namespace quorum_cache
