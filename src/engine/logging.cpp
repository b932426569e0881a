#include "lru_cache/logging.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace lru_cache {

std::shared_ptr<spdlog::logger> logger() {
  static const std::shared_ptr<spdlog::logger> instance = [] {
    if (auto existing = spdlog::get("lru_cache"))
      return existing;
    spdlog::cfg::load_env_levels();
    return spdlog::stderr_color_mt("lru_cache");
  }();
  return instance;
}

} // namespace lru_cache
