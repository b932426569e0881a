#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace lru_cache {

// The library's "lru_cache" logger. Created on first use with a stderr sink;
// levels follow SPDLOG_LEVEL (e.g. SPDLOG_LEVEL=lru_cache=debug).
std::shared_ptr<spdlog::logger> logger();

} // namespace lru_cache
