#include "lru_cache/lifecycle.hpp"

#include <algorithm>
#include <cstdlib>

namespace lru_cache {
namespace {

void flush_at_exit() { ExitRegistry::instance().flush(); }

} // namespace

ExitRegistry &ExitRegistry::instance() {
  // Never destroyed, so caches with static storage can still remove
  // themselves during static destruction. The logger is created first so it
  // outlives the exit hook.
  static ExitRegistry *registry = [] {
    logger();
    auto *r = new ExitRegistry();
    if (std::atexit(flush_at_exit) != 0)
      logger()->error("failed to install exit flush hook");
    return r;
  }();
  return *registry;
}

void ExitRegistry::add(Closeable *cache) {
  std::lock_guard<std::mutex> lock(mu_);
  if (std::find(caches_.begin(), caches_.end(), cache) == caches_.end())
    caches_.push_back(cache);
}

void ExitRegistry::remove(Closeable *cache) {
  std::lock_guard<std::mutex> lock(mu_);
  caches_.erase(std::remove(caches_.begin(), caches_.end(), cache),
                caches_.end());
}

bool ExitRegistry::contains(const Closeable *cache) const {
  std::lock_guard<std::mutex> lock(mu_);
  return std::find(caches_.begin(), caches_.end(), cache) != caches_.end();
}

std::size_t ExitRegistry::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return caches_.size();
}

std::size_t ExitRegistry::flush() {
  std::vector<Closeable *> snapshot;
  {
    std::lock_guard<std::mutex> lock(mu_);
    snapshot = caches_;
  }
  std::size_t closed = 0;
  for (auto *cache : snapshot) {
    std::string err;
    try {
      if (cache->close(&err))
        ++closed;
      else
        logger()->error("exit flush of {} failed: {}", cache->describe(), err);
    } catch (const std::exception &e) {
      logger()->error("exit flush of {} failed: {}", cache->describe(),
                      e.what());
    }
  }
  return closed;
}

} // namespace lru_cache
