#pragma once

#include "lru_cache/logging.hpp"

#include <cstddef>
#include <exception>
#include <mutex>
#include <string>
#include <vector>

namespace lru_cache {

class Closeable {
public:
  virtual ~Closeable() = default;
  virtual bool close(std::string *err) = 0;
  virtual std::string describe() const = 0;
};

// Process-wide set of caches to close at exit. Empty at startup; the first
// call to instance() installs an std::atexit hook that runs flush(). Entries
// are not owned: a cache removes itself when destroyed, so only caches still
// alive at exit are closed.
class ExitRegistry {
public:
  static ExitRegistry &instance();

  void add(Closeable *cache);
  void remove(Closeable *cache);
  bool contains(const Closeable *cache) const;
  std::size_t size() const;

  // Closes every registered cache, logging failures. Returns how many closed
  // successfully.
  std::size_t flush();

private:
  ExitRegistry() = default;

  mutable std::mutex mu_;
  std::vector<Closeable *> caches_;
};

// Closes the cache when the guard leaves scope, whichever way it leaves.
template <typename Cache> class CloseGuard {
public:
  explicit CloseGuard(Cache &cache) : cache_(cache) {}
  CloseGuard(const CloseGuard &) = delete;
  CloseGuard &operator=(const CloseGuard &) = delete;

  ~CloseGuard() {
    std::string err;
    try {
      if (!cache_.close(&err))
        logger()->error("close failed: {}", err);
    } catch (const std::exception &e) {
      logger()->error("close failed: {}", e.what());
    }
  }

  Cache &operator*() const { return cache_; }
  Cache *operator->() const { return &cache_; }

private:
  Cache &cache_;
};

} // namespace lru_cache
