#pragma once

#include "lru_cache/file_io.hpp"
#include "lru_cache/lifecycle.hpp"
#include "lru_cache/logging.hpp"
#include "lru_cache/lru_cache.hpp"
#include "lru_cache/record_format.hpp"
#include "lru_cache/types.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace lru_cache {

// An LruCache backed by a file. The file is read at construction and written
// by save()/close(), which trim the cache to its limits first. With
// close_on_exit and a backing path the cache is also closed at process exit
// if it is still alive then; use CloseGuard to close it at the end of a scope.
template <typename Key, typename Value, typename Hash = KeyHash<Key>,
          typename KeyEqual = std::equal_to<Key>>
class PersistentLruCache : public LruCache<Key, Value, Hash, KeyEqual>,
                           public Closeable {
  using Base = LruCache<Key, Value, Hash, KeyEqual>;

public:
  // Throws FileError if an existing backing file cannot be read and
  // DecodeError if its contents are corrupt.
  explicit PersistentLruCache(CacheConfig cfg)
      : Base(cfg.max_items, cfg.max_bytes), path_(std::move(cfg.path)) {
    load();
    if (cfg.close_on_exit && path_.has_value()) {
      ExitRegistry::instance().add(this);
      registered_ = true;
    }
  }

  ~PersistentLruCache() override {
    if (registered_)
      ExitRegistry::instance().remove(this);
  }

  PersistentLruCache(const PersistentLruCache &) = delete;
  PersistentLruCache &operator=(const PersistentLruCache &) = delete;
  PersistentLruCache(PersistentLruCache &&) = delete;
  PersistentLruCache &operator=(PersistentLruCache &&) = delete;

  static std::unique_ptr<PersistentLruCache> open(CacheConfig cfg) {
    return std::make_unique<PersistentLruCache>(std::move(cfg));
  }

  static std::unique_ptr<PersistentLruCache> open(const std::string &path) {
    CacheConfig cfg;
    cfg.path = path;
    return open(std::move(cfg));
  }

  // Without a backing path nothing is written and false is returned. A clean
  // cache is not rewritten.
  bool save(std::string *err = nullptr) {
    if (!path_.has_value()) {
      logger()->error("cannot save cache without a backing path");
      if (err)
        *err = "no backing path";
      return false;
    }
    if (!this->dirty()) {
      logger()->info("no changes to save");
      return true;
    }
    this->trim();
    logger()->debug("saving cache: {}", *path_);
    if (!write_file_atomic(*path_, this->encode(), err))
      return false;
    this->mark_clean();
    return true;
  }

  bool close(std::string *err = nullptr) override { return save(err); }

  std::string describe() const override {
    return path_.has_value() ? *path_ : std::string("<memory>");
  }

  const std::optional<std::string> &path() const { return path_; }
  bool registered_for_exit() const { return registered_; }

private:
  void load() {
    if (!path_.has_value())
      return;
    std::error_code ec;
    const bool exists = std::filesystem::exists(*path_, ec);
    if (ec)
      throw FileError("cannot stat " + *path_ + ": " + ec.message());
    if (!exists) {
      logger()->debug("persisted cache not found: {}", *path_);
      return;
    }
    std::vector<std::uint8_t> data;
    std::string err;
    if (!read_file(*path_, &data, &err))
      throw FileError(err);
    try {
      this->restore(decode_records(data));
    } catch (const DecodeError &e) {
      throw DecodeError(*path_ + ": " + e.what());
    }
    this->mark_clean();
    logger()->debug("loaded {} items from {}", this->size(), *path_);
  }

  std::optional<std::string> path_;
  bool registered_{false};
};

} // namespace lru_cache
