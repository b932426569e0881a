#pragma once

#include "lru_cache/codec.hpp"
#include "lru_cache/logging.hpp"
#include "lru_cache/record_format.hpp"
#include "lru_cache/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <list>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lru_cache {

// Dict-like store ordered by recency: iteration runs from the least to the
// most recently used entry, and every read hit or write moves its key to the
// back. The footprint reported by bytesize() is the exact size of encode(),
// which is what a persistent cache writes to disk.
//
// Not thread-safe.
template <typename Key, typename Value, typename Hash = KeyHash<Key>,
          typename KeyEqual = std::equal_to<Key>>
class LruCache {
public:
  using key_type = Key;
  using mapped_type = Value;
  using value_type = std::pair<const Key, Value>;
  using const_iterator = typename std::list<value_type>::const_iterator;

  explicit LruCache(std::size_t max_items = kDefaultMaxItems,
                    std::size_t max_bytes = kDefaultMaxBytes)
      : max_items_(max_items), max_bytes_(max_bytes) {}
  virtual ~LruCache() = default;

  LruCache(const LruCache &) = delete;
  LruCache &operator=(const LruCache &) = delete;
  LruCache(LruCache &&) = default;
  LruCache &operator=(LruCache &&) = default;

  // Presence test only: does not promote and does not mark the cache dirty.
  bool contains(const Key &key) const { return index_.find(key) != index_.end(); }

  std::optional<Value> get(const Key &key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
      note_miss(key);
      return std::nullopt;
    }
    touch(it);
    return it->second.pos->second;
  }

  Value get_or(const Key &key, Value fallback) {
    auto v = get(key);
    if (v.has_value())
      return std::move(*v);
    return fallback;
  }

  void set(const Key &key, Value value) {
    log_key("set", key);
    ++stats_.sets;
    store(key, std::move(value));
  }

  // Fails with "key not found" when `key` is absent; the cache is unchanged.
  bool del(const Key &key, std::string *err = nullptr) {
    auto it = index_.find(key);
    if (it == index_.end()) {
      if (err)
        *err = "key not found";
      return false;
    }
    log_key("del", key);
    ++stats_.deletes;
    erase_slot(it);
    dirty_ = true;
    return true;
  }

  // On a miss `load` runs exactly once and its result is stored. Anything
  // `load` throws propagates and nothing is stored.
  template <typename Loader> Value get_or_load(const Key &key, Loader &&load) {
    auto it = index_.find(key);
    if (it != index_.end()) {
      touch(it);
      return it->second.pos->second;
    }
    note_miss(key);
    ++stats_.loader_calls;
    Value value = std::forward<Loader>(load)();
    store(key, value);
    return value;
  }

  void clear() {
    logger()->debug("clear");
    order_.clear();
    index_.clear();
    encoded_bytes_ = 0;
    dirty_ = true;
  }

  // Evicts least recently used entries until both limits hold or the cache
  // is empty. Returns the number of entries evicted.
  std::size_t trim() {
    std::size_t count = 0;
    while (!order_.empty() &&
           (bytesize() > max_bytes_ || order_.size() > max_items_)) {
      erase_slot(index_.find(order_.front().first));
      ++count;
    }
    if (count > 0) {
      dirty_ = true;
      stats_.evictions += count;
      logger()->debug("trimmed {} items", count);
    }
    return count;
  }

  std::size_t bytesize() const { return kFileHeaderSize + encoded_bytes_; }

  std::vector<std::uint8_t> encode() const {
    std::vector<std::uint8_t> out;
    out.reserve(bytesize());
    append_file_header(&out, order_.size());
    for (const auto &[k, v] : order_)
      append_record(&out, encode_value(k), encode_value(v));
    return out;
  }

  const_iterator begin() const { return order_.begin(); }
  const_iterator end() const { return order_.end(); }

  std::vector<Key> keys() const {
    std::vector<Key> out;
    out.reserve(order_.size());
    for (const auto &kv : order_)
      out.push_back(kv.first);
    return out;
  }

  std::vector<Value> values() const {
    std::vector<Value> out;
    out.reserve(order_.size());
    for (const auto &kv : order_)
      out.push_back(kv.second);
    return out;
  }

  std::size_t size() const { return order_.size(); }
  bool empty() const { return order_.empty(); }
  std::size_t max_items() const { return max_items_; }
  std::size_t max_bytes() const { return max_bytes_; }
  bool dirty() const { return dirty_; }
  const CacheStats &stats() const { return stats_; }

  std::string info() const {
    std::ostringstream os;
    os << "items:" << order_.size() << "\n";
    os << "bytes:" << bytesize() << "\n";
    os << "max_items:" << max_items_ << "\n";
    os << "max_bytes:" << max_bytes_ << "\n";
    os << "dirty:" << (dirty_ ? 1 : 0) << "\n";
    os << "hits:" << stats_.hits << "\n";
    os << "misses:" << stats_.misses << "\n";
    os << "sets:" << stats_.sets << "\n";
    os << "deletes:" << stats_.deletes << "\n";
    os << "evictions:" << stats_.evictions << "\n";
    os << "loader_calls:" << stats_.loader_calls << "\n";
    return os.str();
  }

protected:
  // Appends entries read back from disk in their stored order. Duplicate keys
  // mean the file was not written by save().
  void restore(std::vector<RawRecord> records) {
    for (auto &r : records) {
      Key key = decode_value<Key>(r.key.data(), r.key.size());
      Value value = decode_value<Value>(r.value.data(), r.value.size());
      if (contains(key))
        throw DecodeError("duplicate key " + describe_key(key));
      append_new(key, std::move(value), record_size(r.key.size(), r.value.size()));
    }
  }

  void mark_clean() { dirty_ = false; }

private:
  using List = std::list<value_type>;

  struct Slot {
    typename List::iterator pos;
    std::size_t record_bytes;
  };

  using Index = std::unordered_map<Key, Slot, Hash, KeyEqual>;

  void log_key(const char *event, const Key &key) const {
    auto log = logger();
    if (log->should_log(spdlog::level::debug))
      log->debug("{} key={}", event, describe_key(key));
  }

  void note_miss(const Key &key) {
    log_key("miss", key);
    ++stats_.misses;
  }

  void touch(typename Index::iterator it) {
    log_key("hit", it->first);
    ++stats_.hits;
    order_.splice(order_.end(), order_, it->second.pos);
    dirty_ = true;
  }

  void store(const Key &key, Value value) {
    const std::size_t bytes =
        record_size(encode_value(key).size(), encode_value(value).size());
    auto it = index_.find(key);
    if (it == index_.end()) {
      append_new(key, std::move(value), bytes);
    } else {
      it->second.pos->second = std::move(value);
      order_.splice(order_.end(), order_, it->second.pos);
      encoded_bytes_ -= it->second.record_bytes;
      it->second.record_bytes = bytes;
      encoded_bytes_ += bytes;
    }
    dirty_ = true;
  }

  void append_new(const Key &key, Value value, std::size_t bytes) {
    order_.emplace_back(key, std::move(value));
    try {
      index_.emplace(key, Slot{std::prev(order_.end()), bytes});
    } catch (...) {
      order_.pop_back();
      throw;
    }
    encoded_bytes_ += bytes;
  }

  void erase_slot(typename Index::iterator it) {
    encoded_bytes_ -= it->second.record_bytes;
    order_.erase(it->second.pos);
    index_.erase(it);
  }

  std::size_t max_items_;
  std::size_t max_bytes_;
  List order_;
  Index index_;
  std::size_t encoded_bytes_{0};
  bool dirty_{false};
  CacheStats stats_;
};

} // namespace lru_cache
