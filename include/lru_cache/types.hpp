#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace lru_cache {

constexpr std::size_t kDefaultMaxItems = std::numeric_limits<std::size_t>::max();
constexpr std::size_t kDefaultMaxBytes = 1024ULL * 1024 * 1024;

struct CacheConfig {
  // Absent means the cache lives in memory only.
  std::optional<std::string> path;
  std::size_t max_items{kDefaultMaxItems};
  std::size_t max_bytes{kDefaultMaxBytes};
  bool close_on_exit{true};
};

struct CacheStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t sets{0};
  std::uint64_t deletes{0};
  std::uint64_t evictions{0};
  std::uint64_t loader_calls{0};
};

class CacheError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Raised when persisted bytes cannot be turned back into entries.
class DecodeError : public CacheError {
public:
  using CacheError::CacheError;
};

// Raised when an existing backing file cannot be read.
class FileError : public CacheError {
public:
  using CacheError::CacheError;
};

} // namespace lru_cache
