#pragma once

#include "lru_cache/codec.hpp"
#include "lru_cache/lru_cache.hpp"

#include <functional>
#include <string>
#include <type_traits>
#include <utility>

namespace lru_cache {

// Wraps `fn` so each distinct argument tuple is computed once and then served
// from `cache`. The key is the encoded name followed by the encoded arguments,
// so one cache can hold results of several functions.
template <typename Result, typename... Args> class Memoized {
public:
  using Cache = LruCache<std::string, Result>;

  Memoized(Cache &cache, std::string name, std::function<Result(Args...)> fn)
      : cache_(cache), name_(std::move(name)), fn_(std::move(fn)) {}

  Result operator()(const Args &...args) {
    return cache_.get_or_load(key_for(args...), [&] { return fn_(args...); });
  }

  std::string key_for(const Args &...args) const {
    ByteWriter w;
    Codec<std::string>::encode(w, name_);
    (Codec<std::decay_t<Args>>::encode(w, args), ...);
    const auto &bytes = w.bytes();
    return std::string(bytes.begin(), bytes.end());
  }

  const std::string &name() const { return name_; }

private:
  Cache &cache_;
  std::string name_;
  std::function<Result(Args...)> fn_;
};

template <typename Result, typename... Args>
Memoized<Result, Args...> memoize(LruCache<std::string, Result> &cache,
                                  std::string name, Result (*fn)(Args...)) {
  return Memoized<Result, Args...>(cache, std::move(name), fn);
}

template <typename Result, typename... Args>
Memoized<Result, Args...> memoize(LruCache<std::string, Result> &cache,
                                  std::string name,
                                  std::function<Result(Args...)> fn) {
  return Memoized<Result, Args...>(cache, std::move(name), std::move(fn));
}

} // namespace lru_cache
