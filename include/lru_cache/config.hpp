#pragma once

#include "lru_cache/types.hpp"

#include <cstddef>
#include <string>

namespace lru_cache {

// Accepts a plain byte count or one suffixed with B, KiB, MiB or GiB.
bool parse_size(const std::string &text, std::size_t *out);

// Reads `key=value` lines (path, max_items, max_bytes, close_on_exit) over the
// fields of `*cfg`. On any error `*cfg` is left untouched.
bool load_config(const std::string &path, CacheConfig *cfg,
                 std::string *err = nullptr);

} // namespace lru_cache
