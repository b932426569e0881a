#include "lru_cache/lru_cache.hpp"

#include <catch2/catch.hpp>

#include <random>
#include <string>
#include <vector>

using namespace lru_cache;

TEST_CASE("random churn keeps recency and size invariants", "[chaos]") {
  LruCache<std::string, std::vector<std::uint8_t>> c(150, 16 * 1024);
  std::mt19937_64 rng(42);
  for (int i = 0; i < 20000; ++i) {
    const auto key = std::string("k") + std::to_string(rng() % 300);
    const auto op = rng() % 5;
    if (op == 0 || op == 1) {
      std::vector<std::uint8_t> v(static_cast<std::size_t>(rng() % 256 + 1),
                                  'a');
      c.set(key, v);
      REQUIRE(c.keys().back() == key);
    } else if (op == 2) {
      if (c.get(key).has_value())
        REQUIRE(c.keys().back() == key);
    } else if (op == 3) {
      const bool present = c.contains(key);
      REQUIRE(c.del(key) == present);
      REQUIRE_FALSE(c.contains(key));
    } else {
      c.trim();
      REQUIRE((c.empty() || c.bytesize() <= c.max_bytes()));
      REQUIRE(c.size() <= c.max_items());
      REQUIRE(c.trim() == 0);
    }
    if (i % 1000 == 0)
      REQUIRE(c.bytesize() == c.encode().size());
  }
}
