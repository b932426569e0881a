#include "lru_cache/memoize.hpp"
#include "lru_cache/persistent_cache.hpp"

#include "log_capture.hpp"
#include "temp_dir.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

using namespace lru_cache;

namespace {
int g_forecast_calls = 0;

std::string forecast(const std::string &city, int day) {
  ++g_forecast_calls;
  return city + "@" + std::to_string(day);
}

int g_square_calls = 0;

std::string square(int x) {
  ++g_square_calls;
  if (x < 0)
    throw std::invalid_argument("negative");
  return std::to_string(x * x);
}
} // namespace

TEST_CASE("memoized functions run once per argument tuple", "[memoize]") {
  g_forecast_calls = 0;
  LruCache<std::string, std::string> cache;
  auto cached = memoize(cache, "forecast", &forecast);

  CHECK(cached("oslo", 1) == "oslo@1");
  CHECK(cached("oslo", 1) == "oslo@1");
  CHECK(cached("oslo", 2) == "oslo@2");
  CHECK(cached("bergen", 1) == "bergen@1");
  CHECK(g_forecast_calls == 3);
  CHECK(cache.size() == 3);
}

TEST_CASE("memoized names keep functions apart in one cache", "[memoize]") {
  LruCache<std::string, std::string> cache;
  std::function<std::string(int)> twice = [](int x) {
    return std::to_string(2 * x);
  };
  auto a = memoize(cache, "square", &square);
  auto b = memoize(cache, "twice", twice);
  CHECK(a.key_for(3) != b.key_for(3));
  CHECK(a(3) == "9");
  CHECK(b(3) == "6");
  CHECK(cache.size() == 2);
}

TEST_CASE("memoized failures are not cached", "[memoize]") {
  g_square_calls = 0;
  LruCache<std::string, std::string> cache;
  auto cached = memoize(cache, "square", &square);
  CHECK_THROWS_AS(cached(-1), std::invalid_argument);
  CHECK_THROWS_AS(cached(-1), std::invalid_argument);
  CHECK(g_square_calls == 2);
  CHECK(cache.empty());
}

TEST_CASE("memoized results persist across cache instances", "[memoize]") {
  g_forecast_calls = 0;
  TempDir dir;
  CacheConfig cfg;
  cfg.path = dir.file("memo.bin");
  cfg.close_on_exit = false;
  {
    PersistentLruCache<std::string, std::string> cache(cfg);
    auto cached = memoize(cache, "forecast", &forecast);
    CHECK(cached("oslo", 1) == "oslo@1");
    REQUIRE(cache.save());
  }
  PersistentLruCache<std::string, std::string> cache(cfg);
  auto cached = memoize(cache, "forecast", &forecast);
  CHECK(cached("oslo", 1) == "oslo@1");
  CHECK(g_forecast_calls == 1);
}

TEST_CASE("memoized keys are logged as digests", "[memoize][log]") {
  LruCache<std::string, std::string> cache;
  auto cached = memoize(cache, "forecast", &forecast);
  const auto key = cached.key_for("oslo", 1);
  const auto shown = describe_key(key);
  CHECK(shown[0] == '#');

  LogCapture log;
  cached("oslo", 1);
  cached("oslo", 1);
  CHECK(log.contains("miss key=" + shown));
  CHECK(log.contains("hit key=" + shown));
  const auto text = log.text();
  CHECK(std::none_of(text.begin(), text.end(), [](char ch) {
    return ch != '\n' && (ch < 0x20 || ch == 0x7f);
  }));
}
