#include "lru_cache/config.hpp"

#include <cctype>
#include <cstdint>
#include <exception>
#include <fstream>
#include <limits>
#include <string>

namespace lru_cache {
namespace {

std::string trim_ws(const std::string &s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
    ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
    --e;
  return s.substr(b, e - b);
}

bool parse_u64(const std::string &s, std::uint64_t &out) {
  if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0])))
    return false;
  try {
    std::size_t idx = 0;
    out = std::stoull(s, &idx);
    return idx == s.size();
  } catch (const std::exception &) {
    return false;
  }
}

bool parse_bool(const std::string &s, bool &out) {
  if (s == "true" || s == "1") {
    out = true;
    return true;
  }
  if (s == "false" || s == "0") {
    out = false;
    return true;
  }
  return false;
}

} // namespace

bool parse_size(const std::string &text, std::size_t *out) {
  const std::string s = trim_ws(text);
  std::size_t digits = 0;
  while (digits < s.size() && std::isdigit(static_cast<unsigned char>(s[digits])))
    ++digits;
  std::uint64_t n = 0;
  if (!parse_u64(s.substr(0, digits), n))
    return false;
  const std::string unit = trim_ws(s.substr(digits));
  std::uint64_t mult = 1;
  if (unit.empty() || unit == "B")
    mult = 1;
  else if (unit == "KiB")
    mult = 1024ULL;
  else if (unit == "MiB")
    mult = 1024ULL * 1024;
  else if (unit == "GiB")
    mult = 1024ULL * 1024 * 1024;
  else
    return false;
  if (n > std::numeric_limits<std::size_t>::max() / mult)
    return false;
  *out = static_cast<std::size_t>(n * mult);
  return true;
}

bool load_config(const std::string &path, CacheConfig *cfg, std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "cannot open config " + path;
    return false;
  }
  auto fail = [&](int line_no, const std::string &what) {
    if (err)
      *err = path + ":" + std::to_string(line_no) + ": " + what;
    return false;
  };

  CacheConfig next = *cfg;
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const std::string text = trim_ws(line);
    if (text.empty() || text[0] == '#')
      continue;
    const auto eq = text.find('=');
    if (eq == std::string::npos)
      return fail(line_no, "expected key=value");
    const std::string key = trim_ws(text.substr(0, eq));
    const std::string value = trim_ws(text.substr(eq + 1));
    if (key == "path") {
      if (value.empty())
        next.path.reset();
      else
        next.path = value;
    } else if (key == "max_items") {
      std::uint64_t n = 0;
      if (!parse_u64(value, n) || n == 0 ||
          n > std::numeric_limits<std::size_t>::max())
        return fail(line_no, "invalid max_items '" + value + "'");
      next.max_items = static_cast<std::size_t>(n);
    } else if (key == "max_bytes") {
      std::size_t n = 0;
      if (!parse_size(value, &n))
        return fail(line_no, "invalid max_bytes '" + value + "'");
      next.max_bytes = n;
    } else if (key == "close_on_exit") {
      if (!parse_bool(value, next.close_on_exit))
        return fail(line_no, "invalid close_on_exit '" + value + "'");
    } else {
      return fail(line_no, "unknown key '" + key + "'");
    }
  }
  *cfg = next;
  return true;
}

} // namespace lru_cache
