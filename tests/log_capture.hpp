#pragma once

#include "lru_cache/logging.hpp"

#include <algorithm>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/ostream_sink.h>

// Routes the library logger into a string at debug level for the lifetime of
// the object.
class LogCapture {
public:
  LogCapture()
      : sink_(std::make_shared<spdlog::sinks::ostream_sink_mt>(out_)),
        old_level_(lru_cache::logger()->level()) {
    sink_->set_pattern("%l %v");
    lru_cache::logger()->sinks().push_back(sink_);
    lru_cache::logger()->set_level(spdlog::level::debug);
  }

  ~LogCapture() {
    auto &sinks = lru_cache::logger()->sinks();
    sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
    lru_cache::logger()->set_level(old_level_);
  }

  LogCapture(const LogCapture &) = delete;
  LogCapture &operator=(const LogCapture &) = delete;

  std::string text() const { return out_.str(); }
  bool contains(const std::string &needle) const {
    return out_.str().find(needle) != std::string::npos;
  }

private:
  std::ostringstream out_;
  std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
  spdlog::level::level_enum old_level_;
};
