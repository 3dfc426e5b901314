#pragma once

#include <chrono>
#include <ctime>
#include <string>

#include "core/detections.hpp"

/*
    Wall-clock helpers. Frame timestamps are plain seconds (WallSeconds) so the tracker can be
    driven by replayed or synthetic clocks; these turn them into the local-time strings used in
    session folder names and log rows.
*/

namespace fw {

inline WallSeconds NowSeconds() {
  using namespace std::chrono;
  return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

// strftime over local time, e.g. FormatLocalTime(ts, "%H:%M:%S")
inline std::string FormatLocalTime(WallSeconds ts, const char* fmt) {
  const std::time_t t = static_cast<std::time_t>(ts);
  std::tm tm{};
  localtime_r(&t, &tm);

  char buf[64];
  const std::size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
  return std::string(buf, n);
}

// Replaces every "{key}" in pattern with value. Used for the configurable file name patterns
inline std::string ExpandPattern(std::string pattern, const std::string& key, const std::string& value) {
  const std::string token = "{" + key + "}";
  std::size_t pos = 0;
  while ((pos = pattern.find(token, pos)) != std::string::npos) {
    pattern.replace(pos, token.size(), value);
    pos += value.size();
  }
  return pattern;
}

} // namespace fw
