#include "tracking/session_counters.hpp"

#include <algorithm>

namespace fw {

void SessionCounters::observe(const TrackerStats& stats) {
  std::lock_guard<std::mutex> lock(mu_);
  current_.total_unique = std::max(current_.total_unique, stats.total_unique);
  current_.total_visits = std::max(current_.total_visits, stats.total_visits);
  current_.current_active = stats.current_active;
  current_.current_frame_count = stats.current_on_frame;
}

CounterSnapshot SessionCounters::snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return current_;
}

CounterChange SessionCounters::check_changes() {
  std::lock_guard<std::mutex> lock(mu_);

  CounterChange c;
  c.uniques_increased = current_.total_unique > last_checked_.total_unique;
  c.visits_increased = current_.total_visits > last_checked_.total_visits;
  c.current = current_;

  last_checked_ = current_;
  return c;
}

} // namespace fw
