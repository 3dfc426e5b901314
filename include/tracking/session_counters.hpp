#pragma once

#include <cstdint>
#include <mutex>

#include "tracking/presence_tracker.hpp"

namespace fw {

struct CounterSnapshot {
  std::uint64_t total_unique{0};
  std::uint64_t total_visits{0};
  int current_active{0};
  int current_frame_count{0};
};

// Result of one consuming change check
struct CounterChange {
  bool uniques_increased{false};
  bool visits_increased{false};
  CounterSnapshot current{};

  bool any() const { return uniques_increased || visits_increased; }
};

/*
    Session-wide totals fed from the tracker after every frame.

    Totals never go down: an observation with a lower total than already stored keeps the stored
    value. check_changes() is edge-triggered, it compares against the snapshot taken by the previous
    check and then replaces it, so asking twice without a new observation reports nothing the
    second time.

    Reads are locked so a telemetry or display thread can take snapshots while the frame thread
    writes.
*/
class SessionCounters {
public:
  SessionCounters() = default;

  SessionCounters(const SessionCounters&) = delete;
  SessionCounters& operator=(const SessionCounters&) = delete;

  void observe(const TrackerStats& stats);

  CounterSnapshot snapshot() const;

  CounterChange check_changes();

  bool has_changed_since_last_check() { return check_changes().any(); }

private:
  mutable std::mutex mu_;
  CounterSnapshot current_{};
  CounterSnapshot last_checked_{};
};

} // namespace fw
