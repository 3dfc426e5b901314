#pragma once

#include <cstdint>

#include "core/config.hpp"
#include "tracking/visit_detector.hpp"

namespace fw {

/*
    EmissionPolicy answers "should this be written/printed" from the console mode alone.
    The tracker always computes full state; only what leaves the process depends on the mode.

      all           every frame with birds gets a record, every transition is printed,
                    plus a stats line every N frames
      changes_only  records only on frames that start a visit, visit starts and counter changes printed
      minimal       records only on frames that start a visit, nothing printed per frame
*/
class EmissionPolicy {
public:
  explicit EmissionPolicy(ConsoleOutputMode mode, int stats_every_n_frames = 30)
      : mode_(mode), stats_every_n_frames_(stats_every_n_frames) {}

  ConsoleOutputMode mode() const { return mode_; }

  bool should_write_record(int frame_count, bool visit_started) const {
    if (frame_count <= 0) return false;
    return visit_started || mode_ == ConsoleOutputMode::All;
  }

  bool should_print_transition(VisitTransition t) const {
    if (t == VisitTransition::None) return false;
    if (mode_ == ConsoleOutputMode::All) return true;
    if (mode_ == ConsoleOutputMode::ChangesOnly) return StartsVisit(t);
    return false;
  }

  bool should_print_stats(std::uint64_t frame_index) const {
    return mode_ == ConsoleOutputMode::All && stats_every_n_frames_ > 0 &&
           frame_index % static_cast<std::uint64_t>(stats_every_n_frames_) == 0;
  }

  bool should_print_change() const { return mode_ == ConsoleOutputMode::ChangesOnly; }

private:
  ConsoleOutputMode mode_;
  int stats_every_n_frames_;
};

} // namespace fw
