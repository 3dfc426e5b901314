#pragma once

#include <cstdint>
#include <optional>

#include "core/config.hpp"
#include "core/detections.hpp"

/*
    VisitDetector turns the per-frame detection count into discrete feeder visits.

    The detector output flickers: a bird sitting still can drop out for a frame or two. A return
    after an absence only counts as a new visit when the absence lasted at least
    min_time_between_visits_seconds; shorter gaps are treated as the same visit.
    A rising count while birds are already present (1 -> 2) counts as one more visit for every
    step up, so 1 -> 2 -> 3 adds two.
*/

namespace fw {

enum class VisitTransition {
  None,          // steady count, or empty and staying empty
  FirstVisit,    // first non-zero count of the session
  NewVisit,      // return after a long enough absence
  Flicker,       // return too soon, same visit continues
  GroupGrowth,   // more birds than the previous frame
  Departure      // count dropped to zero, absence time recorded
};

inline bool StartsVisit(VisitTransition t) {
  return t == VisitTransition::FirstVisit || t == VisitTransition::NewVisit || t == VisitTransition::GroupGrowth;
}

class VisitDetector {
public:
  explicit VisitDetector(TrackingConfig cfg);

  // Feed one frame. Returns true when a visit started on this frame
  bool update(int frame_count, WallSeconds now);

  std::uint64_t total_visits() const { return total_visits_; }
  int last_frame_count() const { return last_frame_count_; }
  std::optional<WallSeconds> last_absence_time() const { return last_absence_time_; }

  // What the most recent update() decided, for console reporting
  VisitTransition last_transition() const { return last_transition_; }

  // Seconds between the recorded absence and the frame that ended it. 0 when not applicable
  double last_gap_seconds() const { return last_gap_seconds_; }

private:
  TrackingConfig cfg_;

  int last_frame_count_{0};
  std::optional<WallSeconds> last_absence_time_;
  std::uint64_t total_visits_{0};

  VisitTransition last_transition_{VisitTransition::None};
  double last_gap_seconds_{0.0};
};

} // namespace fw
