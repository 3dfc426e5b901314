#include "tracking/visit_detector.hpp"

#include <utility>

namespace fw {

VisitDetector::VisitDetector(TrackingConfig cfg) : cfg_(std::move(cfg)) {}

bool VisitDetector::update(int frame_count, WallSeconds now) {
  last_transition_ = VisitTransition::None;
  last_gap_seconds_ = 0.0;

  if (!cfg_.enable_visit_counter) return false;

  if (frame_count < 0) frame_count = 0;

  if (frame_count > 0) {
    if (last_frame_count_ == 0) {
      if (!last_absence_time_) {
        last_transition_ = VisitTransition::FirstVisit;
      } else {
        last_gap_seconds_ = now - *last_absence_time_;
        last_transition_ = (last_gap_seconds_ >= cfg_.min_time_between_visits_seconds)
                               ? VisitTransition::NewVisit
                               : VisitTransition::Flicker;
      }
    } else if (frame_count > last_frame_count_ && frame_count > 1) {
      last_transition_ = VisitTransition::GroupGrowth;
    }
  } else if (last_frame_count_ > 0) {
    last_absence_time_ = now;
    last_transition_ = VisitTransition::Departure;
  }

  const bool started = StartsVisit(last_transition_);
  if (started) ++total_visits_;

  last_frame_count_ = frame_count;
  return started;
}

} // namespace fw
