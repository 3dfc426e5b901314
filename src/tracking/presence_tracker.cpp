#include "tracking/presence_tracker.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace fw {

std::vector<int> FirstSlotMatcher::match(const std::vector<Detection>& detections,
                                         const std::vector<IdentitySlot>& active_slots) {
  std::vector<int> out(detections.size(), 0);
  if (!detections.empty() && active_slots.empty()) out[0] = kNewSlot;
  return out;
}

PresenceTracker::PresenceTracker(TrackingConfig cfg, std::unique_ptr<SlotMatcher> matcher)
    : cfg_(std::move(cfg)), matcher_(std::move(matcher)), visits_(cfg_) {
  if (!matcher_) matcher_ = std::make_unique<FirstSlotMatcher>();
}

void PresenceTracker::expire(WallSeconds now) {
  const double timeout = cfg_.bird_timeout_seconds;
  slots_.erase(std::remove_if(slots_.begin(), slots_.end(),
                              [&](const IdentitySlot& s) { return now - s.last_seen > timeout; }),
               slots_.end());
}

PresenceUpdate PresenceTracker::update(const std::vector<Detection>& detections, WallSeconds now) {
  PresenceUpdate out;
  out.frame_count = static_cast<int>(detections.size());
  current_on_frame_ = out.frame_count;

  // Visit counting always runs first and sees the raw count
  out.visit_started = visits_.update(out.frame_count, now);
  out.transition = visits_.last_transition();

  if (!cfg_.enable_tracking) return out;

  expire(now);

  if (detections.empty()) return out;

  const std::vector<int> assignment = matcher_->match(detections, slots_);

  for (std::size_t i = 0; i < detections.size(); ++i) {
    const int idx = (i < assignment.size()) ? assignment[i] : 0;

    if (idx == kNewSlot) {
      ++total_unique_;
      slots_.push_back(IdentitySlot{total_unique_, now});
      ++out.new_unique;
      continue;
    }

    if (idx >= 0 && static_cast<std::size_t>(idx) < slots_.size()) {
      slots_[static_cast<std::size_t>(idx)].last_seen = now;
    } else {
      // Out of range answer from a custom matcher: leave the slots alone for this detection
      std::cerr << "[presence_tracker] matcher returned slot " << idx << " with " << slots_.size()
                << " active slots, detection ignored\n";
    }
  }

  return out;
}

TrackerStats PresenceTracker::stats() const {
  TrackerStats s;
  s.total_unique = total_unique_;
  s.total_visits = visits_.total_visits();
  s.current_active = static_cast<int>(slots_.size());
  s.current_on_frame = current_on_frame_;
  s.last_absence_time = visits_.last_absence_time();
  return s;
}

} // namespace fw
