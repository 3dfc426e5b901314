#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "core/config.hpp"
#include "core/detections.hpp"
#include "tracking/visit_detector.hpp"

namespace fw {

// One provisionally tracked bird. Expires once now - last_seen > bird_timeout_seconds
struct IdentitySlot {
  std::uint64_t id{0};
  WallSeconds last_seen{0.0};
};

// Slot index that asks the tracker to open a new slot (and count a new unique bird)
inline constexpr int kNewSlot = -1;

// Decides which active slot each detection belongs to.
// Returns one entry per detection, in input order: kNewSlot, or an index into the slot list as it
// stands after applying the earlier entries (new slots are appended in creation order).
class SlotMatcher {
public:
  virtual ~SlotMatcher() = default;
  virtual std::vector<int> match(const std::vector<Detection>& detections,
                                 const std::vector<IdentitySlot>& active_slots) = 0;
};

// Default policy: no per-detection identity. Any detections while a slot is alive refresh the
// oldest slot; a new bird is only promoted when the active set was empty at the start of the frame,
// so at most one promotion per frame.
class FirstSlotMatcher final : public SlotMatcher {
public:
  std::vector<int> match(const std::vector<Detection>& detections,
                         const std::vector<IdentitySlot>& active_slots) override;
};

struct PresenceUpdate {
  int frame_count{0};           // raw detection count for this frame
  int new_unique{0};            // slots promoted on this frame
  bool visit_started{false};
  VisitTransition transition{VisitTransition::None};
};

struct TrackerStats {
  std::uint64_t total_unique{0};
  std::uint64_t total_visits{0};
  int current_active{0};
  int current_on_frame{0};
  std::optional<WallSeconds> last_absence_time;
};

class PresenceTracker {
public:
  explicit PresenceTracker(TrackingConfig cfg, std::unique_ptr<SlotMatcher> matcher = nullptr);

  // Precondition: now is non-decreasing across calls (not checked here).
  // Order: visit detection, slot expiry, slot assignment.
  PresenceUpdate update(const std::vector<Detection>& detections, WallSeconds now);

  TrackerStats stats() const;

  const std::vector<IdentitySlot>& active_slots() const { return slots_; }
  const VisitDetector& visits() const { return visits_; }

private:
  void expire(WallSeconds now);

  TrackingConfig cfg_;
  std::unique_ptr<SlotMatcher> matcher_;
  VisitDetector visits_;

  std::vector<IdentitySlot> slots_;   // insertion order, oldest first
  std::uint64_t total_unique_{0};
  int current_on_frame_{0};
};

} // namespace fw
