#include <iostream>
#include <memory>
#include <vector>

#include "test_check.hpp"
#include "tracking/presence_tracker.hpp"

using fw::Detection;
using fw::IdentitySlot;
using fw::PresenceTracker;
using fw::TrackingConfig;

static std::vector<Detection> Birds(int n) {
  std::vector<Detection> out;
  for (int i = 0; i < n; ++i) {
    Detection d;
    d.label = "bird";
    d.confidence = 0.8f;
    d.bbox = fw::BBox{0.1f * static_cast<float>(i), 0.1f, 0.1f, 0.1f};
    out.push_back(d);
  }
  return out;
}

static TrackingConfig Cfg(double timeout = 30.0) {
  TrackingConfig cfg;
  cfg.bird_timeout_seconds = timeout;
  return cfg;
}

static void PromotesOnlyWhenActiveSetEmpty() {
  PresenceTracker t(Cfg());

  auto u = t.update(Birds(1), 0.0);
  FW_CHECK_EQ(u.new_unique, 1);
  FW_CHECK(u.visit_started);
  FW_CHECK_EQ(t.stats().total_unique, 1u);
  FW_CHECK_EQ(t.stats().current_active, 1);

  // A second bird while one slot is active refreshes that slot instead of promoting
  u = t.update(Birds(2), 1.0);
  FW_CHECK_EQ(u.new_unique, 0);
  FW_CHECK_EQ(t.stats().total_unique, 1u);
  FW_CHECK_EQ(t.stats().current_active, 1);
  FW_CHECK_NEAR(t.active_slots().front().last_seen, 1.0, 1e-9);

  // [1,2] from empty: first visit plus group growth
  FW_CHECK_EQ(t.stats().total_visits, 2u);
  FW_CHECK_EQ(t.stats().current_on_frame, 2);
}

static void SlotExpiresAfterTimeout() {
  PresenceTracker t(Cfg(30.0));
  t.update(Birds(1), 100.0);

  // Exactly at the timeout the slot is still there
  t.update({}, 130.0);
  FW_CHECK_EQ(t.stats().current_active, 1);

  t.update({}, 130.001);
  FW_CHECK_EQ(t.stats().current_active, 0);

  // Next bird after expiry is a new unique one
  const auto u = t.update(Birds(1), 140.0);
  FW_CHECK_EQ(u.new_unique, 1);
  FW_CHECK_EQ(t.stats().total_unique, 2u);
  FW_CHECK_EQ(t.active_slots().back().id, 2u);
}

static void RefreshKeepsSlotAlive() {
  PresenceTracker t(Cfg(10.0));
  for (int i = 0; i <= 60; i += 5) t.update(Birds(1), static_cast<double>(i));
  FW_CHECK_EQ(t.stats().total_unique, 1u);
  FW_CHECK_EQ(t.stats().current_active, 1);
}

static void EmptyUpdateAtZeroIsIdempotent() {
  PresenceTracker t(Cfg());
  for (int i = 0; i < 5; ++i) {
    const auto u = t.update({}, static_cast<double>(i));
    FW_CHECK_EQ(u.new_unique, 0);
    FW_CHECK(!u.visit_started);
  }
  const auto s = t.stats();
  FW_CHECK_EQ(s.total_unique, 0u);
  FW_CHECK_EQ(s.total_visits, 0u);
  FW_CHECK_EQ(s.current_active, 0);
  FW_CHECK(!s.last_absence_time.has_value());
}

static void TrackingDisabledStillCountsVisits() {
  TrackingConfig cfg = Cfg();
  cfg.enable_tracking = false;
  PresenceTracker t(cfg);

  const auto u = t.update(Birds(2), 0.0);
  FW_CHECK_EQ(u.frame_count, 2);
  FW_CHECK_EQ(u.new_unique, 0);
  FW_CHECK(u.visit_started);
  FW_CHECK_EQ(t.stats().total_unique, 0u);
  FW_CHECK_EQ(t.stats().current_active, 0);
  FW_CHECK_EQ(t.stats().total_visits, 1u);
}

// Every detection gets its own slot: exercises the matcher seam
class OnePerDetectionMatcher final : public fw::SlotMatcher {
public:
  std::vector<int> match(const std::vector<Detection>& detections,
                         const std::vector<IdentitySlot>&) override {
    return std::vector<int>(detections.size(), fw::kNewSlot);
  }
};

class BrokenMatcher final : public fw::SlotMatcher {
public:
  std::vector<int> match(const std::vector<Detection>& detections,
                         const std::vector<IdentitySlot>&) override {
    return std::vector<int>(detections.size(), 7);
  }
};

static void CustomMatcherDoesNotChangeVisits() {
  PresenceTracker custom(Cfg(), std::make_unique<OnePerDetectionMatcher>());
  PresenceTracker stock(Cfg());

  const std::vector<int> counts{0, 2, 3, 0, 1};
  for (std::size_t i = 0; i < counts.size(); ++i) {
    custom.update(Birds(counts[i]), static_cast<double>(i));
    stock.update(Birds(counts[i]), static_cast<double>(i));
  }
  FW_CHECK_EQ(custom.stats().total_unique, 6u);
  FW_CHECK_EQ(custom.stats().total_visits, stock.stats().total_visits);
}

static void OutOfRangeAssignmentIgnored() {
  PresenceTracker t(Cfg(), std::make_unique<BrokenMatcher>());
  t.update(Birds(2), 0.0);
  FW_CHECK_EQ(t.stats().total_unique, 0u);
  FW_CHECK_EQ(t.stats().current_active, 0);
  FW_CHECK_EQ(t.stats().total_visits, 1u);
}

int main() {
  PromotesOnlyWhenActiveSetEmpty();
  SlotExpiresAfterTimeout();
  RefreshKeepsSlotAlive();
  EmptyUpdateAtZeroIsIdempotent();
  TrackingDisabledStillCountsVisits();
  CustomMatcherDoesNotChangeVisits();
  OutOfRangeAssignmentIgnored();
  return fw_test::TestExitCode();
}
