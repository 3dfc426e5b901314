#include <atomic>
#include <iostream>
#include <thread>

#include "test_check.hpp"
#include "tracking/session_counters.hpp"

using fw::SessionCounters;
using fw::TrackerStats;

static TrackerStats Stats(std::uint64_t unique, std::uint64_t visits, int active = 0, int on_frame = 0) {
  TrackerStats s;
  s.total_unique = unique;
  s.total_visits = visits;
  s.current_active = active;
  s.current_on_frame = on_frame;
  return s;
}

static void CheckIsConsuming() {
  SessionCounters c;
  FW_CHECK(!c.has_changed_since_last_check());

  c.observe(Stats(1, 1, 1, 1));
  FW_CHECK(c.has_changed_since_last_check());
  FW_CHECK(!c.has_changed_since_last_check());
  FW_CHECK(!c.has_changed_since_last_check());

  // Same totals observed again: nothing new
  c.observe(Stats(1, 1, 1, 2));
  FW_CHECK(!c.has_changed_since_last_check());
}

static void ReportsWhichCounterMoved() {
  SessionCounters c;
  c.observe(Stats(1, 0));
  auto ch = c.check_changes();
  FW_CHECK(ch.uniques_increased);
  FW_CHECK(!ch.visits_increased);

  c.observe(Stats(1, 1));
  ch = c.check_changes();
  FW_CHECK(!ch.uniques_increased);
  FW_CHECK(ch.visits_increased);

  c.observe(Stats(2, 3, 1, 2));
  ch = c.check_changes();
  FW_CHECK(ch.uniques_increased && ch.visits_increased);
  FW_CHECK_EQ(ch.current.total_unique, 2u);
  FW_CHECK_EQ(ch.current.total_visits, 3u);
  FW_CHECK_EQ(ch.current.current_frame_count, 2);
}

static void TotalsNeverGoDown() {
  SessionCounters c;
  c.observe(Stats(5, 4, 2, 2));
  c.check_changes();

  c.observe(Stats(3, 1, 0, 0));
  const auto s = c.snapshot();
  FW_CHECK_EQ(s.total_unique, 5u);
  FW_CHECK_EQ(s.total_visits, 4u);
  FW_CHECK_EQ(s.current_active, 0);
  FW_CHECK(!c.has_changed_since_last_check());
}

static void SnapshotDoesNotConsume() {
  SessionCounters c;
  c.observe(Stats(1, 1));
  c.snapshot();
  c.snapshot();
  FW_CHECK(c.has_changed_since_last_check());
}

// A reader thread taking snapshots while the writer observes must only ever see monotonic totals
static void ConcurrentReaderSeesMonotonicTotals() {
  SessionCounters c;
  std::atomic_bool done{false};
  std::atomic_bool regressed{false};

  std::thread reader([&] {
    std::uint64_t prev = 0;
    while (!done.load()) {
      const auto s = c.snapshot();
      if (s.total_visits < prev) regressed.store(true);
      prev = s.total_visits;
    }
  });

  for (std::uint64_t i = 1; i <= 20000; ++i) {
    c.observe(Stats(i / 3, i, 1, 1));
    if (i % 7 == 0) c.check_changes();
  }
  done.store(true);
  reader.join();

  FW_CHECK(!regressed.load());
  FW_CHECK_EQ(c.snapshot().total_visits, 20000u);
}

int main() {
  CheckIsConsuming();
  ReportsWhichCounterMoved();
  TotalsNeverGoDown();
  SnapshotDoesNotConsume();
  ConcurrentReaderSeesMonotonicTotals();
  return fw_test::TestExitCode();
}
