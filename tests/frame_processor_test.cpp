#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

#include "session/frame_processor.hpp"
#include "test_check.hpp"

using fw::AppConfig;
using fw::CounterEvent;
using fw::DetectionFrame;
using fw::EventKind;
using fw::FrameProcessor;

// Keeps everything it is given
class RecordingSink final : public fw::EventLogSink {
public:
  void write_record(const fw::FrameRecord& r) override { records.push_back(r); }
  void write_event(const CounterEvent& e) override { events.push_back(e); }
  void write_temperature(const fw::TemperatureSample& s) override { samples.push_back(s); }
  void write_performance(const fw::PerformanceSample& s) override { performance.push_back(s); }

  std::vector<fw::FrameRecord> records;
  std::vector<CounterEvent> events;
  std::vector<fw::TemperatureSample> samples;
  std::vector<fw::PerformanceSample> performance;
};

class FailingSink final : public fw::EventLogSink {
public:
  void write_record(const fw::FrameRecord&) override { throw std::runtime_error("disk full"); }
  void write_event(const CounterEvent&) override { throw std::runtime_error("disk full"); }
  void write_temperature(const fw::TemperatureSample&) override { throw std::runtime_error("disk full"); }
};

static fw::Detection Bird(float x = 0.4f, float conf = 0.8f, const char* label = "bird") {
  fw::Detection d;
  d.label = label;
  d.confidence = conf;
  d.bbox = fw::BBox{x, 0.3f, 0.1f, 0.1f};
  return d;
}

static DetectionFrame Frame(double t, int birds) {
  DetectionFrame f;
  f.timestamp = t;
  for (int i = 0; i < birds; ++i) f.items.push_back(Bird(0.1f + 0.2f * static_cast<float>(i)));
  return f;
}

static AppConfig Cfg(fw::ConsoleOutputMode mode = fw::ConsoleOutputMode::Minimal) {
  AppConfig cfg;
  cfg.tracking.bird_timeout_seconds = 30.0;
  cfg.tracking.min_time_between_visits_seconds = 10.0;
  cfg.logging.console_output_mode = mode;
  return cfg;
}

static void Feed(FrameProcessor& p, const std::vector<int>& counts, const std::vector<double>& times) {
  for (std::size_t i = 0; i < counts.size(); ++i) p.process(Frame(times[i], counts[i]));
}

static void EndToEndScenario() {
  // Return 5s after the departure frame: same visit
  {
    std::ostringstream console;
    auto sink = std::make_shared<RecordingSink>();
    FrameProcessor p(Cfg(), sink, console);
    Feed(p, {0, 1, 1, 0, 1}, {0, 5, 6, 20, 25});
    FW_CHECK_EQ(p.snapshot().total_unique, 1u);
    FW_CHECK_EQ(p.snapshot().total_visits, 1u);
  }

  // 14s absence: a new visit, the slot from t=6 is still active so no new unique bird
  std::ostringstream console;
  auto sink = std::make_shared<RecordingSink>();
  FrameProcessor p(Cfg(), sink, console);
  Feed(p, {0, 1, 1, 0, 1}, {0, 5, 6, 20, 34});

  const auto snap = p.snapshot();
  FW_CHECK_EQ(snap.total_unique, 1u);
  FW_CHECK_EQ(snap.total_visits, 2u);
  FW_CHECK_EQ(snap.current_active, 1);
  FW_CHECK_EQ(snap.current_frame_count, 1);

  // One event per counter increase, visit before unique when both move on one frame
  FW_CHECK_EQ(sink->events.size(), 3u);
  if (sink->events.size() == 3) {
    FW_CHECK(sink->events[0].kind == EventKind::Visit);
    FW_CHECK_EQ(sink->events[0].counter_value, 1u);
    FW_CHECK_NEAR(sink->events[0].timestamp, 5.0, 1e-9);
    FW_CHECK(sink->events[1].kind == EventKind::NewUnique);
    FW_CHECK_EQ(sink->events[1].counter_value, 1u);
    FW_CHECK(sink->events[2].kind == EventKind::Visit);
    FW_CHECK_EQ(sink->events[2].counter_value, 2u);
    FW_CHECK_NEAR(sink->events[2].timestamp, 34.0, 1e-9);
  }

  // Minimal mode: records only on visit starts, nothing on the console
  FW_CHECK_EQ(sink->records.size(), 2u);
  FW_CHECK(console.str().empty());
}

static void AllModeWritesEveryFrameWithBirds() {
  std::ostringstream console;
  auto sink = std::make_shared<RecordingSink>();
  AppConfig cfg = Cfg(fw::ConsoleOutputMode::All);
  cfg.logging.stats_every_n_frames = 2;
  FrameProcessor p(cfg, sink, console);
  Feed(p, {0, 1, 1, 0, 1}, {0, 5, 6, 20, 34});

  FW_CHECK_EQ(sink->records.size(), 3u);
  if (!sink->records.empty()) {
    FW_CHECK_EQ(sink->records[0].frame_count, 1);
    FW_CHECK_EQ(sink->records[0].total_unique, 1u);
    FW_CHECK_EQ(sink->records[0].detections.size(), 1u);
  }

  const std::string out = console.str();
  FW_CHECK(out.find("[visit] first feeder visit #1") != std::string::npos);
  FW_CHECK(out.find("birds left the frame") != std::string::npos);
  FW_CHECK(out.find("[visit] new feeder visit #2") != std::string::npos);
  FW_CHECK(out.find("[stats] frame 2") != std::string::npos);
  FW_CHECK(out.find("[change]") == std::string::npos);
}

static void ChangesOnlyPrintsCounterChanges() {
  std::ostringstream console;
  FrameProcessor p(Cfg(fw::ConsoleOutputMode::ChangesOnly), nullptr, console);
  Feed(p, {1, 0, 1}, {0, 1, 2});

  const std::string out = console.str();
  FW_CHECK(out.find("[change] unique: 1 | visits: 1") != std::string::npos);
  FW_CHECK(out.find("birds left the frame") == std::string::npos);
  FW_CHECK(out.find("continues") == std::string::npos);
}

static void ModeNeverChangesCounting() {
  const std::vector<int> counts{0, 1, 2, 0, 0, 3, 1, 0, 1};
  const std::vector<double> times{0, 1, 2, 3, 20, 21, 22, 23, 60};

  std::ostringstream a, b, c;
  FrameProcessor all(Cfg(fw::ConsoleOutputMode::All), nullptr, a);
  FrameProcessor changes(Cfg(fw::ConsoleOutputMode::ChangesOnly), nullptr, b);
  FrameProcessor minimal(Cfg(fw::ConsoleOutputMode::Minimal), nullptr, c);
  Feed(all, counts, times);
  Feed(changes, counts, times);
  Feed(minimal, counts, times);

  FW_CHECK_EQ(all.snapshot().total_visits, minimal.snapshot().total_visits);
  FW_CHECK_EQ(changes.snapshot().total_visits, minimal.snapshot().total_visits);
  FW_CHECK_EQ(all.snapshot().total_unique, minimal.snapshot().total_unique);
  FW_CHECK_EQ(changes.snapshot().total_unique, minimal.snapshot().total_unique);
}

static void SinkFailureDoesNotStopCounting() {
  std::ostringstream console;
  FrameProcessor p(Cfg(), std::make_shared<FailingSink>(), console);
  Feed(p, {1, 2, 0}, {0, 1, 2});

  FW_CHECK_EQ(p.snapshot().total_visits, 2u);
  FW_CHECK_EQ(p.snapshot().total_unique, 1u);
  // Two records (both frames start a visit) plus three events
  FW_CHECK_EQ(p.sink_failures(), 5u);
}

static void FiltersAndDropsBeforeTracking() {
  std::ostringstream console;
  auto sink = std::make_shared<RecordingSink>();
  FrameProcessor p(Cfg(), sink, console);

  DetectionFrame f;
  f.timestamp = 1.0;
  f.items.push_back(Bird(0.1f, 0.9f, "cat"));                                    // wrong class
  f.items.push_back(Bird(0.2f, 0.1f));                                           // too unsure
  f.items.push_back(Bird(0.3f, std::numeric_limits<float>::quiet_NaN()));        // malformed
  f.items.push_back(Bird(0.4f, 1.5f));                                           // malformed
  f.items.push_back(Bird(0.5f, 0.7f));                                           // kept

  const auto out = p.process(f);
  FW_CHECK_EQ(out.dropped_malformed, 2);
  FW_CHECK_EQ(out.accepted.size(), 1u);
  FW_CHECK_EQ(out.update.frame_count, 1);
  FW_CHECK_EQ(p.snapshot().total_unique, 1u);
}

static void ClampsBackwardsTimestamps() {
  std::ostringstream console;
  FrameProcessor p(Cfg(), nullptr, console);

  p.process(Frame(100.0, 1));
  p.process(Frame(101.0, 0));
  const auto out = p.process(Frame(50.0, 1));   // clock jumped back

  FW_CHECK_NEAR(out.timestamp, 101.0, 1e-9);
  FW_CHECK_EQ(p.clamped_timestamps(), 1u);
  // Gap measured as 0s, so this is the same visit
  FW_CHECK_EQ(p.snapshot().total_visits, 1u);
  FW_CHECK(out.update.transition == fw::VisitTransition::Flicker);
}

static void NonFiniteTimestampsNeverStallExpiry() {
  std::ostringstream console;
  FrameProcessor p(Cfg(), nullptr, console);
  const double nan = std::numeric_limits<double>::quiet_NaN();

  p.process(Frame(0.0, 1));
  const auto out = p.process(Frame(nan, 1));
  FW_CHECK(std::isfinite(out.timestamp));
  FW_CHECK_NEAR(out.timestamp, 0.0, 1e-9);

  // Feeder empty for far longer than the 30s timeout, every return is a new bird
  p.process(Frame(100.0, 0));
  p.process(Frame(1000.0, 1));
  p.process(Frame(5000.0, 1));

  FW_CHECK_EQ(p.snapshot().total_unique, 3u);
  FW_CHECK_EQ(p.clamped_timestamps(), 1u);

  // Infinite time before any accepted frame falls back to zero
  FrameProcessor q(Cfg(), nullptr, console);
  const auto first = q.process(Frame(std::numeric_limits<double>::infinity(), 1));
  FW_CHECK_NEAR(first.timestamp, 0.0, 1e-9);
  q.process(Frame(40.0, 1));
  FW_CHECK_EQ(q.snapshot().total_unique, 2u);
}

static void PerformanceSamplesFollowFrames() {
  const std::string meminfo = "fw_frame_processor_meminfo_" + std::to_string(::getpid());
  { std::ofstream(meminfo) << "MemTotal: 2048000 kB\nMemAvailable: 1024000 kB\n"; }

  std::ostringstream console;
  auto sink = std::make_shared<RecordingSink>();
  AppConfig cfg = Cfg();
  cfg.performance.enable_performance_log = true;
  cfg.performance.meminfo_path = meminfo;
  cfg.monitoring.thermal_zone_path = "no/such/thermal_zone/temp";
  FrameProcessor p(cfg, sink, console);

  p.process(Frame(10.0, 1));
  p.process(Frame(10.5, 2));
  p.process(Frame(11.5, 0));

  FW_CHECK_EQ(sink->performance.size(), 3u);
  if (sink->performance.size() == 3u) {
    const auto& first = sink->performance[0];
    FW_CHECK_NEAR(first.frame_delay_seconds, 0.0, 1e-9);
    FW_CHECK_EQ(first.birds_on_frame, 1);
    FW_CHECK_EQ(first.frame_index, 1u);
    FW_CHECK(!first.cpu_celsius.has_value());
    FW_CHECK(first.used_memory_mb.has_value());
    if (first.used_memory_mb) FW_CHECK_NEAR(*first.used_memory_mb, 1000.0, 1e-9);

    FW_CHECK_NEAR(sink->performance[1].frame_delay_seconds, 0.5, 1e-9);
    FW_CHECK_EQ(sink->performance[1].birds_on_frame, 2);
    FW_CHECK_NEAR(sink->performance[2].frame_delay_seconds, 1.0, 1e-9);
    FW_CHECK_EQ(sink->performance[2].birds_on_frame, 0);
    FW_CHECK_EQ(sink->performance[2].frame_index, 3u);
    FW_CHECK(sink->performance[2].fps > 0.0);
  }
  std::remove(meminfo.c_str());

  // Off by default
  auto quiet = std::make_shared<RecordingSink>();
  FrameProcessor q(Cfg(), quiet, console);
  q.process(Frame(0.0, 1));
  FW_CHECK(quiet->performance.empty());
}

static void EmptyFramesAtZeroEmitNothing() {
  std::ostringstream console;
  auto sink = std::make_shared<RecordingSink>();
  FrameProcessor p(Cfg(fw::ConsoleOutputMode::All), sink, console);
  for (int i = 0; i < 10; ++i) {
    const auto out = p.process(Frame(static_cast<double>(i), 0));
    FW_CHECK(!out.change.any());
    FW_CHECK(!out.record_emitted);
  }
  FW_CHECK(sink->events.empty());
  FW_CHECK(sink->records.empty());
  FW_CHECK_EQ(p.snapshot().total_visits, 0u);
}

static void FpsFollowsFrameTimestamps() {
  std::ostringstream console;
  FrameProcessor p(Cfg(), nullptr, console);
  for (int i = 0; i < 50; ++i) p.process(Frame(1000.0 + i * 0.1, 0));
  FW_CHECK_NEAR(p.fps(), 10.0, 1e-6);
  FW_CHECK_EQ(p.meter().frames(), 50u);
}

int main() {
  EndToEndScenario();
  AllModeWritesEveryFrameWithBirds();
  ChangesOnlyPrintsCounterChanges();
  ModeNeverChangesCounting();
  SinkFailureDoesNotStopCounting();
  FiltersAndDropsBeforeTracking();
  ClampsBackwardsTimestamps();
  NonFiniteTimestampsNeverStallExpiry();
  PerformanceSamplesFollowFrames();
  EmptyFramesAtZeroEmitNothing();
  FpsFollowsFrameTimestamps();
  return fw_test::TestExitCode();
}
