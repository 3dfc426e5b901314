#pragma once

#include <atomic>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/detections.hpp"
#include "detection/detection_filter.hpp"
#include "infra/metrics.hpp"
#include "logging/console_reporter.hpp"
#include "logging/event_log_sink.hpp"
#include "tracking/presence_tracker.hpp"
#include "tracking/session_counters.hpp"

namespace fw {

struct FrameOutcome {
  WallSeconds timestamp{0.0};            // after clamping to the last accepted timestamp
  std::vector<Detection> accepted;       // what the tracker saw
  int dropped_malformed{0};
  PresenceUpdate update{};
  CounterChange change{};
  bool record_emitted{false};           // emission policy let a record through
  double frame_delay_seconds{0.0};      // since the previous accepted frame
};

/*
    FrameProcessor is the per-session driver: detections in, counters/log records/events out.

    One frame at a time. process() holds a mutex for the whole update, so several producer threads
    may call it, but frames are applied strictly one after another. snapshot(), fps() and
    sink_failures() are safe from any thread and never wait on a frame in progress.

    With performance_debug enabled every frame also reads the CPU temperature and /proc/meminfo
    and writes a PerformanceSample to the sink.

    Log sink exceptions are caught here and counted, the in-memory counters stay authoritative.
    With a synchronous MarkdownLogSink the file writes happen inside process(); wrap the sink in
    an AsyncLogSink to keep I/O off the frame path.
*/
class FrameProcessor {
public:
  // sink may be null (text logging disabled)
  FrameProcessor(const AppConfig& cfg,
                 std::shared_ptr<EventLogSink> sink,
                 std::ostream& console = std::cout,
                 std::unique_ptr<SlotMatcher> matcher = nullptr);

  FrameProcessor(const FrameProcessor&) = delete;
  FrameProcessor& operator=(const FrameProcessor&) = delete;

  FrameOutcome process(const DetectionFrame& frame);

  CounterSnapshot snapshot() const { return counters_.snapshot(); }
  double fps() const { return meter_.fps(); }
  const FrameRateMeter& meter() const { return meter_; }

  std::uint64_t sink_failures() const { return sink_failures_.load(std::memory_order_relaxed); }
  std::uint64_t clamped_timestamps() const { return clamped_timestamps_.load(std::memory_order_relaxed); }

private:
  template <typename Fn>
  void write_safely(const char* what, Fn&& fn);

  void write_performance_sample(const FrameOutcome& out);

  std::shared_ptr<EventLogSink> sink_;
  DetectionFilter filter_;
  PerformanceDebugConfig perf_;
  std::string thermal_zone_path_;

  std::mutex mu_;
  PresenceTracker tracker_;
  SessionCounters counters_;
  ConsoleReporter reporter_;
  FrameRateMeter meter_;

  bool has_last_ts_{false};
  WallSeconds last_ts_{0.0};

  std::atomic<std::uint64_t> sink_failures_{0};
  std::atomic<std::uint64_t> clamped_timestamps_{0};
};

} // namespace fw
