#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "core/detections.hpp"

namespace fw {

// Snapshot row for one frame
struct FrameRecord {
  WallSeconds timestamp{0.0};
  int frame_count{0};
  int active_count{0};
  std::uint64_t total_unique{0};
  std::uint64_t total_visits{0};
  std::vector<Detection> detections;
};

enum class EventKind {
  Visit,
  NewUnique
};

const char* EventKindName(EventKind kind);

// Written exactly once per counter increase
struct CounterEvent {
  EventKind kind{EventKind::Visit};
  std::uint64_t counter_value{0};
  WallSeconds timestamp{0.0};
};

struct TemperatureSample {
  double celsius{0.0};
  WallSeconds timestamp{0.0};
  double fps{0.0};   // <= 0 when no frames have been processed yet
};

// One row of the performance debug table, written per processed frame when enabled
struct PerformanceSample {
  WallSeconds timestamp{0.0};
  double fps{0.0};
  std::optional<double> cpu_celsius;      // unreadable thermal zone
  double frame_delay_seconds{0.0};        // since the previous frame, 0 on the first one
  std::optional<double> used_memory_mb;   // MemTotal - MemAvailable
  int birds_on_frame{0};
  std::uint64_t frame_index{0};
};

// Where records, events and telemetry end up. Implementations may throw on I/O failure,
// callers on the frame path catch and keep going.
class EventLogSink {
public:
  virtual ~EventLogSink() = default;

  virtual void write_record(const FrameRecord& record) = 0;
  virtual void write_event(const CounterEvent& event) = 0;
  virtual void write_temperature(const TemperatureSample& sample) = 0;

  // Optional debug table, sinks without one ignore it
  virtual void write_performance(const PerformanceSample&) {}

  virtual void flush() {}
};

} // namespace fw
