#include "session/frame_processor.hpp"

#include <cmath>
#include <utility>

#include "telemetry/thermal_probe.hpp"

namespace fw {

FrameProcessor::FrameProcessor(const AppConfig& cfg,
                               std::shared_ptr<EventLogSink> sink,
                               std::ostream& console,
                               std::unique_ptr<SlotMatcher> matcher)
    : sink_(std::move(sink)),
      filter_(cfg.detection),
      perf_(cfg.performance),
      thermal_zone_path_(cfg.monitoring.thermal_zone_path),
      tracker_(cfg.tracking, std::move(matcher)),
      reporter_(EmissionPolicy(cfg.logging.console_output_mode, cfg.logging.stats_every_n_frames), console) {}

template <typename Fn>
void FrameProcessor::write_safely(const char* what, Fn&& fn) {
  if (!sink_) return;
  try {
    fn(*sink_);
  } catch (const std::exception& e) {
    sink_failures_.fetch_add(1, std::memory_order_relaxed);
    std::cerr << "[frame_processor] log sink " << what << " failed: " << e.what() << "\n";
  }
}

void FrameProcessor::write_performance_sample(const FrameOutcome& out) {
  if (!sink_) return;

  PerformanceSample ps;
  ps.timestamp = out.timestamp;
  ps.fps = meter_.fps();
  ps.cpu_celsius = ReadCpuTemperature(thermal_zone_path_);
  ps.frame_delay_seconds = out.frame_delay_seconds;
  ps.used_memory_mb = ReadUsedMemoryMb(perf_.meminfo_path);
  ps.birds_on_frame = out.update.frame_count;
  ps.frame_index = meter_.frames();
  write_safely("performance", [&](EventLogSink& s) { s.write_performance(ps); });
}

FrameOutcome FrameProcessor::process(const DetectionFrame& frame) {
  std::lock_guard<std::mutex> lock(mu_);

  FrameOutcome out;

  // Clock stepped backwards (NTP adjust, replay glitch) or the time is NaN/inf: reuse the last
  // accepted time so expiry and visit gaps never see a negative or non-finite interval
  out.timestamp = frame.timestamp;
  const bool finite = std::isfinite(out.timestamp);
  if (!finite || (has_last_ts_ && out.timestamp < last_ts_)) {
    if (clamped_timestamps_.fetch_add(1, std::memory_order_relaxed) == 0) {
      std::cerr << "[frame_processor] bad frame timestamp (" << frame.timestamp
                << "), clamping to last accepted time\n";
    }
    out.timestamp = has_last_ts_ ? last_ts_ : 0.0;
  }
  out.frame_delay_seconds = has_last_ts_ ? out.timestamp - last_ts_ : 0.0;
  has_last_ts_ = true;
  last_ts_ = out.timestamp;

  out.accepted.reserve(frame.items.size());
  for (const auto& d : frame.items) {
    if (!IsWellFormed(d)) {
      ++out.dropped_malformed;
      continue;
    }
    if (filter_.keep(d)) out.accepted.push_back(d);
  }

  out.update = tracker_.update(out.accepted, out.timestamp);
  counters_.observe(tracker_.stats());
  meter_.on_frame(out.timestamp);

  out.change = counters_.check_changes();
  const CounterSnapshot& snap = out.change.current;

  reporter_.on_transition(out.update, tracker_.visits(), out.timestamp);

  if (reporter_.policy().should_write_record(out.update.frame_count, out.update.visit_started)) {
    FrameRecord rec;
    rec.timestamp = out.timestamp;
    rec.frame_count = out.update.frame_count;
    rec.active_count = snap.current_active;
    rec.total_unique = snap.total_unique;
    rec.total_visits = snap.total_visits;
    rec.detections = out.accepted;
    write_safely("record", [&](EventLogSink& s) { s.write_record(rec); });
    out.record_emitted = true;
  }

  if (out.change.visits_increased) {
    const CounterEvent ev{EventKind::Visit, snap.total_visits, out.timestamp};
    write_safely("event", [&](EventLogSink& s) { s.write_event(ev); });
  }
  if (out.change.uniques_increased) {
    const CounterEvent ev{EventKind::NewUnique, snap.total_unique, out.timestamp};
    write_safely("event", [&](EventLogSink& s) { s.write_event(ev); });
  }

  if (perf_.enable_performance_log) write_performance_sample(out);

  reporter_.on_change(out.change);
  reporter_.on_stats(meter_.frames(), meter_.fps(), snap);

  return out;
}

} // namespace fw
