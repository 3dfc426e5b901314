#include "telemetry/telemetry_stage.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

#include "core/wall_clock.hpp"
#include "telemetry/thermal_probe.hpp"

namespace fw {

TelemetryStage::TelemetryStage(MonitoringConfig cfg, std::shared_ptr<EventLogSink> sink, FpsFn fps)
    : Stage("telemetry_stage"), cfg_(std::move(cfg)), sink_(std::move(sink)), fps_(std::move(fps)) {}

bool TelemetryStage::sample_once() {
  const auto celsius = ReadCpuTemperature(cfg_.thermal_zone_path);
  if (!celsius) {
    skipped_.fetch_add(1, std::memory_order_relaxed);
    if (!warned_) {
      std::cerr << "[telemetry] cannot read " << cfg_.thermal_zone_path << ", skipping samples" << std::endl;
      warned_ = true;
    }
    return false;
  }

  TemperatureSample s;
  s.celsius = *celsius;
  s.timestamp = NowSeconds();
  s.fps = fps_ ? fps_() : 0.0;

  if (!sink_) return false;
  try {
    sink_->write_temperature(s);
  } catch (const std::exception& e) {
    skipped_.fetch_add(1, std::memory_order_relaxed);
    std::cerr << "[telemetry] write failed: " << e.what() << std::endl;
    return false;
  }

  written_.fetch_add(1, std::memory_order_relaxed);
  return true;
}

void TelemetryStage::run(const StopToken& global, const std::atomic_bool& local) {
  const auto interval = std::chrono::duration<double>(cfg_.temperature_log_interval_minutes * 60.0);

  sample_once();
  while (SleepUnlessStopped(global, local, interval)) {
    sample_once();
  }
}

} // namespace fw
