#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include "telemetry/telemetry_stage.hpp"
#include "telemetry/thermal_probe.hpp"
#include "test_check.hpp"

namespace fs = std::filesystem;

class SampleSink final : public fw::EventLogSink {
public:
  void write_record(const fw::FrameRecord&) override {}
  void write_event(const fw::CounterEvent&) override {}
  void write_temperature(const fw::TemperatureSample& s) override {
    if (fail) throw std::runtime_error("disk full");
    samples.push_back(s);
  }

  bool fail{false};
  std::vector<fw::TemperatureSample> samples;
};

static void ParsesMillidegrees() {
  const auto a = fw::ParseMillidegrees("48312\n");
  FW_CHECK(a.has_value());
  if (a) FW_CHECK_NEAR(*a, 48.3, 1e-9);

  const auto b = fw::ParseMillidegrees("51050");
  FW_CHECK(b.has_value());
  if (b) FW_CHECK_NEAR(*b, 51.1, 1e-9);

  FW_CHECK(!fw::ParseMillidegrees("").has_value());
  FW_CHECK(!fw::ParseMillidegrees("hot").has_value());
}

static void ReadsFileOrNothing(const fs::path& dir) {
  const fs::path zone = dir / "temp";
  { std::ofstream(zone) << "62000\n"; }

  const auto t = fw::ReadCpuTemperature(zone.string());
  FW_CHECK(t.has_value());
  if (t) FW_CHECK_NEAR(*t, 62.0, 1e-9);

  FW_CHECK(!fw::ReadCpuTemperature((dir / "missing").string()).has_value());
}

static void ParsesMeminfo(const fs::path& dir) {
  const std::string meminfo =
      "MemTotal:        3884272 kB\n"
      "MemFree:          712356 kB\n"
      "MemAvailable:    2860592 kB\n"
      "Buffers:           94208 kB\n";

  const auto used = fw::ParseMeminfoUsedMb(meminfo);
  FW_CHECK(used.has_value());
  if (used) FW_CHECK_NEAR(*used, (3884272.0 - 2860592.0) / 1024.0, 1e-9);

  // Old kernels have no MemAvailable line
  FW_CHECK(!fw::ParseMeminfoUsedMb("MemTotal: 1000 kB\nMemFree: 500 kB\n").has_value());
  FW_CHECK(!fw::ParseMeminfoUsedMb("").has_value());

  const fs::path file = dir / "meminfo";
  { std::ofstream(file) << meminfo; }
  const auto from_file = fw::ReadUsedMemoryMb(file.string());
  FW_CHECK(from_file.has_value());
  if (from_file) FW_CHECK_NEAR(*from_file, 999.6875, 1e-9);
  FW_CHECK(!fw::ReadUsedMemoryMb((dir / "missing").string()).has_value());
}

static void TelemetryStageWritesSamples(const fs::path& dir) {
  const fs::path zone = dir / "temp";
  { std::ofstream(zone) << "45500\n"; }

  fw::MonitoringConfig cfg;
  cfg.enable_temperature_logging = true;
  cfg.thermal_zone_path = zone.string();

  auto sink = std::make_shared<SampleSink>();
  fw::TelemetryStage stage(cfg, sink, [] { return 12.5; });

  FW_CHECK(stage.sample_once());
  FW_CHECK_EQ(sink->samples.size(), 1u);
  if (!sink->samples.empty()) {
    FW_CHECK_NEAR(sink->samples[0].celsius, 45.5, 1e-9);
    FW_CHECK_NEAR(sink->samples[0].fps, 12.5, 1e-9);
    FW_CHECK(sink->samples[0].timestamp > 0.0);
  }

  sink->fail = true;
  FW_CHECK(!stage.sample_once());
  FW_CHECK_EQ(stage.samples_skipped(), 1u);
  sink->fail = false;

  // Started stage writes its first sample right away and stops promptly inside a long interval
  fw::StopSource stop;
  stage.start(stop.token());
  for (int i = 0; i < 200 && stage.samples_written() < 2; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  stop.request_stop();
  stage.stop();
  FW_CHECK_EQ(stage.samples_written(), 2u);
}

static void MissingZoneIsSkipped(const fs::path& dir) {
  fw::MonitoringConfig cfg;
  cfg.thermal_zone_path = (dir / "no_such_zone").string();
  auto sink = std::make_shared<SampleSink>();
  fw::TelemetryStage stage(cfg, sink, nullptr);

  FW_CHECK(!stage.sample_once());
  FW_CHECK(!stage.sample_once());
  FW_CHECK(sink->samples.empty());
  FW_CHECK_EQ(stage.samples_skipped(), 2u);
}

int main() {
  const fs::path dir = fs::temp_directory_path() / ("fw_thermal_test_" + std::to_string(::getpid()));
  fs::create_directories(dir);

  ParsesMillidegrees();
  ReadsFileOrNothing(dir);
  ParsesMeminfo(dir);
  TelemetryStageWritesSamples(dir);
  MissingZoneIsSkipped(dir);

  std::error_code ec;
  fs::remove_all(dir, ec);
  return fw_test::TestExitCode();
}
