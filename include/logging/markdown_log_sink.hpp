#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

#include "core/config.hpp"
#include "core/detections.hpp"
#include "logging/event_log_sink.hpp"

/*
    MarkdownLogSink writes one session folder per process run:

      <logs_path>/logs_<YYYY-MM-DD_HH-MM-SS>/
          <log_filename_pattern>                 primary frame table
          <temperature_log_filename>             temperature/FPS table (when enabled)
          add_logs/bird_counter_log.md           legacy table, frames with birds only
          add_logs/bird_counter_events_<ts>.md   counter events
          add_logs/<performance_log_filename>    per-frame performance table (when enabled)

    All files are appended to. The "Total unique birds" header line of both frame tables is
    rewritten in place whenever the total changes. Every write throws std::runtime_error on I/O
    failure; nothing here is retried.
*/

namespace fw {

class MarkdownLogSink final : public EventLogSink {
public:
  // Creates the session folder and writes all table headers. Throws if the folder can't be made
  explicit MarkdownLogSink(const AppConfig& cfg, WallSeconds session_start);

  void write_record(const FrameRecord& record) override;
  void write_event(const CounterEvent& event) override;
  void write_temperature(const TemperatureSample& sample) override;
  void write_performance(const PerformanceSample& sample) override;

  const std::filesystem::path& session_dir() const { return session_dir_; }
  const std::filesystem::path& primary_log_path() const { return primary_path_; }
  const std::filesystem::path& legacy_log_path() const { return legacy_path_; }
  const std::filesystem::path& events_log_path() const { return events_path_; }
  const std::filesystem::path& temperature_log_path() const { return temperature_path_; }
  const std::filesystem::path& performance_log_path() const { return performance_path_; }

private:
  void init_primary_log(WallSeconds start);
  void init_legacy_log(WallSeconds start);
  void init_events_log(WallSeconds start);
  void init_temperature_log(WallSeconds start);
  void init_performance_log(WallSeconds start);

  void update_total_line(const std::filesystem::path& path, std::uint64_t total_unique);

  static std::string FormatCoords(const std::vector<Detection>& detections);

  AppConfig cfg_;

  std::mutex mu_;
  std::filesystem::path session_dir_;
  std::filesystem::path primary_path_;
  std::filesystem::path legacy_path_;
  std::filesystem::path events_path_;
  std::filesystem::path temperature_path_;
  std::filesystem::path performance_path_;

  std::uint64_t primary_total_written_{0};
  std::uint64_t legacy_total_written_{0};
};

} // namespace fw
