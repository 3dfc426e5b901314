#include "logging/markdown_log_sink.hpp"

#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <vector>

#include "core/wall_clock.hpp"

namespace fs = std::filesystem;

namespace fw {

static constexpr const char* kTotalLinePrefix = "**Total unique birds:** ";
static constexpr const char* kLegacyLogName = "bird_counter_log.md";

static std::ofstream OpenOrThrow(const fs::path& path, std::ios::openmode mode) {
  std::ofstream ofs(path, mode);
  if (!ofs) throw std::runtime_error("cannot open log file '" + path.string() + "'");
  return ofs;
}

static void CheckWritten(const std::ofstream& ofs, const fs::path& path) {
  if (!ofs) throw std::runtime_error("write failed for log file '" + path.string() + "'");
}

MarkdownLogSink::MarkdownLogSink(const AppConfig& cfg, WallSeconds session_start) : cfg_(cfg) {
  const std::string stamp = FormatLocalTime(session_start, "%Y-%m-%d_%H-%M-%S");

  session_dir_ = fs::path(cfg_.logging.logs_path) / ("logs_" + stamp);
  const fs::path add_logs = session_dir_ / "add_logs";

  std::error_code ec;
  fs::create_directories(add_logs, ec);
  if (ec) {
    throw std::runtime_error("cannot create session log folder '" + add_logs.string() + "': " + ec.message());
  }

  primary_path_ = session_dir_ / ExpandPattern(cfg_.logging.log_filename_pattern, "timestamp", stamp);
  legacy_path_ = add_logs / kLegacyLogName;
  events_path_ = add_logs / ("bird_counter_events_" + stamp + ".md");

  init_primary_log(session_start);
  init_legacy_log(session_start);
  init_events_log(session_start);

  if (cfg_.monitoring.enable_temperature_logging) {
    temperature_path_ = session_dir_ / ExpandPattern(cfg_.monitoring.temperature_log_filename, "timestamp", stamp);
    init_temperature_log(session_start);
  }

  if (cfg_.performance.enable_performance_log) {
    performance_path_ = add_logs / ExpandPattern(cfg_.performance.performance_log_filename, "timestamp", stamp);
    init_performance_log(session_start);
  }
}

void MarkdownLogSink::init_primary_log(WallSeconds start) {
  auto f = OpenOrThrow(primary_path_, std::ios::out | std::ios::trunc);
  f << "# Feeder bird detection log\n\n";
  f << "**Started:** " << FormatLocalTime(start, "%Y-%m-%d %H:%M:%S") << "\n";
  f << kTotalLinePrefix << 0 << "\n\n";
  f << "## Detections\n\n";
  f << "| Time | Birds on frame | Active | Unique | Visits | Coordinates |\n";
  f << "|------|----------------|--------|--------|--------|-------------|\n";
  CheckWritten(f, primary_path_);
}

void MarkdownLogSink::init_legacy_log(WallSeconds start) {
  auto f = OpenOrThrow(legacy_path_, std::ios::out | std::ios::trunc);
  f << "# Feeder bird counter log\n\n";
  f << "**Started:** " << FormatLocalTime(start, "%Y-%m-%d %H:%M:%S") << "\n";
  f << kTotalLinePrefix << 0 << "\n\n";
  f << "## Frames with birds\n\n";
  f << "| Time | Birds on frame | Total unique | Detection coordinates |\n";
  f << "|------|----------------|--------------|-----------------------|\n";
  CheckWritten(f, legacy_path_);
}

void MarkdownLogSink::init_events_log(WallSeconds start) {
  auto f = OpenOrThrow(events_path_, std::ios::out | std::ios::trunc);
  f << "# Bird counter events\n\n";
  f << "**Started:** " << FormatLocalTime(start, "%Y-%m-%d %H:%M:%S") << "\n\n";
  f << "## Events\n\n";
  CheckWritten(f, events_path_);
}

// Header lists the settings that affect load on the device, to read next to the temperature curve
void MarkdownLogSink::init_temperature_log(WallSeconds start) {
  const auto& det = cfg_.detection;
  std::string classes;
  for (std::size_t i = 0; i < det.target_classes.size(); ++i) {
    if (i) classes += ", ";
    classes += det.target_classes[i];
  }
  const std::string model_name = cfg_.model.path.empty() ? "none" : fs::path(cfg_.model.path).filename().string();
  const double interval_s = cfg_.monitoring.temperature_log_interval_minutes * 60.0;

  auto f = OpenOrThrow(temperature_path_, std::ios::out | std::ios::trunc);
  f << "# CPU temperature and system parameters\n\n";
  f << "**Started:** " << FormatLocalTime(start, "%Y-%m-%d %H:%M:%S") << "\n";
  f << "**Logging interval:** every " << interval_s << " seconds\n\n";

  f << "## System parameters\n\n";
  f << "- **Model:** " << model_name << "\n";
  f << "- **Detection:** classes [" << classes << "], confidence " << det.min_confidence << "\n";
  f << "- **Console:** mode " << ConsoleOutputModeName(cfg_.logging.console_output_mode) << "\n";
  f << "- **Photo saving:** " << (cfg_.frame_saving.enable_photo_save ? "ON" : "OFF") << "\n";
  f << "- **Tracking:** timeout " << cfg_.tracking.bird_timeout_seconds << "s\n";
  f << "- **Visits:** min gap " << cfg_.tracking.min_time_between_visits_seconds << "s\n\n";

  f << "## CPU temperature\n\n";
  f << "| Time           | Temperature (C)     | FPS     |\n";
  f << "|----------------|---------------------|---------|\n";
  CheckWritten(f, temperature_path_);
}

void MarkdownLogSink::init_performance_log(WallSeconds start) {
  auto f = OpenOrThrow(performance_path_, std::ios::out | std::ios::trunc);
  f << "# Feeder watch performance debug log\n\n";
  f << "**Started:** " << FormatLocalTime(start, "%Y-%m-%d %H:%M:%S") << "\n\n";
  f << "## Performance\n\n";
  f << "| Time | FPS | CPU temp (C) | Frame delay (s) | Used memory (MB) | Comment |\n";
  f << "|------|-----|--------------|-----------------|------------------|---------|\n";
  CheckWritten(f, performance_path_);
}

std::string MarkdownLogSink::FormatCoords(const std::vector<Detection>& detections) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2);
  for (std::size_t i = 0; i < detections.size(); ++i) {
    if (i) oss << "; ";
    oss << detections[i].label << ": (" << detections[i].bbox.x << "," << detections[i].bbox.y << ")";
  }
  return oss.str();
}

void MarkdownLogSink::update_total_line(const fs::path& path, std::uint64_t total_unique) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("cannot read log file '" + path.string() + "'");

  std::vector<std::string> lines;
  std::string line;
  bool replaced = false;
  while (std::getline(in, line)) {
    if (!replaced && line.rfind(kTotalLinePrefix, 0) == 0) {
      line = kTotalLinePrefix + std::to_string(total_unique);
      replaced = true;
    }
    lines.push_back(std::move(line));
  }
  in.close();

  auto out = OpenOrThrow(path, std::ios::out | std::ios::trunc);
  for (const auto& l : lines) out << l << "\n";
  CheckWritten(out, path);
}

void MarkdownLogSink::write_record(const FrameRecord& record) {
  std::lock_guard<std::mutex> lock(mu_);

  if (record.total_unique != primary_total_written_) {
    update_total_line(primary_path_, record.total_unique);
    primary_total_written_ = record.total_unique;
  }

  const std::string time_str = FormatLocalTime(record.timestamp, "%H:%M:%S");
  const std::string coords = FormatCoords(record.detections);

  {
    auto f = OpenOrThrow(primary_path_, std::ios::out | std::ios::app);
    f << "| " << time_str << " | " << record.frame_count << " | " << record.active_count << " | "
      << record.total_unique << " | " << record.total_visits << " | " << coords << " |\n";
    CheckWritten(f, primary_path_);
  }

  // Legacy table only ever shows frames with birds
  if (record.detections.empty()) return;

  if (record.total_unique != legacy_total_written_) {
    update_total_line(legacy_path_, record.total_unique);
    legacy_total_written_ = record.total_unique;
  }

  auto f = OpenOrThrow(legacy_path_, std::ios::out | std::ios::app);
  f << "| " << time_str << " | " << record.frame_count << " | " << record.total_unique << " | " << coords << " |\n";
  CheckWritten(f, legacy_path_);
}

void MarkdownLogSink::write_event(const CounterEvent& event) {
  std::lock_guard<std::mutex> lock(mu_);

  auto f = OpenOrThrow(events_path_, std::ios::out | std::ios::app);
  f << "- **" << FormatLocalTime(event.timestamp, "%H:%M:%S") << "**: " << EventKindName(event.kind)
    << " #" << event.counter_value << "\n";
  CheckWritten(f, events_path_);
}

void MarkdownLogSink::write_temperature(const TemperatureSample& sample) {
  std::lock_guard<std::mutex> lock(mu_);
  if (temperature_path_.empty()) return;

  std::ostringstream temp;
  temp << std::fixed << std::setprecision(1) << sample.celsius;

  std::ostringstream fps;
  if (sample.fps > 0.0) {
    fps << std::fixed << std::setprecision(1) << sample.fps;
  } else {
    fps << "-";
  }

  auto f = OpenOrThrow(temperature_path_, std::ios::out | std::ios::app);
  f << "| " << std::left << std::setw(15) << FormatLocalTime(sample.timestamp, "%H:%M:%S")
    << "| " << std::setw(20) << temp.str()
    << "| " << std::setw(8) << fps.str() << "|\n";
  CheckWritten(f, temperature_path_);
}

void MarkdownLogSink::write_performance(const PerformanceSample& sample) {
  std::lock_guard<std::mutex> lock(mu_);
  if (performance_path_.empty()) return;

  auto opt = [](const std::optional<double>& v) {
    std::ostringstream oss;
    if (v) oss << std::fixed << std::setprecision(1) << *v;
    else oss << "-";
    return oss.str();
  };

  auto f = OpenOrThrow(performance_path_, std::ios::out | std::ios::app);
  f << std::fixed << "| " << FormatLocalTime(sample.timestamp, "%H:%M:%S")
    << " | " << std::setprecision(1) << sample.fps
    << " | " << opt(sample.cpu_celsius)
    << " | " << std::setprecision(3) << sample.frame_delay_seconds
    << " | " << opt(sample.used_memory_mb)
    << " | birds=" << sample.birds_on_frame << ", frame=" << sample.frame_index << " |\n";
  CheckWritten(f, performance_path_);
}

} // namespace fw
