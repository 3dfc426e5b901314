#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace fw {

enum class DropPolicy {
  DropOldest,
  DropNewest
};

// How chatty the console and the frame record table are. Never changes counting.
enum class ConsoleOutputMode {
  All,
  ChangesOnly,
  Minimal
};

struct QueueConfig {
  std::size_t capacity = 256;
  DropPolicy drop_policy = DropPolicy::DropOldest;
};

struct CameraConfig {
  int device_index = 0;

  int width = 1280;
  int height = 720;
  int fps = 30;

  bool flip_vertical = false;
  bool flip_horizontal = false;
};

struct ModelConfig {
  std::string path = "";
  int input_width = 640;
  int input_height = 640;
  float nms_threshold = 0.45f;
};

// Pre-filter applied before anything reaches the tracker. Box sizes are normalized areas (w*h)
struct DetectionConfig {
  std::vector<std::string> target_classes{"bird"};
  float min_confidence = 0.3f;
  float min_bbox_size = 0.f;
  float max_bbox_size = 1.f;
};

struct TrackingConfig {
  bool enable_tracking = true;
  double bird_timeout_seconds = 30.0;
  bool enable_visit_counter = true;
  double min_time_between_visits_seconds = 10.0;
};

struct LoggingConfig {
  bool enable_text_log = true;
  std::string logs_path = "logs";
  std::string log_filename_pattern = "bird_log_{timestamp}.md";
  ConsoleOutputMode console_output_mode = ConsoleOutputMode::Minimal;
  int stats_every_n_frames = 30;

  bool async_writes = true;
  QueueConfig queue{};
};

struct FrameSavingConfig {
  bool enable_photo_save = false;
  double min_save_interval_seconds = 5.0;
  std::string photo_filename_pattern = "bird_{timestamp}_{bird_count}.jpg";
};

struct MonitoringConfig {
  bool enable_temperature_logging = false;
  double temperature_log_interval_minutes = 5.0;
  std::string temperature_log_filename = "temperature_{timestamp}.md";
  std::string thermal_zone_path = "/sys/class/thermal/thermal_zone0/temp";
};

// Per-frame FPS/temperature/delay/memory table in add_logs/, for chasing slowdowns on the device
struct PerformanceDebugConfig {
  bool enable_performance_log = false;
  std::string performance_log_filename = "performance_debug_{timestamp}.md";
  std::string meminfo_path = "/proc/meminfo";
};

struct DisplayConfig {
  bool enabled = false;
  std::string window_name = "Feeder Watch";
};

struct AppConfig {
  CameraConfig camera{};
  ModelConfig model{};
  DetectionConfig detection{};
  TrackingConfig tracking{};
  LoggingConfig logging{};
  FrameSavingConfig frame_saving{};
  MonitoringConfig monitoring{};
  PerformanceDebugConfig performance{};
  DisplayConfig display{};
};

const char* ConsoleOutputModeName(ConsoleOutputMode mode);

}
