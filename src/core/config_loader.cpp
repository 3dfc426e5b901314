#include "core/config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <sstream>
#include <stdexcept>

namespace fw {

const char* ConsoleOutputModeName(ConsoleOutputMode mode) {
  switch (mode) {
    case ConsoleOutputMode::All: return "all";
    case ConsoleOutputMode::ChangesOnly: return "changes_only";
    case ConsoleOutputMode::Minimal: return "minimal";
  }
  return "unknown";
}

static std::string PathJoin(const std::string& a, const std::string& b) {
  if (a.empty()) return b;
  return a + "." + b;
}

static std::runtime_error ConfigError(const std::string& key_path, const std::string& msg) {
  std::ostringstream oss;
  oss << "Config error at '" << key_path << "': " << msg;
  return std::runtime_error(oss.str());
}

static YAML::Node Child(const YAML::Node& parent, const char* key) {
  if (!parent || !parent.IsMap()) return YAML::Node();
  return parent[key];
}

template <typename T>
static T GetOrKey(const YAML::Node& parent, const char* key, const std::string& key_path, const T& fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  try {
    return n.as<T>();
  } catch (const YAML::Exception& e) {
    throw ConfigError(key_path, e.what());
  }
}

static DropPolicy ParseDropPolicyKey(const YAML::Node& parent, const char* key, const std::string& key_path, DropPolicy fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  const std::string s = GetOrKey<std::string>(parent, key, key_path, "");
  if (s == "drop_oldest") return DropPolicy::DropOldest;
  if (s == "drop_newest") return DropPolicy::DropNewest;
  throw ConfigError(key_path, "unknown drop_policy '" + s + "'. Use: drop_oldest | drop_newest");
}

static ConsoleOutputMode ParseConsoleModeKey(const YAML::Node& parent, const char* key, const std::string& key_path, ConsoleOutputMode fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  const std::string s = GetOrKey<std::string>(parent, key, key_path, "");
  if (s == "all") return ConsoleOutputMode::All;
  if (s == "changes_only") return ConsoleOutputMode::ChangesOnly;
  if (s == "minimal") return ConsoleOutputMode::Minimal;
  throw ConfigError(key_path, "unknown console_output_mode '" + s + "'. Use: all | changes_only | minimal");
}

// Accepts either a YAML list or a single scalar ("bird")
static std::vector<std::string> GetStringList(const YAML::Node& parent, const char* key, const std::string& key_path, const std::vector<std::string>& fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  try {
    if (n.IsScalar()) return {n.as<std::string>()};
    return n.as<std::vector<std::string>>();
  } catch (const YAML::Exception& e) {
    throw ConfigError(key_path, e.what());
  }
}

static void LoadQueueConfig(const YAML::Node& qnode, const std::string& key_path, QueueConfig& out) {
  if (!qnode) return;
  out.capacity = GetOrKey<std::size_t>(qnode, "capacity", PathJoin(key_path, "capacity"), out.capacity);
  out.drop_policy = ParseDropPolicyKey(qnode, "drop_policy", PathJoin(key_path, "drop_policy"), out.drop_policy);
}

static void LoadCamera(const YAML::Node& root, CameraConfig& cfg) {
  const YAML::Node cam = root["camera"];
  if (!cam) return;
  const std::string p = "camera";

  cfg.device_index = GetOrKey<int>(cam, "device_index", PathJoin(p, "device_index"), cfg.device_index);
  cfg.width = GetOrKey<int>(cam, "width", PathJoin(p, "width"), cfg.width);
  cfg.height = GetOrKey<int>(cam, "height", PathJoin(p, "height"), cfg.height);
  cfg.fps = GetOrKey<int>(cam, "fps", PathJoin(p, "fps"), cfg.fps);
  cfg.flip_vertical = GetOrKey<bool>(cam, "flip_vertical", PathJoin(p, "flip_vertical"), cfg.flip_vertical);
  cfg.flip_horizontal = GetOrKey<bool>(cam, "flip_horizontal", PathJoin(p, "flip_horizontal"), cfg.flip_horizontal);
}

static void LoadModel(const YAML::Node& root, ModelConfig& cfg) {
  const YAML::Node model = root["model"];
  if (!model) return;
  const std::string p = "model";

  cfg.path = GetOrKey<std::string>(model, "path", PathJoin(p, "path"), cfg.path);
  cfg.input_width = GetOrKey<int>(model, "input_width", PathJoin(p, "input_width"), cfg.input_width);
  cfg.input_height = GetOrKey<int>(model, "input_height", PathJoin(p, "input_height"), cfg.input_height);
  cfg.nms_threshold = GetOrKey<float>(model, "nms_threshold", PathJoin(p, "nms_threshold"), cfg.nms_threshold);
}

static void LoadDetection(const YAML::Node& root, DetectionConfig& cfg) {
  const YAML::Node det = root["detection"];
  if (!det) return;
  const std::string p = "detection";

  cfg.target_classes = GetStringList(det, "target_classes", PathJoin(p, "target_classes"), cfg.target_classes);
  cfg.min_confidence = GetOrKey<float>(det, "min_confidence", PathJoin(p, "min_confidence"), cfg.min_confidence);
  cfg.min_bbox_size = GetOrKey<float>(det, "min_bbox_size", PathJoin(p, "min_bbox_size"), cfg.min_bbox_size);
  cfg.max_bbox_size = GetOrKey<float>(det, "max_bbox_size", PathJoin(p, "max_bbox_size"), cfg.max_bbox_size);
}

static void LoadTracking(const YAML::Node& root, TrackingConfig& cfg) {
  const YAML::Node tr = root["tracking"];
  if (!tr) return;
  const std::string p = "tracking";

  cfg.enable_tracking = GetOrKey<bool>(tr, "enable_tracking", PathJoin(p, "enable_tracking"), cfg.enable_tracking);
  cfg.bird_timeout_seconds = GetOrKey<double>(tr, "bird_timeout_seconds", PathJoin(p, "bird_timeout_seconds"), cfg.bird_timeout_seconds);
  cfg.enable_visit_counter = GetOrKey<bool>(tr, "enable_visit_counter", PathJoin(p, "enable_visit_counter"), cfg.enable_visit_counter);
  cfg.min_time_between_visits_seconds = GetOrKey<double>(tr, "min_time_between_visits_seconds", PathJoin(p, "min_time_between_visits_seconds"), cfg.min_time_between_visits_seconds);
}

static void LoadLogging(const YAML::Node& root, LoggingConfig& cfg) {
  const YAML::Node lg = root["logging"];
  if (!lg) return;
  const std::string p = "logging";

  cfg.enable_text_log = GetOrKey<bool>(lg, "enable_text_log", PathJoin(p, "enable_text_log"), cfg.enable_text_log);
  cfg.logs_path = GetOrKey<std::string>(lg, "logs_path", PathJoin(p, "logs_path"), cfg.logs_path);
  cfg.log_filename_pattern = GetOrKey<std::string>(lg, "log_filename_pattern", PathJoin(p, "log_filename_pattern"), cfg.log_filename_pattern);
  cfg.console_output_mode = ParseConsoleModeKey(lg, "console_output_mode", PathJoin(p, "console_output_mode"), cfg.console_output_mode);
  cfg.stats_every_n_frames = GetOrKey<int>(lg, "stats_every_n_frames", PathJoin(p, "stats_every_n_frames"), cfg.stats_every_n_frames);
  cfg.async_writes = GetOrKey<bool>(lg, "async_writes", PathJoin(p, "async_writes"), cfg.async_writes);

  LoadQueueConfig(lg["queue"], PathJoin(p, "queue"), cfg.queue);
}

static void LoadFrameSaving(const YAML::Node& root, FrameSavingConfig& cfg) {
  const YAML::Node fs = root["frame_saving"];
  if (!fs) return;
  const std::string p = "frame_saving";

  cfg.enable_photo_save = GetOrKey<bool>(fs, "enable_photo_save", PathJoin(p, "enable_photo_save"), cfg.enable_photo_save);
  cfg.min_save_interval_seconds = GetOrKey<double>(fs, "min_save_interval_seconds", PathJoin(p, "min_save_interval_seconds"), cfg.min_save_interval_seconds);
  cfg.photo_filename_pattern = GetOrKey<std::string>(fs, "photo_filename_pattern", PathJoin(p, "photo_filename_pattern"), cfg.photo_filename_pattern);
}

static void LoadMonitoring(const YAML::Node& root, MonitoringConfig& cfg) {
  const YAML::Node m = root["system_monitoring"];
  if (!m) return;
  const std::string p = "system_monitoring";

  cfg.enable_temperature_logging = GetOrKey<bool>(m, "enable_temperature_logging", PathJoin(p, "enable_temperature_logging"), cfg.enable_temperature_logging);
  cfg.temperature_log_interval_minutes = GetOrKey<double>(m, "temperature_log_interval_minutes", PathJoin(p, "temperature_log_interval_minutes"), cfg.temperature_log_interval_minutes);
  cfg.temperature_log_filename = GetOrKey<std::string>(m, "temperature_log_filename", PathJoin(p, "temperature_log_filename"), cfg.temperature_log_filename);
  cfg.thermal_zone_path = GetOrKey<std::string>(m, "thermal_zone_path", PathJoin(p, "thermal_zone_path"), cfg.thermal_zone_path);
}

static void LoadPerformanceDebug(const YAML::Node& root, PerformanceDebugConfig& cfg) {
  const YAML::Node pd = root["performance_debug"];
  if (!pd) return;
  const std::string p = "performance_debug";

  cfg.enable_performance_log = GetOrKey<bool>(pd, "enable_performance_log", PathJoin(p, "enable_performance_log"), cfg.enable_performance_log);
  cfg.performance_log_filename = GetOrKey<std::string>(pd, "performance_log_filename", PathJoin(p, "performance_log_filename"), cfg.performance_log_filename);
  cfg.meminfo_path = GetOrKey<std::string>(pd, "meminfo_path", PathJoin(p, "meminfo_path"), cfg.meminfo_path);
}

static void LoadDisplay(const YAML::Node& root, DisplayConfig& cfg) {
  const YAML::Node d = root["display"];
  if (!d) return;
  const std::string p = "display";

  cfg.enabled = GetOrKey<bool>(d, "enabled", PathJoin(p, "enabled"), cfg.enabled);
  cfg.window_name = GetOrKey<std::string>(d, "window_name", PathJoin(p, "window_name"), cfg.window_name);
}

void ValidateOrThrow(const AppConfig& cfg) {
  if (cfg.camera.width <= 0 || cfg.camera.height <= 0) throw ConfigError("camera", "width/height must be > 0");
  if (cfg.camera.fps <= 0) throw ConfigError("camera.fps", "must be > 0");

  if (cfg.model.input_width <= 0 || cfg.model.input_height <= 0)
    throw ConfigError("model", "input_width/input_height must be > 0");
  if (cfg.model.nms_threshold < 0.f || cfg.model.nms_threshold > 1.f)
    throw ConfigError("model.nms_threshold", "must be in [0, 1]");

  if (cfg.detection.target_classes.empty())
    throw ConfigError("detection.target_classes", "must list at least one class");
  if (cfg.detection.min_confidence < 0.f || cfg.detection.min_confidence > 1.f)
    throw ConfigError("detection.min_confidence", "must be in [0, 1]");
  if (cfg.detection.min_bbox_size < 0.f || cfg.detection.max_bbox_size > 1.f)
    throw ConfigError("detection", "min_bbox_size/max_bbox_size must be in [0, 1]");
  if (cfg.detection.min_bbox_size > cfg.detection.max_bbox_size)
    throw ConfigError("detection.min_bbox_size", "must be <= max_bbox_size");

  if (cfg.tracking.bird_timeout_seconds <= 0.0)
    throw ConfigError("tracking.bird_timeout_seconds", "must be > 0");
  if (cfg.tracking.min_time_between_visits_seconds < 0.0)
    throw ConfigError("tracking.min_time_between_visits_seconds", "must be >= 0");

  if (cfg.logging.enable_text_log) {
    if (cfg.logging.logs_path.empty()) throw ConfigError("logging.logs_path", "required when logging.enable_text_log=true");
    if (cfg.logging.log_filename_pattern.empty()) throw ConfigError("logging.log_filename_pattern", "must not be empty");
  }
  if (cfg.logging.stats_every_n_frames <= 0) throw ConfigError("logging.stats_every_n_frames", "must be > 0");
  if (cfg.logging.queue.capacity < 1) throw ConfigError("logging.queue.capacity", "must be >= 1");

  if (cfg.frame_saving.enable_photo_save) {
    if (cfg.frame_saving.min_save_interval_seconds < 0.0)
      throw ConfigError("frame_saving.min_save_interval_seconds", "must be >= 0");
    if (cfg.frame_saving.photo_filename_pattern.empty())
      throw ConfigError("frame_saving.photo_filename_pattern", "must not be empty");
  }

  if (cfg.monitoring.enable_temperature_logging) {
    if (cfg.monitoring.temperature_log_interval_minutes <= 0.0)
      throw ConfigError("system_monitoring.temperature_log_interval_minutes", "must be > 0 when temperature logging enabled");
    if (!cfg.logging.enable_text_log)
      throw ConfigError("system_monitoring.enable_temperature_logging", "requires logging.enable_text_log=true");
  }

  if (cfg.performance.enable_performance_log) {
    if (cfg.performance.performance_log_filename.empty())
      throw ConfigError("performance_debug.performance_log_filename", "must not be empty");
    if (!cfg.logging.enable_text_log)
      throw ConfigError("performance_debug.enable_performance_log", "requires logging.enable_text_log=true");
  }
}

// An empty document means all defaults
static AppConfig LoadFromRoot(const YAML::Node& root) {
  AppConfig cfg;
  if (root && !root.IsNull() && !root.IsMap()) throw ConfigError("<root>", "top level must be a map of sections");

  LoadCamera(root, cfg.camera);
  LoadModel(root, cfg.model);
  LoadDetection(root, cfg.detection);
  LoadTracking(root, cfg.tracking);
  LoadLogging(root, cfg.logging);
  LoadFrameSaving(root, cfg.frame_saving);
  LoadMonitoring(root, cfg.monitoring);
  LoadPerformanceDebug(root, cfg.performance);
  LoadDisplay(root, cfg.display);

  ValidateOrThrow(cfg);
  return cfg;
}

AppConfig LoadConfigFromYamlFile(const std::string& path) {
  YAML::Node root;

  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to load YAML file '") + path + "': " + e.what());
  }

  return LoadFromRoot(root);
}

AppConfig LoadConfigFromYamlString(const std::string& yaml) {
  YAML::Node root;

  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse YAML: ") + e.what());
  }

  return LoadFromRoot(root);
}

} // namespace fw
