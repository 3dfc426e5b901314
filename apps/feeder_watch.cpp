#include <iostream>

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <optional>

// Utilities
#include "core/config_loader.hpp"
#include "core/frame.hpp"
#include "core/wall_clock.hpp"

#include "infra/stop_token.hpp"
#include "infra/bounded_queue.hpp"

// Detection and tracking
#include "detection/labels/coco_labels.hpp"
#include "detection/live_detection_source.hpp"
#include "detection/yolo_detector.hpp"
#include "logging/console_reporter.hpp"
#include "session/frame_processor.hpp"
#include "session/session_logs.hpp"

// Outputs
#include "output/detection_overlay.hpp"
#include "output/photo_saver.hpp"
#include "stages/camera_stage.hpp"
#include "telemetry/telemetry_stage.hpp"
#include "telemetry/thermal_probe.hpp"

#include <opencv2/highgui.hpp>  // cv::namedWindow, cv::imshow, cv::waitKey

static fw::StopSource g_stop;

static void HandleSigint(int) {
  g_stop.request_stop();
}

// feeder_watch.cpp is the live system: camera -> detector -> tracker -> logs / photos / window.
// The frame path runs on the main thread; the camera, log writer and telemetry have their own.

int main(int argc, char** argv) {
  const std::string cfg_path = (argc > 1) ? argv[1] : "configs/feeder_watch.yaml";

  try {
    fw::AppConfig cfg = fw::LoadConfigFromYamlFile(cfg_path);
    std::cout << "Loaded config OK: " << cfg_path << "\n";

    for (const auto& c : cfg.detection.target_classes) {
      if (fw::CocoClassId(c) < 0) {
        std::cerr << "Warning: target class '" << c << "' is not a COCO label, it will never match\n";
      }
    }

    std::signal(SIGINT, HandleSigint);
    fw::PrintSessionBanner(std::cout, cfg);

    const fw::WallSeconds session_start = fw::NowSeconds();
    fw::SessionLogs logs = fw::OpenSessionLogs(cfg, session_start, g_stop.token());

    auto detector = std::make_shared<fw::YoloDetector>(fw::YoloDetector::ParamsFrom(cfg.model, cfg.detection));
    if (!detector->is_loaded()) {
      fw::CloseSessionLogs(logs);
      std::cerr << "Model failed to load: " << cfg.model.path << "\n";
      return 1;
    }

    // The detector is slower than the camera, keep only the newest frames
    auto camera_queue = std::make_shared<fw::BoundedQueue<fw::Frame>>(2, fw::DropPolicy::DropOldest);

    fw::CameraStage camera_stage(cfg.camera, camera_queue);
    fw::LiveDetectionSource source(camera_queue, detector, g_stop.token());
    fw::FrameProcessor processor(cfg, logs.sink());

    std::unique_ptr<fw::TelemetryStage> telemetry;
    if (cfg.monitoring.enable_temperature_logging && logs.sink()) {
      telemetry = std::make_unique<fw::TelemetryStage>(
          cfg.monitoring, logs.sink(), [&processor] { return processor.fps(); });
    }

    std::unique_ptr<fw::PhotoSaver> photos;
    if (cfg.frame_saving.enable_photo_save) {
      // Without text logs there is no session folder, photos go to a folder of their own
      const auto dir = logs.files ? logs.files->session_dir()
                                  : std::filesystem::path(cfg.logging.logs_path) /
                                        ("photos_" + fw::FormatLocalTime(session_start, "%Y-%m-%d_%H-%M-%S"));
      photos = std::make_unique<fw::PhotoSaver>(cfg.frame_saving, dir);
    }

    // Start consumers first
    if (telemetry) telemetry->start(g_stop.token());
    camera_stage.start(g_stop.token());

    // UI (must be on main thread on MacOS)
    fw::DetectionOverlay overlay;
    if (cfg.display.enabled) cv::namedWindow(cfg.display.window_name, cv::WINDOW_AUTOSIZE);

    fw::DetectionFrame df;
    while (!g_stop.stop_requested() && source.next(df)) {
      const fw::FrameOutcome outcome = processor.process(df);

      if (!photos && !cfg.display.enabled) continue;

      fw::Frame frame = source.last_frame();
      if (photos) photos->maybe_save(frame.image, outcome.timestamp, outcome.update.frame_count);

      if (cfg.display.enabled && !frame.image.empty()) {
        fw::OverlayInfo info;
        info.frame_index = processor.meter().frames();
        info.fps = processor.fps();
        info.counters = outcome.change.current;
        info.now = outcome.timestamp;
        if (cfg.monitoring.enable_temperature_logging) {
          info.temperature_c = fw::ReadCpuTemperature(cfg.monitoring.thermal_zone_path);
        }

        // Draw on a copy, the saved photos stay clean
        cv::Mat shown = frame.image.clone();
        overlay.draw(shown, outcome.accepted, info);
        cv::imshow(cfg.display.window_name, shown);

        const int key = cv::waitKey(1);
        if (key == 'q' || key == 27) {
          std::cout << "User exited. Shutting down..." << std::endl;
          g_stop.request_stop();
        }
      }
    }

    if (camera_stage.open_failed()) std::cerr << "Camera could not be opened, nothing was processed\n";
    std::cout << "\nShutting down..." << std::endl;
    g_stop.request_stop();

    if (cfg.display.enabled) cv::destroyWindow(cfg.display.window_name);

    // Stop producers first, then the writers
    camera_stage.stop();
    if (telemetry) telemetry->stop();
    if (camera_stage.failed()) std::cerr << "Camera stage ended on an error, see above\n";
    if (telemetry && telemetry->failed()) std::cerr << "Temperature logging ended on an error, see above\n";
    fw::CloseSessionLogs(logs);

    fw::PrintSessionSummary(std::cout, processor.snapshot(), processor.meter().frames(), processor.fps());
    if (photos) std::cout << "Photos saved: " << photos->saved() << "\n";

  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  return 0;
}
