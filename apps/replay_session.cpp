#include <iostream>

#include "core/config_loader.hpp"
#include "core/wall_clock.hpp"
#include "detection/replay_source.hpp"
#include "logging/console_reporter.hpp"
#include "session/frame_processor.hpp"
#include "session/session_logs.hpp"

// replay_session.cpp runs a recorded (or hand-written) detection script through the tracker
// and log files, no camera or model needed. Handy for tuning timeouts and visit gaps.

int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "usage: " << argv[0] << " <config.yaml> <script.yaml>\n";
    return 2;
  }
  const std::string cfg_path = argv[1];
  const std::string script_path = argv[2];

  try {
    fw::AppConfig cfg = fw::LoadConfigFromYamlFile(cfg_path);
    std::cout << "Loaded config OK: " << cfg_path << "\n";

    fw::ReplaySource source = fw::ReplaySource::FromYamlFile(script_path);
    std::cout << "Loaded replay script: " << script_path << " (" << source.size() << " frames)\n";

    fw::PrintSessionBanner(std::cout, cfg);

    fw::StopSource stop;
    fw::SessionLogs logs = fw::OpenSessionLogs(cfg, fw::NowSeconds(), stop.token());
    fw::FrameProcessor processor(cfg, logs.sink());

    fw::DetectionFrame frame;
    while (source.next(frame)) {
      processor.process(frame);
    }

    fw::CloseSessionLogs(logs);

    fw::PrintSessionSummary(std::cout, processor.snapshot(), processor.meter().frames(), processor.fps());
    if (processor.sink_failures() > 0) {
      std::cerr << processor.sink_failures() << " log writes failed\n";
    }

  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  return 0;
}
