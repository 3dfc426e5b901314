#include "session/session_logs.hpp"

#include <iostream>

namespace fw {

std::shared_ptr<EventLogSink> SessionLogs::sink() const {
  if (async) return async;
  return files;
}

SessionLogs OpenSessionLogs(const AppConfig& cfg, WallSeconds session_start, StopToken stop) {
  SessionLogs logs;
  if (!cfg.logging.enable_text_log) return logs;

  logs.files = std::make_shared<MarkdownLogSink>(cfg, session_start);
  std::cout << "Logging to " << logs.files->session_dir().string() << std::endl;

  if (cfg.logging.async_writes) {
    logs.async = std::make_shared<AsyncLogSink>(logs.files, cfg.logging.queue);
    logs.async->start(stop);
  }
  return logs;
}

void CloseSessionLogs(SessionLogs& logs) {
  if (!logs.async) return;

  logs.async->stop();
  if (logs.async->dropped() > 0 || logs.async->failures() > 0) {
    std::cerr << "[logs] " << logs.async->dropped() << " writes dropped, "
              << logs.async->failures() << " failed" << std::endl;
  }
}

} // namespace fw
