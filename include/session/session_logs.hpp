#pragma once

#include <memory>

#include "core/config.hpp"
#include "core/detections.hpp"
#include "infra/stop_token.hpp"
#include "logging/async_log_sink.hpp"
#include "logging/markdown_log_sink.hpp"

namespace fw {

/*
    The log sinks of one session as the apps wire them: the markdown files, optionally behind an
    async writer. All members are null when text logging is disabled.
*/
struct SessionLogs {
  std::shared_ptr<MarkdownLogSink> files;
  std::shared_ptr<AsyncLogSink> async;

  // What the frame processor and telemetry write to
  std::shared_ptr<EventLogSink> sink() const;
};

// Creates the session folder and starts the async writer. Throws std::runtime_error if the folder can't be made
SessionLogs OpenSessionLogs(const AppConfig& cfg, WallSeconds session_start, StopToken stop);

// Writes out whatever is still queued and stops the writer
void CloseSessionLogs(SessionLogs& logs);

} // namespace fw
