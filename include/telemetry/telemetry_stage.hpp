#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>

#include "core/config.hpp"
#include "logging/event_log_sink.hpp"
#include "stages/stage.hpp"

namespace fw {

/*
    Periodically samples the CPU temperature and the current processing rate and hands them to
    the log sink. The first sample is written as soon as the stage starts, then one per interval.
    A missing or unreadable thermal zone skips that sample, it never stops the stage.
*/
class TelemetryStage final : public Stage {
public:
  using FpsFn = std::function<double()>;

  TelemetryStage(MonitoringConfig cfg, std::shared_ptr<EventLogSink> sink, FpsFn fps);

  std::uint64_t samples_written() const { return written_.load(std::memory_order_relaxed); }
  std::uint64_t samples_skipped() const { return skipped_.load(std::memory_order_relaxed); }

  // One sample now. Returns false if the temperature could not be read or the sink threw
  bool sample_once();

protected:
  void run(const StopToken& global_stop,
           const std::atomic_bool& local_stop) override;

private:
  MonitoringConfig cfg_;
  std::shared_ptr<EventLogSink> sink_;
  FpsFn fps_;

  std::atomic<std::uint64_t> written_{0};
  std::atomic<std::uint64_t> skipped_{0};
  bool warned_{false};   // stage thread only
};

} // namespace fw
