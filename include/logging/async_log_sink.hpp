#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <variant>

#include "core/config.hpp"
#include "infra/bounded_queue.hpp"
#include "infra/stop_token.hpp"
#include "infra/thread_runner.hpp"
#include "logging/event_log_sink.hpp"

namespace fw {

/*
    AsyncLogSink moves file writes off the frame thread. Writes are queued in a BoundedQueue and
    replayed into the wrapped sink by one worker thread, so a slow SD card delays the log files,
    never the tracker. When the queue is full the configured drop policy applies and the drop is
    counted. Errors from the wrapped sink are reported on stderr and dropped.

    stop() closes the queue and waits for the worker to write out everything already queued.
*/
class AsyncLogSink final : public EventLogSink {
public:
  AsyncLogSink(std::shared_ptr<EventLogSink> inner, QueueConfig cfg);
  ~AsyncLogSink() override;

  AsyncLogSink(const AsyncLogSink&) = delete;
  AsyncLogSink& operator=(const AsyncLogSink&) = delete;

  void start(StopToken global_stop);
  void stop();

  void write_record(const FrameRecord& record) override;
  void write_event(const CounterEvent& event) override;
  void write_temperature(const TemperatureSample& sample) override;
  void write_performance(const PerformanceSample& sample) override;

  // Blocks until everything queued so far has been handed to the wrapped sink
  void flush() override;

  std::uint64_t dropped() const { return queue_.drops_total(); }
  std::uint64_t failures() const { return failures_.load(std::memory_order_relaxed); }
  std::uint64_t written() const { return written_.load(std::memory_order_relaxed); }

private:
  using Item = std::variant<FrameRecord, CounterEvent, TemperatureSample, PerformanceSample>;

  void run(const StopToken& global_stop, const std::atomic_bool& local_stop);
  void forward(const Item& item);

  std::shared_ptr<EventLogSink> inner_;
  BoundedQueue<Item> queue_;
  ThreadRunner runner_{"log_writer"};

  std::atomic<std::uint64_t> handled_{0};   // items popped and passed on (or failed)
  std::atomic<std::uint64_t> failures_{0};
  std::atomic<std::uint64_t> written_{0};
};

} // namespace fw
