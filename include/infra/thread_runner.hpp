#pragma once
#include <atomic>
#include <functional>
#include <string>
#include <thread>

#include "infra/stop_token.hpp"

/*
    ThreadRunner owns one worker thread: the camera stage, the telemetry sampler, the log writer.
    It provides:
        - start/stop/join with the same behavior for every worker
        - a local_stop flag that stops this worker only
        - read-only access to the app-wide stop token (SIGINT, 'q' in the display window)
        - containment of exceptions thrown by the worker, so a failing log writer or sensor read
          ends that worker instead of the process
*/

namespace fw {

class ThreadRunner {
public:
  // Worker body
  // Any callable that takes the global stop token and the local stop flag, and returns nothing
  using Fn = std::function<void(const StopToken&, const std::atomic_bool&)>;

  // The name shows up in lifecycle lines and in "[name] worker stopped on error" messages
  ThreadRunner() = default;
  explicit ThreadRunner(std::string name);

  ThreadRunner(const ThreadRunner&) = delete;
  ThreadRunner& operator=(const ThreadRunner&) = delete;

  // Requests stop and joins
  ~ThreadRunner();

  // Start the worker. Throws std::runtime_error if it is already running
  // Clears the local stop flag and the failed state of a previous run
  void start(StopToken global_stop, Fn fn);

  // Stops this worker only, other workers and the global token are untouched
  void request_stop();
  // True if either the global or the local stop flag is set
  bool stop_requested() const;

  // No-op when not running
  void join();
  bool joinable() const;

  // The last run ended with an exception (already reported on stderr)
  bool failed() const { return failed_.load(std::memory_order_acquire); }

  const std::string& name() const { return name_; }

private:
  std::thread thread_;                    // The worker
  std::atomic_bool local_stop_{false};    // Stops this worker only
  std::atomic_bool failed_{false};        // Set by the worker before it exits on an exception
  StopToken global_stop_{};               // App-wide shutdown
  std::string name_{"thread"};            // Used in console lines
};

} // namespace fw
