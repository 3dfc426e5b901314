#pragma once
#include <atomic>
#include <chrono>
#include <thread>

/*
    StopSource is owned by the app (SIGINT handler flips it) and hands out read-only StopTokens.
    Every worker checks its token plus its own local flag from ThreadRunner, and exits when
    either is set.
*/

namespace fw {

class StopToken {
public:
  StopToken() = default;
  explicit StopToken(const std::atomic_bool* flag) : flag_(flag) {}

  bool stop_requested() const {
    return flag_ && flag_->load(std::memory_order_relaxed);
  }

private:
  const std::atomic_bool* flag_ = nullptr;
};

class StopSource {
public:
  StopSource() = default;

  StopToken token() const { return StopToken(&stop_); }

  void request_stop() { stop_.store(true, std::memory_order_relaxed); }

  bool stop_requested() const { return stop_.load(std::memory_order_relaxed); }

private:
  std::atomic_bool stop_{false};
};

// Sleeps for 'total' in small slices so long waits (telemetry intervals are minutes) still react to
// a stop quickly. Returns false if a stop was requested before the full time elapsed.
template <typename Rep, typename Period>
bool SleepUnlessStopped(const StopToken& global, const std::atomic_bool& local,
                        const std::chrono::duration<Rep, Period>& total,
                        std::chrono::milliseconds slice = std::chrono::milliseconds(50)) {
  const auto deadline = std::chrono::steady_clock::now() + total;
  while (std::chrono::steady_clock::now() < deadline) {
    if (global.stop_requested() || local.load(std::memory_order_relaxed)) return false;
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    std::this_thread::sleep_for(left < slice ? left : slice);
  }
  return !(global.stop_requested() || local.load(std::memory_order_relaxed));
}

} // namespace fw
