#pragma once

#include <atomic>
#include <cstdint>

#include "core/detections.hpp"

/*
  FrameRateMeter is written by the frame thread and read by the telemetry thread and the overlay.
  FPS is taken from the frame timestamps themselves (not the reader's clock), smoothed with a
  7/8 running average, so a replayed session reports its recorded rate.
*/

namespace fw {

class FrameRateMeter {
public:
  // Only the frame thread calls this
  void on_frame(WallSeconds ts) {
    const auto n = frames_.fetch_add(1, std::memory_order_relaxed) + 1;

    if (n > 1) {
      const double dt = ts - last_ts_;
      if (dt > 0.0) {
        const double inst = 1.0 / dt;
        const double prev = fps_.load(std::memory_order_relaxed);
        fps_.store((prev == 0.0) ? inst : (prev * 7.0 + inst) / 8.0, std::memory_order_relaxed);
      }
    }
    last_ts_ = ts;
  }

  std::uint64_t frames() const { return frames_.load(std::memory_order_relaxed); }
  double fps() const { return fps_.load(std::memory_order_relaxed); }

private:
  std::atomic<std::uint64_t> frames_{0};
  std::atomic<double> fps_{0.0};
  WallSeconds last_ts_{0.0};   // frame thread only
};

} // namespace fw
