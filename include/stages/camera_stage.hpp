#pragma once

#include <cstdint>
#include <memory>

#include "core/config.hpp"
#include "core/frame.hpp"
#include "infra/bounded_queue.hpp"
#include "stages/stage.hpp"

namespace fw {

// Grabs frames from a V4L2 / USB camera and pushes them into a bounded queue. A full queue drops
// frames per its policy, the camera is never blocked.
class CameraStage final : public Stage {
public:
  CameraStage(CameraConfig cfg, std::shared_ptr<BoundedQueue<Frame>> out);

  std::uint64_t frames_captured() const { return next_id_.load(std::memory_order_relaxed); }
  bool open_failed() const { return open_failed_.load(std::memory_order_relaxed); }

protected:
  void run(const StopToken& global_stop,
           const std::atomic_bool& local_stop) override;

private:
  CameraConfig cfg_;
  std::shared_ptr<BoundedQueue<Frame>> out_;
  std::atomic<std::uint64_t> next_id_{0};
  std::atomic_bool open_failed_{false};
};

} // namespace fw
