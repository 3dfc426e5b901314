#include "detection/live_detection_source.hpp"

#include <chrono>
#include <utility>

namespace fw {

LiveDetectionSource::LiveDetectionSource(std::shared_ptr<BoundedQueue<Frame>> frames,
                                         std::shared_ptr<YoloDetector> detector,
                                         StopToken stop)
    : frames_(std::move(frames)), detector_(std::move(detector)), stop_(stop) {}

bool LiveDetectionSource::next(DetectionFrame& out) {
  using namespace std::chrono_literals;

  Frame f;
  for (;;) {
    if (stop_.stop_requested()) return false;
    if (frames_->try_pop_for(f, 100ms)) break;
    if (frames_->closed() && frames_->size() == 0) return false;
  }

  out.timestamp = f.capture_time;
  out.sequence_id = f.sequence_id;
  out.items = detector_->detect(f.image);

  std::lock_guard<std::mutex> lock(mu_);
  last_ = std::move(f);
  return true;
}

Frame LiveDetectionSource::last_frame() const {
  std::lock_guard<std::mutex> lock(mu_);
  return last_;
}

} // namespace fw
