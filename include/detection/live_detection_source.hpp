#pragma once

#include <memory>
#include <mutex>

#include "core/frame.hpp"
#include "detection/detection_source.hpp"
#include "detection/yolo_detector.hpp"
#include "infra/bounded_queue.hpp"
#include "infra/stop_token.hpp"

namespace fw {

// Pulls frames from the camera queue and runs the detector on each one, on the caller's thread.
// next() returns false once a stop is requested or the camera closed its queue.
class LiveDetectionSource final : public DetectionSource {
public:
  LiveDetectionSource(std::shared_ptr<BoundedQueue<Frame>> frames,
                      std::shared_ptr<YoloDetector> detector,
                      StopToken stop);

  bool next(DetectionFrame& out) override;

  // The image behind the last DetectionFrame returned by next(), empty before the first one
  Frame last_frame() const;

private:
  std::shared_ptr<BoundedQueue<Frame>> frames_;
  std::shared_ptr<YoloDetector> detector_;
  StopToken stop_;

  mutable std::mutex mu_;
  Frame last_;
};

} // namespace fw
