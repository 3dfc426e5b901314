#pragma once

#include "core/detections.hpp"

namespace fw {

// Anything that yields one DetectionFrame per video frame: a live camera + model, or a replay file.
// Detections come out unfiltered; FrameProcessor applies the target-class/confidence/area filter.
class DetectionSource {
public:
  virtual ~DetectionSource() = default;

  // Fills 'out' with the next frame. Returns false when the source is exhausted or stopped
  virtual bool next(DetectionFrame& out) = 0;
};

} // namespace fw
