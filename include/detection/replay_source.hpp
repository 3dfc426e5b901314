#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "detection/detection_source.hpp"

/*
    ReplaySource plays back a recorded or hand-written detection script:

      start_time: 1718000000      # optional, added to every t (default 0)
      frames:
        - t: 0.0
          detections: []
        - t: 5.0
          detections:
            - {label: bird, confidence: 0.82, x: 0.41, y: 0.30, width: 0.12, height: 0.10}
        - t: 6.0
          count: 2                # shorthand: N generic "bird" detections

    Frames are returned in file order; timestamps are taken as written.
*/

namespace fw {

class ReplaySource final : public DetectionSource {
public:
  // Throws std::runtime_error on unreadable files or malformed entries
  static ReplaySource FromYamlFile(const std::string& path);
  static ReplaySource FromYamlString(const std::string& yaml);

  explicit ReplaySource(std::vector<DetectionFrame> frames);

  bool next(DetectionFrame& out) override;

  std::size_t size() const { return frames_.size(); }
  std::size_t remaining() const { return frames_.size() - pos_; }

private:
  std::vector<DetectionFrame> frames_;
  std::size_t pos_{0};
};

} // namespace fw
