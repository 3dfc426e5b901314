#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace fw {

// Wall-clock seconds since the Unix epoch. Frames arrive with non-decreasing values
using WallSeconds = double;

// Normalized bounding box, all values in [0, 1] relative to the frame size
struct BBox {
  float x{0.f};
  float y{0.f};
  float w{0.f};
  float h{0.f};

  float area() const { return w * h; }
};

// A singular Detection, one object seen in one frame. Not kept past the frame that produced it
struct Detection {
  std::string label;
  float confidence{0.f};
  BBox bbox;
};

// Everything the detector reported for one frame. Filtering to the target classes happens later
struct DetectionFrame {
  WallSeconds timestamp{0.0};
  std::uint64_t sequence_id{0};
  std::vector<Detection> items;
};

} // namespace fw
