#pragma once

#include <cstdint>

#include <opencv2/core.hpp>

#include "core/detections.hpp"

/*
    One captured camera image
*/

namespace fw {

struct Frame {
  // Wall-clock time of capture, the same clock the tracker runs on
  WallSeconds capture_time{0.0};

  // Frame sequence number (monotonic)
  std::uint64_t sequence_id{0};

  // Image data (shared, ref-counted)
  cv::Mat image;
};

} // namespace fw
